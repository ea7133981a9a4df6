#pragma once

#include <glint/raymarch/distance_field.h>
#include <glint/raymarch/ray_marcher.h>
#include <glint/raymarch/surface_shader.h>

#include <cstdint>
#include <functional>
#include <vector>

namespace glint
{

class Camera;
class SceneStore;

// Splits [0, height) into contiguous row ranges, one per hardware thread, and
// blocks until every range is done.
void parallelRows(uint32_t height, const std::function<void(uint32_t, uint32_t)>& traceRows);

// Full-frame shaded render on the CPU into a top-down RGBA8 buffer
class CPURaymarcher
{
public:
    void resize(uint32_t width, uint32_t height);
    void render(const SceneStore& store, const Camera& camera);

    const std::vector<uint8_t>& getPixelBuffer() const { return m_pixelBuffer; }
    uint32_t getWidth()  const { return m_width; }
    uint32_t getHeight() const { return m_height; }

    // Average march steps per pixel of the last frame
    float getAverageSteps() const { return m_averageSteps; }
    float getLastRenderMs() const { return m_lastRenderMs; }

    void setMarchSettings(const MarchSettings& settings) { m_march = settings; }
    const MarchSettings& getMarchSettings() const { return m_march; }

    void setShadingSettings(const ShadingSettings& settings) { m_shading = settings; }
    const ShadingSettings& getShadingSettings() const { return m_shading; }

    void setSmoothPropagation(SmoothPropagation propagation) { m_propagation = propagation; }
    SmoothPropagation getSmoothPropagation() const { return m_propagation; }

private:
    uint32_t m_width = 0, m_height = 0;
    std::vector<uint8_t> m_pixelBuffer;
    std::vector<uint32_t> m_stepCounts;

    MarchSettings m_march;
    ShadingSettings m_shading;
    SmoothPropagation m_propagation = SmoothPropagation::PreviousTerm;

    float m_averageSteps = 0.0f;
    float m_lastRenderMs = 0.0f;
};

} // namespace glint
