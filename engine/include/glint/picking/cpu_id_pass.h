#pragma once

#include <glint/picking/id_pass.h>
#include <glint/raymarch/distance_field.h>
#include <glint/raymarch/ray_marcher.h>

#include <vector>

namespace glint
{

class CPUIdPass : public IdPass
{
public:
    void resize(uint32_t width, uint32_t height) override;
    bool render(const SceneStore& store, const Camera& camera) override;
    uint8_t readPixel(uint32_t x, uint32_t y) const override;

    uint32_t getWidth() const override { return m_width; }
    uint32_t getHeight() const override { return m_height; }
    const std::string& lastError() const override { return m_lastError; }

    // Must match the shading pass so clicks resolve to what is drawn
    void setSmoothPropagation(SmoothPropagation propagation) { m_propagation = propagation; }
    void setMarchSettings(const MarchSettings& settings) { m_march = settings; }

    const std::vector<uint8_t>& getBuffer() const { return m_buffer; }

private:
    uint32_t m_width = 0, m_height = 0;
    std::vector<uint8_t> m_buffer;
    std::string m_lastError;
    MarchSettings m_march = MarchSettings::picking();
    SmoothPropagation m_propagation = SmoothPropagation::PreviousTerm;
};

} // namespace glint
