#pragma once

#include <glint/opengl/gl_compute_program.h>
#include <glint/opengl/gl_framebuffer.h>
#include <glint/opengl/gl_march_uniforms.h>
#include <glint/raymarch/surface_shader.h>

#include <cstdint>
#include <memory>
#include <string>

namespace glint
{

class Camera;
class GLSceneBuffer;
class SceneStore;

// Shaded frame computed by raymarch.comp into an RGBA32F framebuffer
class GLGPURaymarcher
{
public:
    bool init(GLSceneBuffer& sceneBuffer);
    void shutdown();

    void resize(uint32_t w, uint32_t h);
    bool render(const SceneStore& store, const Camera& camera);

    // Rebuild from disk. A failure leaves the pass disabled rather than running the old program.
    bool reloadShader();
    bool isReady() const { return m_program.isValid(); }
    const std::string& lastError() const { return m_program.lastError(); }

    void setMarchSettings(const MarchSettings& settings) { m_march = settings; }
    void setShadingSettings(const ShadingSettings& settings) { m_shading = settings; }
    void setSmoothPropagation(SmoothPropagation propagation) { m_propagation = propagation; }

    GLFramebuffer* getOutput() const { return m_output.get(); }
    uint32_t getWidth() const { return m_width; }
    uint32_t getHeight() const { return m_height; }

private:
    void cacheUniformLocations();

    GLComputeProgram m_program;
    GLSceneBuffer* m_sceneBuffer = nullptr;
    std::unique_ptr<GLFramebuffer> m_output;
    uint32_t m_width = 0;
    uint32_t m_height = 0;

    MarchSettings m_march;
    ShadingSettings m_shading;
    SmoothPropagation m_propagation = SmoothPropagation::PreviousTerm;

    // Cached uniform locations
    GLMarchUniforms m_locMarch;
    int32_t m_locLightPos = -1;
    int32_t m_locAmbient = -1;
    int32_t m_locShadowFactor = -1;
    int32_t m_locShadowOffset = -1;
    int32_t m_locFogDensity = -1;
    int32_t m_locGamma = -1;
    int32_t m_locShadows = -1;
    int32_t m_locShadowSteps = -1;
    int32_t m_locSkyTop = -1;
    int32_t m_locSkyBottom = -1;
};

} // namespace glint
