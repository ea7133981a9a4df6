#pragma once

#include <glint/opengl/gl_compute_program.h>
#include <glint/opengl/gl_framebuffer.h>
#include <glint/opengl/gl_march_uniforms.h>
#include <glint/picking/id_pass.h>

#include <memory>

namespace glint
{

class GLSceneBuffer;

// id_pick.comp into an RGBA8 target, read back one texel per pick
class GLIdPass : public IdPass
{
public:
    explicit GLIdPass(GLSceneBuffer& sceneBuffer);
    ~GLIdPass() override;

    bool init();
    bool reloadShader();

    void resize(uint32_t width, uint32_t height) override;
    bool render(const SceneStore& store, const Camera& camera) override;
    uint8_t readPixel(uint32_t x, uint32_t y) const override;

    uint32_t getWidth() const override { return m_width; }
    uint32_t getHeight() const override { return m_height; }
    const std::string& lastError() const override { return m_program.lastError(); }

    void setSmoothPropagation(SmoothPropagation propagation) { m_propagation = propagation; }
    void setMarchSettings(const MarchSettings& settings) { m_march = settings; }

    GLFramebuffer* getTarget() const { return m_target.get(); }

private:
    GLSceneBuffer& m_sceneBuffer;
    GLComputeProgram m_program;
    GLMarchUniforms m_locMarch;
    std::unique_ptr<GLFramebuffer> m_target;
    uint32_t m_width = 0;
    uint32_t m_height = 0;

    MarchSettings m_march = MarchSettings::picking();
    SmoothPropagation m_propagation = SmoothPropagation::PreviousTerm;
};

} // namespace glint
