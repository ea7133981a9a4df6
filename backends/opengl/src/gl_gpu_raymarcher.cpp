#include <glint/opengl/gl_gpu_raymarcher.h>
#include <glint/opengl/gl_scene_buffer.h>
#include <glint/core/log.h>
#include <glint/scene/scene_store.h>

#include <glad/glad.h>
#include <glm/gtc/type_ptr.hpp>

namespace glint
{

static const char* SDF_COMMON_PATH = "shaders/opengl/sdf_common.glsl";
static const char* RAYMARCH_PATH   = "shaders/opengl/raymarch.comp";

bool GLGPURaymarcher::init(GLSceneBuffer& sceneBuffer)
{
    m_sceneBuffer = &sceneBuffer;

    FramebufferSpec spec;
    spec.width = 1;
    spec.height = 1;
    spec.format = ColorFormat::RGBA32F;
    m_output = std::make_unique<GLFramebuffer>(spec);
    m_width = 1;
    m_height = 1;

    // A missing or broken shader is reported in the viewport, not fatal
    if (m_program.load({ SDF_COMMON_PATH, RAYMARCH_PATH }))
        cacheUniformLocations();

    Log::info("GPU raymarcher initialized");
    return true;
}

void GLGPURaymarcher::shutdown()
{
    m_program.release();
    m_output.reset();
    m_sceneBuffer = nullptr;
}

void GLGPURaymarcher::cacheUniformLocations()
{
    auto loc = [this](const char* name) { return m_program.uniformLocation(name); };

    m_locMarch.cache(m_program);
    m_locLightPos     = loc("u_lightPos");
    m_locAmbient      = loc("u_ambient");
    m_locShadowFactor = loc("u_shadowFactor");
    m_locShadowOffset = loc("u_shadowOffset");
    m_locFogDensity   = loc("u_fogDensity");
    m_locGamma        = loc("u_gamma");
    m_locShadows      = loc("u_shadows");
    m_locShadowSteps  = loc("u_shadowSteps");
    m_locSkyTop       = loc("u_skyTop");
    m_locSkyBottom    = loc("u_skyBottom");
}

bool GLGPURaymarcher::reloadShader()
{
    if (!m_program.reload())
    {
        if (m_output)
            m_output->clear(0.0f, 0.0f, 0.0f, 1.0f);
        Log::error("GPU raymarcher disabled until the shader builds");
        return false;
    }

    cacheUniformLocations();
    Log::info("GPU raymarch shader reloaded");
    return true;
}

void GLGPURaymarcher::resize(uint32_t w, uint32_t h)
{
    if (w == 0 || h == 0 || (m_width == w && m_height == h))
        return;

    m_width = w;
    m_height = h;
    m_output->resize(w, h);
}

bool GLGPURaymarcher::render(const SceneStore& store, const Camera& camera)
{
    if (!m_program.isValid() || !m_output || !m_sceneBuffer)
        return false;

    m_sceneBuffer->sync(store);

    glUseProgram(m_program.getId());

    glBindImageTexture(0, static_cast<GLuint>(m_output->getColorAttachmentHandle()),
                       0, GL_FALSE, 0, GL_WRITE_ONLY, m_output->getImageFormat());
    m_sceneBuffer->bind(0);

    m_locMarch.apply(camera, m_width, m_height, m_march, m_propagation);

    glUniform3fv(m_locLightPos, 1, glm::value_ptr(m_shading.lightPosition));
    glUniform1f(m_locAmbient, m_shading.ambient);
    glUniform1f(m_locShadowFactor, m_shading.shadowFactor);
    glUniform1f(m_locShadowOffset, m_shading.shadowOffset);
    glUniform1f(m_locFogDensity, m_shading.fogDensity);
    glUniform1f(m_locGamma, m_shading.gamma);
    glUniform1i(m_locShadows, m_shading.shadows ? 1 : 0);
    glUniform1i(m_locShadowSteps, m_shading.shadowSteps);
    glUniform3fv(m_locSkyTop, 1, glm::value_ptr(m_shading.skyTop));
    glUniform3fv(m_locSkyBottom, 1, glm::value_ptr(m_shading.skyBottom));

    dispatchImage(m_width, m_height);

    // ImGui samples the image next, screenshots read it back
    glMemoryBarrier(GL_SHADER_IMAGE_ACCESS_BARRIER_BIT | GL_TEXTURE_FETCH_BARRIER_BIT |
                    GL_FRAMEBUFFER_BARRIER_BIT);

    glUseProgram(0);
    return true;
}

} // namespace glint
