#include <glint/opengl/gl_id_pass.h>
#include <glint/opengl/gl_scene_buffer.h>
#include <glint/core/log.h>

#include <glad/glad.h>

namespace glint
{

static const char* SDF_COMMON_PATH = "shaders/opengl/sdf_common.glsl";
static const char* ID_PICK_PATH    = "shaders/opengl/id_pick.comp";

GLIdPass::GLIdPass(GLSceneBuffer& sceneBuffer)
    : m_sceneBuffer(sceneBuffer)
{
}

GLIdPass::~GLIdPass() = default;

bool GLIdPass::init()
{
    FramebufferSpec spec;
    spec.width = 1;
    spec.height = 1;
    spec.format = ColorFormat::RGBA8;
    m_target = std::make_unique<GLFramebuffer>(spec);
    m_width = 1;
    m_height = 1;

    if (m_program.load({ SDF_COMMON_PATH, ID_PICK_PATH }))
        m_locMarch.cache(m_program);

    return true;
}

bool GLIdPass::reloadShader()
{
    if (!m_program.reload())
        return false;

    m_locMarch.cache(m_program);
    return true;
}

void GLIdPass::resize(uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0 || (m_width == width && m_height == height))
        return;

    m_width = width;
    m_height = height;
    m_target->resize(width, height);
}

bool GLIdPass::render(const SceneStore& store, const Camera& camera)
{
    if (!m_program.isValid() || !m_target)
        return false;

    m_sceneBuffer.sync(store);

    glUseProgram(m_program.getId());
    glBindImageTexture(0, static_cast<GLuint>(m_target->getColorAttachmentHandle()),
                       0, GL_FALSE, 0, GL_WRITE_ONLY, m_target->getImageFormat());
    m_sceneBuffer.bind(0);

    m_locMarch.apply(camera, m_width, m_height, m_march, m_propagation);
    dispatchImage(m_width, m_height);

    // readPixel goes through the framebuffer, so writes must be visible to it
    glMemoryBarrier(GL_FRAMEBUFFER_BARRIER_BIT | GL_PIXEL_BUFFER_BARRIER_BIT);
    glUseProgram(0);
    return true;
}

uint8_t GLIdPass::readPixel(uint32_t x, uint32_t y) const
{
    int value = m_target->readPixel(static_cast<int>(x), static_cast<int>(y));
    if (value < 0)
    {
        Log::warn("ID readback outside the target");
        return 0;
    }
    return static_cast<uint8_t>(value);
}

} // namespace glint
