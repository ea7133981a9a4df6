#include <glint/opengl/gl_framebuffer.h>
#include <glint/core/log.h>

#include <glad/glad.h>

#include <algorithm>
#include <vector>

namespace glint
{

GLFramebuffer::GLFramebuffer(const FramebufferSpec& spec)
    : m_spec(spec)
{
    create();
}

GLFramebuffer::~GLFramebuffer()
{
    destroy();
}

uint32_t GLFramebuffer::getImageFormat() const
{
    return m_spec.format == ColorFormat::RGBA8 ? GL_RGBA8 : GL_RGBA32F;
}

void GLFramebuffer::create()
{
    glGenFramebuffers(1, &m_fbo);
    glBindFramebuffer(GL_FRAMEBUFFER, m_fbo);

    // Immutable storage so the texture can be bound with glBindImageTexture
    glGenTextures(1, &m_colorAttachment);
    glBindTexture(GL_TEXTURE_2D, m_colorAttachment);
    glTexStorage2D(GL_TEXTURE_2D, 1, getImageFormat(),
                   static_cast<GLsizei>(m_spec.width),
                   static_cast<GLsizei>(m_spec.height));

    // IDs must never be filtered between neighbours
    GLint filter = m_spec.format == ColorFormat::RGBA8 ? GL_NEAREST : GL_LINEAR;
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_colorAttachment, 0);

    GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    if (status != GL_FRAMEBUFFER_COMPLETE)
        Log::error("Framebuffer incomplete (status " + std::to_string(status) + ")");

    glBindTexture(GL_TEXTURE_2D, 0);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void GLFramebuffer::destroy()
{
    if (m_fbo)
    {
        glDeleteFramebuffers(1, &m_fbo);
        m_fbo = 0;
    }
    if (m_colorAttachment)
    {
        glDeleteTextures(1, &m_colorAttachment);
        m_colorAttachment = 0;
    }
}

void GLFramebuffer::bind()
{
    glBindFramebuffer(GL_FRAMEBUFFER, m_fbo);
    glViewport(0, 0,
               static_cast<GLsizei>(m_spec.width),
               static_cast<GLsizei>(m_spec.height));
}

void GLFramebuffer::unbind()
{
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void GLFramebuffer::clear(float r, float g, float b, float a)
{
    float value[4] = { r, g, b, a };
    glClearTexImage(m_colorAttachment, 0, GL_RGBA, GL_FLOAT, value);
}

int GLFramebuffer::readPixel(int x, int y) const
{
    int w = static_cast<int>(m_spec.width);
    int h = static_cast<int>(m_spec.height);
    if (x < 0 || y < 0 || x >= w || y >= h)
        return -1;

    // Blocks until every queued write to the attachment has finished
    int readY = h - 1 - y;
    unsigned char pixel[4] = {};
    glBindFramebuffer(GL_READ_FRAMEBUFFER, m_fbo);
    glReadBuffer(GL_COLOR_ATTACHMENT0);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(x, readY, 1, 1, GL_RGBA, GL_UNSIGNED_BYTE, pixel);
    glBindFramebuffer(GL_READ_FRAMEBUFFER, 0);
    return static_cast<int>(pixel[0]);
}

std::vector<uint8_t> GLFramebuffer::readPixels() const
{
    uint32_t w = m_spec.width;
    uint32_t h = m_spec.height;
    size_t rowBytes = static_cast<size_t>(w) * 4;
    std::vector<uint8_t> raw(rowBytes * h);
    std::vector<uint8_t> pixels(rowBytes * h);

    glBindFramebuffer(GL_READ_FRAMEBUFFER, m_fbo);
    glReadBuffer(GL_COLOR_ATTACHMENT0);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(0, 0, static_cast<GLsizei>(w), static_cast<GLsizei>(h),
                 GL_RGBA, GL_UNSIGNED_BYTE, raw.data());
    glBindFramebuffer(GL_READ_FRAMEBUFFER, 0);

    // OpenGL rows run bottom-to-top
    for (uint32_t y = 0; y < h; ++y)
    {
        const uint8_t* src = raw.data() + static_cast<size_t>(h - 1 - y) * rowBytes;
        std::copy(src, src + rowBytes, pixels.data() + static_cast<size_t>(y) * rowBytes);
    }
    return pixels;
}

void GLFramebuffer::resize(uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0)
        return;
    if (width == m_spec.width && height == m_spec.height)
        return;

    m_spec.width = width;
    m_spec.height = height;
    destroy();
    create();
}

} // namespace glint
