#include <glint/opengl/gl_texture.h>

#include <glad/glad.h>

namespace glint
{

std::unique_ptr<Texture2D> Texture2D::create(uint32_t width, uint32_t height, uint32_t channels)
{
    return std::make_unique<GLTexture2D>(width, height, channels);
}

static GLenum channelsToFormat(uint32_t channels)
{
    switch (channels)
    {
        case 1: return GL_RED;
        case 3: return GL_RGB;
        default: return GL_RGBA;
    }
}

static GLenum channelsToInternalFormat(uint32_t channels)
{
    switch (channels)
    {
        case 1: return GL_R8;
        case 3: return GL_RGB8;
        default: return GL_RGBA8;
    }
}

GLTexture2D::GLTexture2D(uint32_t width, uint32_t height, uint32_t channels)
    : m_width(width), m_height(height), m_channels(channels)
{
    glGenTextures(1, &m_id);
    glBindTexture(GL_TEXTURE_2D, m_id);

    glTexImage2D(GL_TEXTURE_2D, 0,
                 static_cast<GLint>(channelsToInternalFormat(channels)),
                 static_cast<GLsizei>(width), static_cast<GLsizei>(height),
                 0, channelsToFormat(channels), GL_UNSIGNED_BYTE, nullptr);

    // CPU frames are shown 1:1, sampling between texels only blurs them
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glBindTexture(GL_TEXTURE_2D, 0);
}

GLTexture2D::~GLTexture2D()
{
    if (m_id) glDeleteTextures(1, &m_id);
}

void GLTexture2D::bind(uint32_t slot)
{
    glActiveTexture(GL_TEXTURE0 + slot);
    glBindTexture(GL_TEXTURE_2D, m_id);
}

void GLTexture2D::unbind()
{
    glBindTexture(GL_TEXTURE_2D, 0);
}

void GLTexture2D::setData(const void* data, uint32_t width, uint32_t height, uint32_t channels)
{
    glBindTexture(GL_TEXTURE_2D, m_id);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

    if (width == m_width && height == m_height && channels == m_channels)
    {
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0,
                        static_cast<GLsizei>(width), static_cast<GLsizei>(height),
                        channelsToFormat(channels), GL_UNSIGNED_BYTE, data);
    }
    else
    {
        m_width = width;
        m_height = height;
        m_channels = channels;
        glTexImage2D(GL_TEXTURE_2D, 0,
                     static_cast<GLint>(channelsToInternalFormat(channels)),
                     static_cast<GLsizei>(width), static_cast<GLsizei>(height),
                     0, channelsToFormat(channels), GL_UNSIGNED_BYTE, data);
    }

    glBindTexture(GL_TEXTURE_2D, 0);
}

} // namespace glint
