#pragma once

#include <glint/graphics/framebuffer.h>
#include <cstdint>

namespace glint
{

// Single color attachment, usable both as a render target and as a compute image
class GLFramebuffer : public Framebuffer
{
public:
    explicit GLFramebuffer(const FramebufferSpec& spec);
    ~GLFramebuffer() override;

    void bind() override;
    void unbind() override;
    void resize(uint32_t width, uint32_t height) override;
    void clear(float r, float g, float b, float a = 1.0f) override;

    int readPixel(int x, int y) const override;
    std::vector<uint8_t> readPixels() const override;
    bool flipsUV() const override { return true; }

    uintptr_t getColorAttachmentHandle() const override
    {
        return static_cast<uintptr_t>(m_colorAttachment);
    }
    // Internal format to pass to glBindImageTexture
    uint32_t getImageFormat() const;
    const FramebufferSpec& getSpec() const override { return m_spec; }

private:
    uint32_t m_fbo = 0;
    uint32_t m_colorAttachment = 0;
    FramebufferSpec m_spec;

    void create();
    void destroy();
};

} // namespace glint
