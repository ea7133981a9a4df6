#pragma once

#include <cstdint>
#include <vector>

namespace glint
{

enum class ColorFormat
{
    RGBA8,   // exact 8-bit channels, used for the object ID target
    RGBA32F  // shaded frame
};

struct FramebufferSpec
{
    uint32_t width = 1280;
    uint32_t height = 720;
    ColorFormat format = ColorFormat::RGBA32F;
};

class Framebuffer
{
public:
    virtual ~Framebuffer() = default;

    virtual void bind() = 0;
    virtual void unbind() = 0;
    virtual void resize(uint32_t width, uint32_t height) = 0;
    virtual void clear(float r, float g, float b, float a = 1.0f) = 0;

    // Red channel of one texel in [0, 255]; (x, y) is top-left based. -1 when out of bounds.
    virtual int readPixel(int x, int y) const = 0;
    // Whole attachment as top-down RGBA8
    virtual std::vector<uint8_t> readPixels() const = 0;
    virtual bool flipsUV() const { return false; }

    virtual uintptr_t getColorAttachmentHandle() const = 0;
    virtual const FramebufferSpec& getSpec() const = 0;
};

} // namespace glint
