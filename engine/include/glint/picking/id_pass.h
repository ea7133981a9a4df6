#pragma once

#include <cstdint>
#include <string>

namespace glint
{

class Camera;
class SceneStore;

// Offscreen identifier render: one 8-bit unorm channel per pixel holding
// ObjectId::toUnorm(id) of the first surface along the pixel's ray.
class IdPass
{
public:
    virtual ~IdPass() = default;

    virtual void resize(uint32_t width, uint32_t height) = 0;

    // Full-frame render, complete when this returns. False when the pass cannot
    // run (e.g. its GPU program failed to build); lastError() then says why.
    virtual bool render(const SceneStore& store, const Camera& camera) = 0;

    // Raw channel byte at (x, y), top-left origin. Coordinates must be in bounds.
    virtual uint8_t readPixel(uint32_t x, uint32_t y) const = 0;

    virtual uint32_t getWidth() const = 0;
    virtual uint32_t getHeight() const = 0;
    virtual const std::string& lastError() const = 0;
};

} // namespace glint
