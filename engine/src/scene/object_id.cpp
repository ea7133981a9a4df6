#include <glint/scene/object_id.h>

#include <algorithm>
#include <cmath>

namespace glint
{
namespace ObjectId
{

uint32_t encode(const PrimitiveRef& ref)
{
    if (ref.slot < 0 || ref.slot >= PRIMITIVE_CAPACITY)
        return NONE;

    auto band = static_cast<uint32_t>(ref.type);
    return 1u + band * PRIMITIVE_CAPACITY + static_cast<uint32_t>(ref.slot);
}

std::optional<PrimitiveRef> decode(uint32_t id)
{
    if (id == NONE || id > MAX)
        return std::nullopt;

    uint32_t index = id - 1u;
    PrimitiveRef ref;
    ref.type = static_cast<PrimitiveType>(index / PRIMITIVE_CAPACITY);
    ref.slot = static_cast<int>(index % PRIMITIVE_CAPACITY);
    return ref;
}

uint32_t fromSurface(const SurfaceRef& surface)
{
    return surface.isPrimitive() ? encode(surface.primitive) : NONE;
}

float toUnorm(uint32_t id)
{
    return static_cast<float>(id) / 255.0f;
}

uint32_t fromUnorm(float channel)
{
    // floor() would turn 0.0392 * 255 = 9.9999 into 9
    float c = std::clamp(channel, 0.0f, 1.0f);
    return static_cast<uint32_t>(std::lround(c * 255.0f));
}

} // namespace ObjectId

namespace MaterialTag
{

float encode(const SurfaceRef& surface)
{
    switch (surface.kind)
    {
        case SurfaceRef::Kind::None:  return NONE;
        case SurfaceRef::Kind::Plane: return PLANE;
        case SurfaceRef::Kind::Primitive:
        {
            float band = static_cast<float>(static_cast<uint32_t>(surface.primitive.type) + 1u);
            return band + static_cast<float>(surface.primitive.slot) * 0.01f;
        }
    }
    return NONE;
}

SurfaceRef decode(float tag)
{
    if (!std::isfinite(tag) || tag < -0.5f)
        return SurfaceRef::none();

    long code = std::lround(tag * 100.0f);
    if (code == 0)
        return SurfaceRef::plane();

    long band = code / 100;
    long slot = code % 100;
    if (band < 1 || band > PRIMITIVE_TYPE_COUNT || slot >= PRIMITIVE_CAPACITY)
        return SurfaceRef::none();

    PrimitiveRef ref;
    ref.type = static_cast<PrimitiveType>(band - 1);
    ref.slot = static_cast<int>(slot);
    return SurfaceRef::of(ref);
}

} // namespace MaterialTag
} // namespace glint
