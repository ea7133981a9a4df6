#pragma once

#include <glint/scene/primitive.h>

#include <cstdint>
#include <optional>

namespace glint
{

// What a ray landed on. The ground plane is a surface but never a selectable object.
struct SurfaceRef
{
    enum class Kind { None, Plane, Primitive };

    Kind kind = Kind::None;
    PrimitiveRef primitive; // meaningful only when kind == Primitive

    static SurfaceRef none() { return {}; }
    static SurfaceRef plane() { return { Kind::Plane, {} }; }
    static SurfaceRef of(const PrimitiveRef& ref) { return { Kind::Primitive, ref }; }

    bool isPrimitive() const { return kind == Kind::Primitive; }

    bool operator==(const SurfaceRef& other) const
    {
        if (kind != other.kind)
            return false;
        return kind != Kind::Primitive || primitive == other.primitive;
    }
};

// Integer object identifiers written by the identifier pass.
// 0 is background/ground; type t, slot s encodes to 1 + t * PRIMITIVE_CAPACITY + s,
// so spheres own 1..10, boxes 11..20 and tori 21..30 whatever the active counts are.
namespace ObjectId
{

inline constexpr uint32_t NONE = 0;
inline constexpr uint32_t MAX = PRIMITIVE_TYPE_COUNT * PRIMITIVE_CAPACITY;

// NONE for a slot outside [0, PRIMITIVE_CAPACITY)
uint32_t encode(const PrimitiveRef& ref);
std::optional<PrimitiveRef> decode(uint32_t id);

uint32_t fromSurface(const SurfaceRef& surface);

// 8-bit unorm channel transport: written as id / 255, read back with rounding
float toUnorm(uint32_t id);
uint32_t fromUnorm(float channel);

} // namespace ObjectId

// Scalar surface tag for shading stages that can only return a float.
// Plane 0, no hit -1, type band b (sphere 1, box 2, torus 3) with slot s is b + s * 0.01.
namespace MaterialTag
{

inline constexpr float PLANE = 0.0f;
inline constexpr float NONE = -1.0f;

float encode(const SurfaceRef& surface);
SurfaceRef decode(float tag);

} // namespace MaterialTag

} // namespace glint
