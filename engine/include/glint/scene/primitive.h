#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <optional>

namespace glint
{

// Slots per primitive type. Fixed because the GPU scene buffer uses static arrays.
inline constexpr int PRIMITIVE_CAPACITY = 10;
inline constexpr int PRIMITIVE_TYPE_COUNT = 3;

enum class PrimitiveType : uint32_t
{
    Sphere = 0,
    Box    = 1,
    Torus  = 2
};

// Values are part of the GPU buffer layout
enum class BlendMode : uint32_t
{
    Union       = 0,
    SmoothUnion = 1,
    Subtract    = 2,
    Intersect   = 3,
    Xor         = 4
};

inline constexpr int BLEND_MODE_COUNT = 5;

struct Sphere
{
    glm::vec3 center{0.0f};
    float radius = 0.5f;
    glm::vec3 color{0.8f, 0.3f, 0.3f};
    BlendMode blendMode = BlendMode::Union;
    float blendStrength = 0.3f;
};

struct Box
{
    glm::vec3 center{0.0f};
    glm::vec3 halfExtents{0.4f};
    glm::vec3 color{0.3f, 0.6f, 0.85f};
    BlendMode blendMode = BlendMode::Union;
    float blendStrength = 0.3f;
};

// Ring lies in the XZ plane around its center
struct Torus
{
    glm::vec3 center{0.0f};
    float majorRadius = 0.6f;
    float minorRadius = 0.2f;
    glm::vec3 color{0.4f, 0.8f, 0.4f};
    BlendMode blendMode = BlendMode::Union;
    float blendStrength = 0.3f;
};

struct PrimitiveRef
{
    PrimitiveType type = PrimitiveType::Sphere;
    int slot = 0;

    bool operator==(const PrimitiveRef&) const = default;
};

// Editable fields addressed by setParam()
enum class PrimitiveParam
{
    CenterX, CenterY, CenterZ,
    ColorR, ColorG, ColorB,
    BlendMode,
    BlendStrength,
    Radius,                                 // sphere
    HalfExtentX, HalfExtentY, HalfExtentZ,  // box
    MajorRadius, MinorRadius                // torus
};

const char* toString(PrimitiveType type);
const char* toString(BlendMode mode);
const char* toString(PrimitiveParam param);

std::optional<BlendMode> blendModeFromIndex(int index);

// Whether the field exists on the given primitive type
bool appliesTo(PrimitiveParam param, PrimitiveType type);

} // namespace glint
