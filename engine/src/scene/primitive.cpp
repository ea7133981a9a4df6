#include <glint/scene/primitive.h>

namespace glint
{

const char* toString(PrimitiveType type)
{
    switch (type)
    {
        case PrimitiveType::Sphere: return "Sphere";
        case PrimitiveType::Box:    return "Box";
        case PrimitiveType::Torus:  return "Torus";
    }
    return "Unknown";
}

const char* toString(BlendMode mode)
{
    switch (mode)
    {
        case BlendMode::Union:       return "Union";
        case BlendMode::SmoothUnion: return "Smooth Union";
        case BlendMode::Subtract:    return "Subtract";
        case BlendMode::Intersect:   return "Intersect";
        case BlendMode::Xor:         return "XOR";
    }
    return "Unknown";
}

const char* toString(PrimitiveParam param)
{
    switch (param)
    {
        case PrimitiveParam::CenterX:       return "center.x";
        case PrimitiveParam::CenterY:       return "center.y";
        case PrimitiveParam::CenterZ:       return "center.z";
        case PrimitiveParam::ColorR:        return "color.r";
        case PrimitiveParam::ColorG:        return "color.g";
        case PrimitiveParam::ColorB:        return "color.b";
        case PrimitiveParam::BlendMode:     return "blendMode";
        case PrimitiveParam::BlendStrength: return "blendStrength";
        case PrimitiveParam::Radius:        return "radius";
        case PrimitiveParam::HalfExtentX:   return "halfExtents.x";
        case PrimitiveParam::HalfExtentY:   return "halfExtents.y";
        case PrimitiveParam::HalfExtentZ:   return "halfExtents.z";
        case PrimitiveParam::MajorRadius:   return "majorRadius";
        case PrimitiveParam::MinorRadius:   return "minorRadius";
    }
    return "unknown";
}

std::optional<BlendMode> blendModeFromIndex(int index)
{
    if (index < 0 || index >= BLEND_MODE_COUNT)
        return std::nullopt;
    return static_cast<BlendMode>(index);
}

bool appliesTo(PrimitiveParam param, PrimitiveType type)
{
    switch (param)
    {
        case PrimitiveParam::Radius:
            return type == PrimitiveType::Sphere;
        case PrimitiveParam::HalfExtentX:
        case PrimitiveParam::HalfExtentY:
        case PrimitiveParam::HalfExtentZ:
            return type == PrimitiveType::Box;
        case PrimitiveParam::MajorRadius:
        case PrimitiveParam::MinorRadius:
            return type == PrimitiveType::Torus;
        default:
            return true;
    }
}

} // namespace glint
