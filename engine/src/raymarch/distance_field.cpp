#include <glint/raymarch/distance_field.h>
#include <glint/scene/scene_store.h>

#include <algorithm>
#include <cmath>

namespace glint
{

const char* toString(SmoothPropagation propagation)
{
    switch (propagation)
    {
        case SmoothPropagation::PreviousTerm: return "Previous term";
        case SmoothPropagation::WithinRadius: return "Within radius";
    }
    return "Unknown";
}

namespace sdf
{

float plane(const glm::vec3& p)
{
    return p.y - DistanceField::GROUND_HEIGHT;
}

float sphere(const glm::vec3& p, const glm::vec3& center, float radius)
{
    return glm::length(p - center) - radius;
}

float box(const glm::vec3& p, const glm::vec3& center, const glm::vec3& halfExtents)
{
    glm::vec3 q = glm::abs(p - center) - halfExtents;
    float outside = glm::length(glm::max(q, glm::vec3(0.0f)));
    float inside  = std::min(std::max(q.x, std::max(q.y, q.z)), 0.0f);
    return outside + inside;
}

float torus(const glm::vec3& p, const glm::vec3& center, float majorRadius, float minorRadius)
{
    glm::vec3 q = p - center;
    glm::vec2 ring(glm::length(glm::vec2(q.x, q.z)) - majorRadius, q.y);
    return glm::length(ring) - minorRadius;
}

FieldSample opUnion(const FieldSample& acc, const FieldSample& cand)
{
    return cand.distance < acc.distance ? cand : acc;
}

// Quadratic polynomial smooth-min. h weighs the accumulator: 1 far on its side,
// 0 far on the candidate's side, so distance and color are both continuous.
FieldSample opSmoothUnion(const FieldSample& acc, const FieldSample& cand, float k)
{
    float a = acc.distance;
    float b = cand.distance;
    float h = std::clamp(0.5f + 0.5f * (b - a) / k, 0.0f, 1.0f);

    FieldSample out;
    out.distance = glm::mix(b, a, h) - k * h * (1.0f - h);
    out.color    = glm::mix(cand.color, acc.color, h);
    out.surface  = a <= b ? acc.surface : cand.surface;
    return out;
}

FieldSample opSubtract(const FieldSample& acc, const FieldSample& cand)
{
    FieldSample out = acc;
    out.distance = std::max(-cand.distance, acc.distance);
    return out;
}

FieldSample opIntersect(const FieldSample& acc, const FieldSample& cand)
{
    return cand.distance > acc.distance ? cand : acc;
}

// max(min(a, b), -max(a, b)): keeps the region inside exactly one operand
FieldSample opXor(const FieldSample& acc, const FieldSample& cand)
{
    const FieldSample& nearer  = cand.distance < acc.distance ? cand : acc;
    const FieldSample& farther = cand.distance < acc.distance ? acc : cand;

    if (nearer.distance >= -farther.distance)
        return nearer;

    FieldSample out = farther;
    out.distance = -farther.distance;
    return out;
}

FieldSample combine(BlendMode mode, const FieldSample& acc, const FieldSample& cand, float k)
{
    switch (mode)
    {
        case BlendMode::Union:       return opUnion(acc, cand);
        case BlendMode::SmoothUnion: return opSmoothUnion(acc, cand, k);
        case BlendMode::Subtract:    return opSubtract(acc, cand);
        case BlendMode::Intersect:   return opIntersect(acc, cand);
        case BlendMode::Xor:         return opXor(acc, cand);
    }
    return opUnion(acc, cand);
}

} // namespace sdf

DistanceField::DistanceField(const SceneStore& store, SmoothPropagation propagation)
    : m_store(store)
    , m_propagation(propagation)
{
}

glm::vec3 DistanceField::groundAlbedo(const glm::vec3& p)
{
    float cell = std::floor(p.x) + std::floor(p.z);
    bool odd = std::fmod(std::abs(cell), 2.0f) >= 1.0f;
    return odd ? glm::vec3(0.35f) : glm::vec3(0.75f);
}

FieldSample DistanceField::evaluate(const glm::vec3& p) const
{
    FieldSample acc;
    acc.distance = sdf::plane(p);
    acc.surface  = SurfaceRef::plane();
    acc.color    = groundAlbedo(p);

    // Strength of the most recent smooth union, for WithinRadius propagation
    float activeK = 0.0f;

    auto accumulate = [&](PrimitiveType type, int slot, float d, const glm::vec3& color,
                          BlendMode mode, float strength)
    {
        FieldSample cand;
        cand.distance = d;
        cand.surface  = SurfaceRef::of({ type, slot });
        cand.color    = color;

        float k = std::max(strength, MIN_BLEND_STRENGTH);

        if (mode == BlendMode::SmoothUnion)
        {
            acc = sdf::opSmoothUnion(acc, cand, k);
            activeK = k;
        }
        else if (mode == BlendMode::Union &&
                 m_propagation == SmoothPropagation::WithinRadius &&
                 activeK > 0.0f &&
                 std::abs(acc.distance - d) < activeK)
        {
            acc = sdf::opSmoothUnion(acc, cand, activeK);
        }
        else
        {
            acc = sdf::combine(mode, acc, cand, k);
        }
    };

    const auto& spheres = m_store.getSpheres();
    for (size_t i = 0; i < spheres.size(); ++i)
    {
        const Sphere& s = spheres[i];
        accumulate(PrimitiveType::Sphere, static_cast<int>(i),
                   sdf::sphere(p, s.center, s.radius), s.color, s.blendMode, s.blendStrength);
    }

    const auto& boxes = m_store.getBoxes();
    for (size_t i = 0; i < boxes.size(); ++i)
    {
        const Box& b = boxes[i];
        accumulate(PrimitiveType::Box, static_cast<int>(i),
                   sdf::box(p, b.center, b.halfExtents), b.color, b.blendMode, b.blendStrength);
    }

    const auto& tori = m_store.getTori();
    for (size_t i = 0; i < tori.size(); ++i)
    {
        const Torus& t = tori[i];
        accumulate(PrimitiveType::Torus, static_cast<int>(i),
                   sdf::torus(p, t.center, t.majorRadius, t.minorRadius),
                   t.color, t.blendMode, t.blendStrength);
    }

    return acc;
}

glm::vec3 DistanceField::normal(const glm::vec3& p, float eps) const
{
    glm::vec3 ex(eps, 0.0f, 0.0f);
    glm::vec3 ey(0.0f, eps, 0.0f);
    glm::vec3 ez(0.0f, 0.0f, eps);

    glm::vec3 gradient(
        distance(p + ex) - distance(p - ex),
        distance(p + ey) - distance(p - ey),
        distance(p + ez) - distance(p - ez));

    float len = glm::length(gradient);
    if (!(len > 1e-12f))
        return glm::vec3(0.0f, 1.0f, 0.0f);

    return gradient / len;
}

} // namespace glint
