#pragma once

#include <glint/raymarch/ray.h>
#include <glint/raymarch/hit.h>

namespace glint
{

class DistanceField;

struct MarchSettings
{
    int   maxSteps = 256;
    float surfDist = 0.001f;
    float maxDist  = 100.0f;

    // Identifier pass only needs a coarse answer
    static MarchSettings picking() { return { 128, 0.001f, 100.0f }; }
};

// Sphere tracing against a DistanceField. Always terminates: a march that
// neither converges below surfDist nor passes maxDist within maxSteps is a miss.
class RayMarcher
{
public:
    explicit RayMarcher(const DistanceField& field, const MarchSettings& settings = {});

    HitResult march(const Ray& ray) const;
    HitResult march(const glm::vec3& origin, const glm::vec3& direction) const;

    const MarchSettings& getSettings() const { return m_settings; }

private:
    const DistanceField& m_field;
    MarchSettings m_settings;
};

} // namespace glint
