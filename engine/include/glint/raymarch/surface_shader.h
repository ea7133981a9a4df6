#pragma once

#include <glint/raymarch/ray.h>
#include <glint/raymarch/hit.h>

#include <glm/glm.hpp>

namespace glint
{

class DistanceField;

struct ShadingSettings
{
    glm::vec3 lightPosition{ 2.0f, 5.0f, 4.0f };
    float ambient      = 0.15f;
    float shadowFactor = 0.3f;  // diffuse multiplier for occluded points
    float shadowOffset = 0.02f; // along the normal, clears the surface band
    int   shadowSteps  = 128;   // a shadow ray that stops short of the light is occluded
    float fogDensity   = 0.02f;
    float gamma        = 2.2f;
    bool  shadows      = true;
    glm::vec3 skyTop{ 0.35f, 0.55f, 0.85f };
    glm::vec3 skyBottom{ 0.75f, 0.82f, 0.90f };
};

// Direct lighting for one primary hit: Lambert against a point light with a
// marched hard shadow, exponential fog toward the sky, then gamma.
class SurfaceShader
{
public:
    SurfaceShader(const DistanceField& field, const ShadingSettings& settings);

    // screenV is the vertical screen coordinate, 0 at the bottom edge and 1 at the top
    glm::vec3 shade(const HitResult& hit, const Ray& ray, float screenV) const;

    glm::vec3 sky(float screenV) const;
    bool isOccluded(const glm::vec3& point, const glm::vec3& normal) const;
    glm::vec3 albedo(const HitResult& hit, const glm::vec3& point) const;

private:
    const DistanceField& m_field;
    ShadingSettings m_settings;
};

} // namespace glint
