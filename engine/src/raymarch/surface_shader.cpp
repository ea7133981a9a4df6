#include <glint/raymarch/surface_shader.h>
#include <glint/raymarch/distance_field.h>
#include <glint/raymarch/ray_marcher.h>

#include <algorithm>
#include <cmath>

namespace glint
{

SurfaceShader::SurfaceShader(const DistanceField& field, const ShadingSettings& settings)
    : m_field(field)
    , m_settings(settings)
{
}

glm::vec3 SurfaceShader::sky(float screenV) const
{
    float v = std::clamp(screenV, 0.0f, 1.0f);
    return glm::mix(m_settings.skyBottom, m_settings.skyTop, v);
}

bool SurfaceShader::isOccluded(const glm::vec3& point, const glm::vec3& normal) const
{
    glm::vec3 origin = point + normal * m_settings.shadowOffset;
    glm::vec3 toLight = m_settings.lightPosition - origin;
    float lightDist = glm::length(toLight);
    if (lightDist <= 0.0f)
        return false;

    MarchSettings shadowMarch = MarchSettings::picking();
    shadowMarch.maxSteps = m_settings.shadowSteps;
    shadowMarch.maxDist = lightDist;

    RayMarcher marcher(m_field, shadowMarch);
    HitResult hit = marcher.march(origin, toLight / lightDist);
    return !(hit.t >= lightDist);
}

glm::vec3 SurfaceShader::albedo(const HitResult& hit, const glm::vec3& point) const
{
    switch (hit.surface.kind)
    {
        case SurfaceRef::Kind::Plane:
            return DistanceField::groundAlbedo(point);
        case SurfaceRef::Kind::Primitive:
            // Stored color of the primitive, mixed where a smooth union blended it
            return hit.color;
        case SurfaceRef::Kind::None:
            break;
    }
    return glm::vec3(0.0f);
}

glm::vec3 SurfaceShader::shade(const HitResult& hit, const Ray& ray, float screenV) const
{
    glm::vec3 skyColor = sky(screenV);
    glm::vec3 color;

    if (!hit.hit)
    {
        color = skyColor;
    }
    else
    {
        glm::vec3 p = ray.at(hit.t);
        glm::vec3 n = m_field.normal(p);
        glm::vec3 l = glm::normalize(m_settings.lightPosition - p);

        float diffuse = std::max(glm::dot(n, l), 0.0f);
        float shadow = 1.0f;
        if (m_settings.shadows && diffuse > 0.0f && isOccluded(p, n))
            shadow = m_settings.shadowFactor;

        color = albedo(hit, p) * (m_settings.ambient + diffuse * shadow);

        float fog = std::exp(-hit.t * m_settings.fogDensity);
        color = glm::mix(skyColor, color, fog);
    }

    color = glm::clamp(color, 0.0f, 1.0f);
    return glm::pow(color, glm::vec3(1.0f / m_settings.gamma));
}

} // namespace glint
