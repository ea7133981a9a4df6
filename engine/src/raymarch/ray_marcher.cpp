#include <glint/raymarch/ray_marcher.h>
#include <glint/raymarch/distance_field.h>

namespace glint
{

RayMarcher::RayMarcher(const DistanceField& field, const MarchSettings& settings)
    : m_field(field)
    , m_settings(settings)
{
}

HitResult RayMarcher::march(const glm::vec3& origin, const glm::vec3& direction) const
{
    return march(Ray{ origin, direction });
}

HitResult RayMarcher::march(const Ray& ray) const
{
    HitResult result;
    float t = 0.0f;

    for (int i = 0; i < m_settings.maxSteps; ++i)
    {
        FieldSample s = m_field.evaluate(ray.at(t));
        result.steps = i + 1;

        if (s.distance < m_settings.surfDist)
        {
            result.t = t;
            result.surface = s.surface;
            result.color = s.color;
            result.hit = true;
            return result;
        }

        t += s.distance;
        if (t > m_settings.maxDist)
            break;
    }

    result.t = t;
    return result;
}

} // namespace glint
