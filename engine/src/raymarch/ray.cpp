#include <glint/raymarch/ray.h>
#include <glint/core/camera.h>

#include <algorithm>

namespace glint
{

RayGenerator::RayGenerator(const Camera& camera, uint32_t width, uint32_t height)
    : m_width(static_cast<float>(std::max(width, 1u)))
    , m_height(static_cast<float>(std::max(height, 1u)))
{
    float aspect = m_width / m_height;
    m_origin = camera.getPosition();
    m_inverseVP = glm::inverse(camera.getProjectionMatrix(aspect) * camera.getViewMatrix());
}

Ray RayGenerator::generate(float px, float py) const
{
    float ndcX = (2.0f * px / m_width) - 1.0f;
    float ndcY = 1.0f - (2.0f * py / m_height);

    glm::vec4 nearClip = m_inverseVP * glm::vec4(ndcX, ndcY, -1.0f, 1.0f);
    glm::vec4 farClip  = m_inverseVP * glm::vec4(ndcX, ndcY,  1.0f, 1.0f);

    glm::vec3 nearWorld = glm::vec3(nearClip) / nearClip.w;
    glm::vec3 farWorld  = glm::vec3(farClip) / farClip.w;

    Ray ray;
    ray.origin    = m_origin;
    ray.direction = glm::normalize(farWorld - nearWorld);
    return ray;
}

Ray RayGenerator::generatePixel(uint32_t x, uint32_t y) const
{
    return generate(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);
}

} // namespace glint
