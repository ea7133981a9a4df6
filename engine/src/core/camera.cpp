#include <glint/core/camera.h>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace glint
{

static constexpr float PITCH_LIMIT = 1.5f;
static constexpr float MIN_DISTANCE = 0.05f;

void Camera::setOrbit(const glm::vec3& target, float distance, float yaw, float pitch)
{
    m_target = target;
    m_distance = std::max(MIN_DISTANCE, distance);
    m_yaw = yaw;
    m_pitch = std::clamp(pitch, -PITCH_LIMIT, PITCH_LIMIT);
}

void Camera::rotate(float deltaYaw, float deltaPitch)
{
    m_yaw += deltaYaw;
    m_pitch = std::clamp(m_pitch + deltaPitch, -PITCH_LIMIT, PITCH_LIMIT);
}

void Camera::zoom(float delta)
{
    float factor = 1.0f - delta * 0.1f;
    m_distance = std::max(MIN_DISTANCE, m_distance * factor);
}

void Camera::pan(float dx, float dy, float sensitivity)
{
    glm::mat4 view = getViewMatrix();
    glm::vec3 right = glm::vec3(view[0][0], view[1][0], view[2][0]);
    glm::vec3 up    = glm::vec3(view[0][1], view[1][1], view[2][1]);

    float speed = m_distance * sensitivity;
    m_target -= right * dx * speed;
    m_target += up    * dy * speed;
}

glm::vec3 Camera::getPosition() const
{
    float x = m_distance * std::cos(m_pitch) * std::sin(m_yaw);
    float y = m_distance * std::sin(m_pitch);
    float z = m_distance * std::cos(m_pitch) * std::cos(m_yaw);
    return m_target + glm::vec3(x, y, z);
}

glm::vec3 Camera::getForward() const
{
    return glm::normalize(m_target - getPosition());
}

glm::mat4 Camera::getViewMatrix() const
{
    return glm::lookAt(getPosition(), m_target, glm::vec3(0.0f, 1.0f, 0.0f));
}

glm::mat4 Camera::getProjectionMatrix(float aspectRatio) const
{
    return glm::perspective(glm::radians(fov), aspectRatio, nearPlane, farPlane);
}

} // namespace glint
