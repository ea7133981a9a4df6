#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace glint
{

class Camera;

struct Ray
{
    glm::vec3 origin;
    glm::vec3 direction; // unit length

    glm::vec3 at(float t) const { return origin + t * direction; }
};

// Primary rays through pixel positions of a viewport, unprojected with the
// inverse view-projection so they match what the rasterized editor shows.
class RayGenerator
{
public:
    RayGenerator(const Camera& camera, uint32_t width, uint32_t height);

    // (px, py) in pixels, top-left origin; pixel centers sit at +0.5
    Ray generate(float px, float py) const;
    Ray generatePixel(uint32_t x, uint32_t y) const;

    const glm::vec3& getOrigin() const { return m_origin; }
    const glm::mat4& getInverseViewProjection() const { return m_inverseVP; }

private:
    glm::vec3 m_origin{0.0f};
    glm::mat4 m_inverseVP{1.0f};
    float m_width = 1.0f;
    float m_height = 1.0f;
};

} // namespace glint
