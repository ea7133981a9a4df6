#pragma once

#include <glint/scene/object_id.h>

#include <glm/glm.hpp>

namespace glint
{

// Result of one march. surface and color are only meaningful when hit is true;
// a miss leaves t wherever the loop stopped (past maxDist or out of steps).
struct HitResult
{
    float t = 0.0f;
    SurfaceRef surface;
    glm::vec3 color{0.0f};
    int steps = 0;
    bool hit = false;
};

} // namespace glint
