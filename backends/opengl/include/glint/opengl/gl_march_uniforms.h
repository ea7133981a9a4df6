#pragma once

#include <glint/raymarch/distance_field.h>
#include <glint/raymarch/ray_marcher.h>

#include <cstdint>

namespace glint
{

class Camera;
class GLComputeProgram;

// Uniform locations declared in sdf_common.glsl, shared by every marching pass
struct GLMarchUniforms
{
    int32_t inverseVP = -1;
    int32_t cameraOrigin = -1;
    int32_t width = -1;
    int32_t height = -1;
    int32_t maxSteps = -1;
    int32_t surfDist = -1;
    int32_t maxDist = -1;
    int32_t smoothPropagation = -1;

    void cache(const GLComputeProgram& program);

    // Program must be in use
    void apply(const Camera& camera, uint32_t w, uint32_t h,
               const MarchSettings& march, SmoothPropagation propagation) const;
};

// Dispatch one 8x8 invocation group per tile of a w x h image
void dispatchImage(uint32_t w, uint32_t h);

} // namespace glint
