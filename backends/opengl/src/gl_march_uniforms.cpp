#include <glint/opengl/gl_march_uniforms.h>
#include <glint/opengl/gl_compute_program.h>
#include <glint/raymarch/ray.h>

#include <glad/glad.h>
#include <glm/gtc/type_ptr.hpp>

namespace glint
{

void GLMarchUniforms::cache(const GLComputeProgram& program)
{
    auto loc = [&program](const char* name) { return program.uniformLocation(name); };

    inverseVP         = loc("u_inverseVP");
    cameraOrigin      = loc("u_cameraOrigin");
    width             = loc("u_width");
    height            = loc("u_height");
    maxSteps          = loc("u_maxSteps");
    surfDist          = loc("u_surfDist");
    maxDist           = loc("u_maxDist");
    smoothPropagation = loc("u_smoothPropagation");
}

void GLMarchUniforms::apply(const Camera& camera, uint32_t w, uint32_t h,
                            const MarchSettings& march, SmoothPropagation propagation) const
{
    RayGenerator rays(camera, w, h);

    glUniformMatrix4fv(inverseVP, 1, GL_FALSE, glm::value_ptr(rays.getInverseViewProjection()));
    glUniform3fv(cameraOrigin, 1, glm::value_ptr(rays.getOrigin()));
    glUniform1ui(width, w);
    glUniform1ui(height, h);
    glUniform1i(maxSteps, march.maxSteps);
    glUniform1f(surfDist, march.surfDist);
    glUniform1f(maxDist, march.maxDist);
    glUniform1i(smoothPropagation, propagation == SmoothPropagation::WithinRadius ? 1 : 0);
}

void dispatchImage(uint32_t w, uint32_t h)
{
    uint32_t groupsX = (w + 7) / 8;
    uint32_t groupsY = (h + 7) / 8;
    glDispatchCompute(groupsX, groupsY, 1);
}

} // namespace glint
