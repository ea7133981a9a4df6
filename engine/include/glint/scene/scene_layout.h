#pragma once

#include <glint/scene/primitive.h>

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>

namespace glint
{

class SceneStore;

// GPU-side scene records, mirrored by the Scene block in shaders/opengl/sdf_common.glsl.
// Every vec3 starts on a 16-byte boundary and every record is 48 bytes (std430).

struct GPUSphere
{
    glm::vec3 center;
    float     radius;
    glm::vec3 color;
    uint32_t  blendMode;
    float     blendStrength;
    float     pad0, pad1, pad2;
};

struct GPUBox
{
    glm::vec3 center;
    uint32_t  blendMode;
    glm::vec3 halfExtents;
    float     blendStrength;
    glm::vec3 color;
    float     pad0;
};

struct GPUTorus
{
    glm::vec3 center;
    uint32_t  blendMode;
    glm::vec2 radii; // major, minor
    float     blendStrength;
    float     pad0;
    glm::vec3 color;
    float     pad1;
};

struct GPUSceneHeader
{
    uint32_t numSpheres;
    uint32_t numBoxes;
    uint32_t numTori;
    uint32_t reserved;
};

struct GPUScene
{
    GPUSceneHeader header;
    GPUSphere spheres[PRIMITIVE_CAPACITY];
    GPUBox    boxes[PRIMITIVE_CAPACITY];
    GPUTorus  tori[PRIMITIVE_CAPACITY];
};

static_assert(sizeof(GPUSceneHeader) == 16);
static_assert(sizeof(GPUSphere) == 48 && sizeof(GPUBox) == 48 && sizeof(GPUTorus) == 48);
static_assert(offsetof(GPUSphere, color) == 16);
static_assert(offsetof(GPUSphere, blendMode) == 28);
static_assert(offsetof(GPUSphere, blendStrength) == 32);
static_assert(offsetof(GPUBox, halfExtents) == 16);
static_assert(offsetof(GPUBox, color) == 32);
static_assert(offsetof(GPUTorus, radii) == 16);
static_assert(offsetof(GPUTorus, color) == 32);
static_assert(offsetof(GPUScene, spheres) == 16);
static_assert(offsetof(GPUScene, boxes) == 16 + 48 * PRIMITIVE_CAPACITY);
static_assert(offsetof(GPUScene, tori) == 16 + 96 * PRIMITIVE_CAPACITY);
static_assert(sizeof(GPUScene) == 1456);

// Inactive slots are zero-filled; the counts gate which slots the shader visits.
GPUScene packScene(const SceneStore& store);

} // namespace glint
