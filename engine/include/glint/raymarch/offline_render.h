#pragma once

#include <glint/raymarch/distance_field.h>
#include <glint/raymarch/ray_marcher.h>
#include <glint/raymarch/surface_shader.h>
#include <glint/scene/primitive.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace glint
{

class Camera;
class SceneStore;

struct OfflineSettings
{
    uint32_t width = 1280;
    uint32_t height = 720;
    MarchSettings march;
    ShadingSettings shading;
    SmoothPropagation propagation = SmoothPropagation::PreviousTerm;
};

struct OfflineFrame
{
    uint32_t width = 0, height = 0;
    std::vector<uint8_t> pixels; // top-down RGBA8
    float renderMs = 0.0f;
    float averageSteps = 0.0f;

    // What a click at the center of the frame would select
    std::optional<PrimitiveRef> centerObject;
};

// One shaded frame plus an identifier pass on the CPU, no window or GL context
OfflineFrame renderOffline(const SceneStore& store, const Camera& camera, const OfflineSettings& settings);

} // namespace glint
