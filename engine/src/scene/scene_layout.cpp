#include <glint/scene/scene_layout.h>
#include <glint/scene/scene_store.h>

namespace glint
{

GPUScene packScene(const SceneStore& store)
{
    GPUScene gpu{};

    const auto& spheres = store.getSpheres();
    const auto& boxes   = store.getBoxes();
    const auto& tori    = store.getTori();

    gpu.header.numSpheres = static_cast<uint32_t>(spheres.size());
    gpu.header.numBoxes   = static_cast<uint32_t>(boxes.size());
    gpu.header.numTori    = static_cast<uint32_t>(tori.size());

    for (size_t i = 0; i < spheres.size(); ++i)
    {
        const Sphere& s = spheres[i];
        GPUSphere& g = gpu.spheres[i];
        g.center        = s.center;
        g.radius        = s.radius;
        g.color         = s.color;
        g.blendMode     = static_cast<uint32_t>(s.blendMode);
        g.blendStrength = s.blendStrength;
    }

    for (size_t i = 0; i < boxes.size(); ++i)
    {
        const Box& b = boxes[i];
        GPUBox& g = gpu.boxes[i];
        g.center        = b.center;
        g.blendMode     = static_cast<uint32_t>(b.blendMode);
        g.halfExtents   = b.halfExtents;
        g.blendStrength = b.blendStrength;
        g.color         = b.color;
    }

    for (size_t i = 0; i < tori.size(); ++i)
    {
        const Torus& t = tori[i];
        GPUTorus& g = gpu.tori[i];
        g.center        = t.center;
        g.blendMode     = static_cast<uint32_t>(t.blendMode);
        g.radii         = { t.majorRadius, t.minorRadius };
        g.blendStrength = t.blendStrength;
        g.color         = t.color;
    }

    return gpu;
}

} // namespace glint
