#include <glint/raymarch/offline_render.h>
#include <glint/raymarch/cpu_raymarcher.h>
#include <glint/picking/cpu_id_pass.h>
#include <glint/core/log.h>
#include <glint/scene/object_id.h>
#include <glint/scene/scene_store.h>

#include <string>

namespace glint
{

OfflineFrame renderOffline(const SceneStore& store, const Camera& camera, const OfflineSettings& settings)
{
    OfflineFrame frame;
    if (settings.width == 0 || settings.height == 0)
    {
        Log::error("Offline render needs a non-zero size");
        return frame;
    }

    CPURaymarcher raymarcher;
    raymarcher.setMarchSettings(settings.march);
    raymarcher.setShadingSettings(settings.shading);
    raymarcher.setSmoothPropagation(settings.propagation);
    raymarcher.resize(settings.width, settings.height);
    raymarcher.render(store, camera);

    frame.width = raymarcher.getWidth();
    frame.height = raymarcher.getHeight();
    frame.pixels = raymarcher.getPixelBuffer();
    frame.renderMs = raymarcher.getLastRenderMs();
    frame.averageSteps = raymarcher.getAverageSteps();

    CPUIdPass idPass;
    idPass.setSmoothPropagation(settings.propagation);
    idPass.resize(settings.width, settings.height);
    if (!idPass.render(store, camera))
    {
        Log::error("Identifier pass failed: " + idPass.lastError());
        return frame;
    }

    uint8_t channel = idPass.readPixel(settings.width / 2, settings.height / 2);
    auto ref = ObjectId::decode(ObjectId::fromUnorm(static_cast<float>(channel) / 255.0f));
    if (ref && store.isValid(*ref))
        frame.centerObject = ref;

    return frame;
}

} // namespace glint
