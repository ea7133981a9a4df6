#include <glint/picking/cpu_id_pass.h>
#include <glint/raymarch/cpu_raymarcher.h>
#include <glint/scene/object_id.h>
#include <glint/scene/scene_store.h>

#include <cmath>

namespace glint
{

void CPUIdPass::resize(uint32_t width, uint32_t height)
{
    if (m_width == width && m_height == height)
        return;

    m_width = width;
    m_height = height;
    m_buffer.assign(static_cast<size_t>(width) * height, 0);
}

bool CPUIdPass::render(const SceneStore& store, const Camera& camera)
{
    if (m_width == 0 || m_height == 0)
    {
        m_lastError = "identifier pass has no size";
        return false;
    }

    DistanceField field(store, m_propagation);
    RayMarcher marcher(field, m_march);
    RayGenerator rays(camera, m_width, m_height);

    parallelRows(m_height, [&](uint32_t startRow, uint32_t endRow)
    {
        for (uint32_t y = startRow; y < endRow; ++y)
        {
            for (uint32_t x = 0; x < m_width; ++x)
            {
                HitResult hit = marcher.march(rays.generatePixel(x, y));
                uint32_t id = hit.hit ? ObjectId::fromSurface(hit.surface) : ObjectId::NONE;

                // Same quantization an rgba8unorm target applies
                float channel = ObjectId::toUnorm(id);
                m_buffer[static_cast<size_t>(y) * m_width + x] =
                    static_cast<uint8_t>(std::lround(channel * 255.0f));
            }
        }
    });

    m_lastError.clear();
    return true;
}

uint8_t CPUIdPass::readPixel(uint32_t x, uint32_t y) const
{
    return m_buffer[static_cast<size_t>(y) * m_width + x];
}

} // namespace glint
