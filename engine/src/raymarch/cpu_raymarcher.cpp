#include <glint/raymarch/cpu_raymarcher.h>
#include <glint/core/camera.h>
#include <glint/scene/scene_store.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <thread>

namespace glint
{

void parallelRows(uint32_t height, const std::function<void(uint32_t, uint32_t)>& traceRows)
{
    if (height == 0)
        return;

    uint32_t threadCount = std::min(height, std::max(1u, std::thread::hardware_concurrency()));
    std::vector<std::thread> threads(threadCount);

    uint32_t rowsPerThread = height / threadCount;
    uint32_t remainder = height % threadCount;

    uint32_t startRow = 0;
    for (uint32_t i = 0; i < threadCount; ++i)
    {
        uint32_t endRow = startRow + rowsPerThread + (i < remainder ? 1 : 0);
        threads[i] = std::thread(traceRows, startRow, endRow);
        startRow = endRow;
    }

    for (auto& t : threads)
        t.join();
}

void CPURaymarcher::resize(uint32_t width, uint32_t height)
{
    if (m_width == width && m_height == height)
        return;

    m_width = width;
    m_height = height;
    m_pixelBuffer.assign(static_cast<size_t>(width) * height * 4, 0);
    m_stepCounts.assign(height, 0);
}

void CPURaymarcher::render(const SceneStore& store, const Camera& camera)
{
    if (m_width == 0 || m_height == 0)
        return;

    auto start = std::chrono::steady_clock::now();

    DistanceField field(store, m_propagation);
    RayMarcher marcher(field, m_march);
    SurfaceShader shader(field, m_shading);
    RayGenerator rays(camera, m_width, m_height);

    auto traceRows = [&](uint32_t startRow, uint32_t endRow)
    {
        for (uint32_t y = startRow; y < endRow; ++y)
        {
            float screenV = 1.0f - (static_cast<float>(y) + 0.5f) / static_cast<float>(m_height);
            uint32_t rowSteps = 0;

            for (uint32_t x = 0; x < m_width; ++x)
            {
                Ray ray = rays.generatePixel(x, y);
                HitResult hit = marcher.march(ray);
                glm::vec3 c = shader.shade(hit, ray, screenV);
                rowSteps += static_cast<uint32_t>(hit.steps);

                size_t i = (static_cast<size_t>(y) * m_width + x) * 4;
                m_pixelBuffer[i + 0] = static_cast<uint8_t>(c.r * 255.0f + 0.5f);
                m_pixelBuffer[i + 1] = static_cast<uint8_t>(c.g * 255.0f + 0.5f);
                m_pixelBuffer[i + 2] = static_cast<uint8_t>(c.b * 255.0f + 0.5f);
                m_pixelBuffer[i + 3] = 255;
            }

            m_stepCounts[y] = rowSteps;
        }
    };

    parallelRows(m_height, traceRows);

    uint64_t totalSteps = std::accumulate(m_stepCounts.begin(), m_stepCounts.end(), uint64_t(0));
    m_averageSteps = static_cast<float>(totalSteps) / static_cast<float>(m_width * m_height);

    auto end = std::chrono::steady_clock::now();
    m_lastRenderMs = std::chrono::duration<float, std::milli>(end - start).count();
}

} // namespace glint
