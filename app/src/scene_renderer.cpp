#include "scene_renderer.h"

#include <glint/core/camera.h>
#include <glint/core/log.h>
#include <glint/scene/scene_store.h>

#include <stb_image_write.h>

#include <chrono>

const char* toString(RenderMode mode)
{
    switch (mode)
    {
        case RenderMode::CPURaymarch: return "CPU Raymarch";
        case RenderMode::GPURaymarch: return "GPU Raymarch";
    }
    return "Unknown";
}

bool SceneRenderer::init()
{
    m_cpuTexture = glint::Texture2D::create(1, 1, 4);
    m_cpuTexW = 1;
    m_cpuTexH = 1;

#ifdef GLINT_BACKEND_OPENGL
    if (!m_sceneBuffer.init())
        return false;

    m_gpuRaymarcher.init(m_sceneBuffer);
    m_gpuIdPass = std::make_unique<glint::GLIdPass>(m_sceneBuffer);
    m_gpuIdPass->init();

    if (!m_gpuRaymarcher.isReady())
        glint::Log::warn("GPU raymarch shader unavailable, fix it and press F5");
#else
    m_renderMode = RenderMode::CPURaymarch;
#endif

    applySettings();
    return true;
}

void SceneRenderer::shutdown()
{
#ifdef GLINT_BACKEND_OPENGL
    m_gpuIdPass.reset();
    m_gpuRaymarcher.shutdown();
    m_sceneBuffer.shutdown();
#endif
    m_cpuTexture.reset();
}

void SceneRenderer::applySettings()
{
    m_cpuRaymarcher.setMarchSettings(m_march);
    m_cpuRaymarcher.setShadingSettings(m_shading);
    m_cpuRaymarcher.setSmoothPropagation(m_propagation);
    m_cpuIdPass.setSmoothPropagation(m_propagation);

#ifdef GLINT_BACKEND_OPENGL
    m_gpuRaymarcher.setMarchSettings(m_march);
    m_gpuRaymarcher.setShadingSettings(m_shading);
    m_gpuRaymarcher.setSmoothPropagation(m_propagation);
    if (m_gpuIdPass)
        m_gpuIdPass->setSmoothPropagation(m_propagation);
#endif
}

void SceneRenderer::setMarchSettings(const glint::MarchSettings& settings)
{
    m_march = settings;
    applySettings();
}

void SceneRenderer::setShadingSettings(const glint::ShadingSettings& settings)
{
    m_shading = settings;
    applySettings();
}

void SceneRenderer::setSmoothPropagation(glint::SmoothPropagation propagation)
{
    m_propagation = propagation;
    applySettings();
}

void SceneRenderer::setRenderMode(RenderMode mode)
{
    if (m_renderMode == mode)
        return;

#ifndef GLINT_BACKEND_OPENGL
    if (mode == RenderMode::GPURaymarch)
    {
        glint::Log::warn("GPU raymarching needs the OpenGL backend");
        return;
    }
#endif

    m_renderMode = mode;
    glint::Log::info(std::string("Render mode: ") + toString(mode));
}

void SceneRenderer::resize(uint32_t w, uint32_t h)
{
    if (w == 0 || h == 0)
        return;

    m_width = w;
    m_height = h;
    m_cpuIdPass.resize(w, h);
#ifdef GLINT_BACKEND_OPENGL
    m_gpuRaymarcher.resize(w, h);
    if (m_gpuIdPass)
        m_gpuIdPass->resize(w, h);
#endif
}

glint::IdPass& SceneRenderer::getIdPass()
{
#ifdef GLINT_BACKEND_OPENGL
    if (m_renderMode == RenderMode::GPURaymarch && m_gpuIdPass)
        return *m_gpuIdPass;
#endif
    return m_cpuIdPass;
}

void SceneRenderer::render(const glint::SceneStore& store, const glint::Camera& camera)
{
    auto start = std::chrono::high_resolution_clock::now();

    if (m_renderMode == RenderMode::CPURaymarch)
        renderCPU(store, camera);
    else
        renderGPU(store, camera);

    auto end = std::chrono::high_resolution_clock::now();
    m_lastRenderMs = std::chrono::duration<float, std::milli>(end - start).count();
}

void SceneRenderer::renderCPU(const glint::SceneStore& store, const glint::Camera& camera)
{
    m_cpuRaymarcher.resize(m_width, m_height);
    m_cpuRaymarcher.render(store, camera);

    // Recreate texture if size changed
    if (m_width != m_cpuTexW || m_height != m_cpuTexH)
    {
        m_cpuTexture = glint::Texture2D::create(m_width, m_height, 4);
        m_cpuTexW = m_width;
        m_cpuTexH = m_height;
    }

    const auto& pixels = m_cpuRaymarcher.getPixelBuffer();
    m_cpuTexture->setData(pixels.data(), m_width, m_height, 4);
}

void SceneRenderer::renderGPU([[maybe_unused]] const glint::SceneStore& store,
                              [[maybe_unused]] const glint::Camera& camera)
{
#ifdef GLINT_BACKEND_OPENGL
    m_gpuFrameValid = m_gpuRaymarcher.render(store, camera);
#endif
}

bool SceneRenderer::hasFrame() const
{
    if (m_renderMode == RenderMode::CPURaymarch)
        return !m_cpuRaymarcher.getPixelBuffer().empty();
    return m_gpuFrameValid;
}

uintptr_t SceneRenderer::getDisplayHandle() const
{
    if (!hasFrame())
        return 0;

#ifdef GLINT_BACKEND_OPENGL
    if (m_renderMode == RenderMode::GPURaymarch)
        return m_gpuRaymarcher.getOutput()->getColorAttachmentHandle();
#endif
    return m_cpuTexture ? m_cpuTexture->getNativeHandle() : 0;
}

bool SceneRenderer::displayFlipsUV() const
{
#ifdef GLINT_BACKEND_OPENGL
    // CPU pixels are uploaded top row first; the compute image is bottom row first
    if (m_renderMode == RenderMode::GPURaymarch)
        return m_gpuRaymarcher.getOutput()->flipsUV();
#endif
    return false;
}

bool SceneRenderer::reloadShaders()
{
#ifdef GLINT_BACKEND_OPENGL
    bool shadeOk = m_gpuRaymarcher.reloadShader();
    bool pickOk = m_gpuIdPass && m_gpuIdPass->reloadShader();
    if (!shadeOk)
        m_gpuFrameValid = false;
    return shadeOk && pickOk;
#else
    return false;
#endif
}

const std::string& SceneRenderer::getShaderError() const
{
#ifdef GLINT_BACKEND_OPENGL
    if (!m_gpuRaymarcher.isReady())
        return m_gpuRaymarcher.lastError();
    if (m_gpuIdPass && !m_gpuIdPass->lastError().empty())
        return m_gpuIdPass->lastError();
#endif
    return m_noError;
}

uint64_t SceneRenderer::getSceneUploads() const
{
#ifdef GLINT_BACKEND_OPENGL
    return m_sceneBuffer.getUploadCount();
#else
    return 0;
#endif
}

bool SceneRenderer::writePNG(const std::string& path, uint32_t w, uint32_t h,
                             const std::vector<uint8_t>& rgba)
{
    if (w == 0 || h == 0 || rgba.size() < static_cast<size_t>(w) * h * 4)
        return false;

    int iw = static_cast<int>(w);
    int ih = static_cast<int>(h);
    return stbi_write_png(path.c_str(), iw, ih, 4, rgba.data(), iw * 4) != 0;
}

bool SceneRenderer::saveImage(const std::string& path) const
{
    if (!hasFrame())
        return false;

#ifdef GLINT_BACKEND_OPENGL
    if (m_renderMode == RenderMode::GPURaymarch)
    {
        const auto* fb = m_gpuRaymarcher.getOutput();
        const auto& spec = fb->getSpec();
        return writePNG(path, spec.width, spec.height, fb->readPixels());
    }
#endif

    return writePNG(path, m_cpuRaymarcher.getWidth(), m_cpuRaymarcher.getHeight(),
                    m_cpuRaymarcher.getPixelBuffer());
}
