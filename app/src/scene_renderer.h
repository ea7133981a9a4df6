#pragma once

#include <glint/graphics/texture.h>
#include <glint/picking/cpu_id_pass.h>
#include <glint/raymarch/cpu_raymarcher.h>

#ifdef GLINT_BACKEND_OPENGL
#include <glint/opengl/gl_gpu_raymarcher.h>
#include <glint/opengl/gl_id_pass.h>
#include <glint/opengl/gl_scene_buffer.h>
#endif

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace glint { class Camera; class IdPass; class SceneStore; }

enum class RenderMode { CPURaymarch, GPURaymarch };

const char* toString(RenderMode mode);

class SceneRenderer
{
public:
    bool init();
    void shutdown();

    // Viewport size in pixels; both the shaded frame and the identifier pass follow it
    void resize(uint32_t w, uint32_t h);
    void render(const glint::SceneStore& store, const glint::Camera& camera);

    // Texture to show in the viewport, 0 while the active pass has nothing valid to show
    uintptr_t getDisplayHandle() const;
    bool displayFlipsUV() const;
    bool hasFrame() const;

    bool saveImage(const std::string& path) const;
    static bool writePNG(const std::string& path, uint32_t w, uint32_t h,
                         const std::vector<uint8_t>& rgba);

    bool reloadShaders();
    const std::string& getShaderError() const;

    // Pass matching the active render mode, so clicks resolve against what is drawn
    glint::IdPass& getIdPass();

    void setRenderMode(RenderMode mode);
    RenderMode getRenderMode() const { return m_renderMode; }

    void setMarchSettings(const glint::MarchSettings& settings);
    const glint::MarchSettings& getMarchSettings() const { return m_march; }

    void setShadingSettings(const glint::ShadingSettings& settings);
    const glint::ShadingSettings& getShadingSettings() const { return m_shading; }

    void setSmoothPropagation(glint::SmoothPropagation propagation);
    glint::SmoothPropagation getSmoothPropagation() const { return m_propagation; }

    uint32_t getWidth() const { return m_width; }
    uint32_t getHeight() const { return m_height; }
    float getLastRenderMs() const { return m_lastRenderMs; }
    float getAverageSteps() const { return m_cpuRaymarcher.getAverageSteps(); }
    uint64_t getSceneUploads() const;

private:
    void renderCPU(const glint::SceneStore& store, const glint::Camera& camera);
    void renderGPU(const glint::SceneStore& store, const glint::Camera& camera);
    void applySettings();

    RenderMode m_renderMode = RenderMode::GPURaymarch;
    uint32_t m_width = 1, m_height = 1;
    float m_lastRenderMs = 0.0f;
    bool m_gpuFrameValid = false;

    glint::MarchSettings m_march;
    glint::ShadingSettings m_shading;
    glint::SmoothPropagation m_propagation = glint::SmoothPropagation::PreviousTerm;

    glint::CPURaymarcher m_cpuRaymarcher;
    glint::CPUIdPass m_cpuIdPass;
    std::unique_ptr<glint::Texture2D> m_cpuTexture;
    uint32_t m_cpuTexW = 0, m_cpuTexH = 0;

#ifdef GLINT_BACKEND_OPENGL
    glint::GLSceneBuffer m_sceneBuffer;
    glint::GLGPURaymarcher m_gpuRaymarcher;
    std::unique_ptr<glint::GLIdPass> m_gpuIdPass;
#endif
    std::string m_noError;
};
