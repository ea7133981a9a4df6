#pragma once

#include "scene_renderer.h"
#include "editor_ui.h"

#include <glint/core/camera.h>
#include <glint/core/engine.h>
#include <glint/core/input.h>
#include <glint/picking/picker.h>
#include <glint/scene/scene_store.h>

#include <memory>

struct AppOptions
{
    glint::EngineConfig engine;
    bool cpuOnly = false;     // start in CPU raymarch mode
    bool emptyScene = false;  // skip the demo content
    bool headless = false;    // one CPU frame and center pick, no window
};

struct App
{
    bool init(const AppOptions& options);
    void run();
    void shutdown();

private:
    void handleInput();
    void processPicking();
    void removePrimitive(const glint::PrimitiveRef& ref);
    void saveScreenshot();

    glint::Engine            m_engine;
    glint::SceneStore        m_store;
    glint::Camera            m_camera;
    SceneRenderer            m_renderer;
    EditorUI                 m_ui;
    std::unique_ptr<glint::Picker> m_picker;

    glint::MouseTracker m_leftMouse{ glint::MouseButton::Left };
    glint::MouseTracker m_rightMouse{ glint::MouseButton::Right };
    glint::MouseTracker m_middleMouse{ glint::MouseButton::Middle };
    bool m_orbiting = false;
    bool m_panning  = false;
    bool m_dragArmPending = false;
};
