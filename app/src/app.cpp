#include "app.h"
#include "demo_scene.h"

#include <glint/core/window.h>
#include <glint/core/log.h>
#include <glint/graphics/graphics_context.h>

#include <imgui.h>
#include <GLFW/glfw3.h>

#include <chrono>
#include <cstdio>
#include <ctime>

static constexpr float ORBIT_SENSITIVITY = 0.005f;
static constexpr float PAN_SENSITIVITY   = 0.002f;

bool App::init(const AppOptions& options)
{
    if (!m_engine.init(options.engine))
        return false;

    if (!options.emptyScene)
        buildDemoScene(m_store);
    frameDemoScene(m_camera);

    if (!m_renderer.init())
        return false;

    if (options.cpuOnly)
        m_renderer.setRenderMode(RenderMode::CPURaymarch);

    m_picker = std::make_unique<glint::Picker>(m_store, m_renderer.getIdPass());

    m_picker->setOnObjectSelected([this](const std::optional<glint::PrimitiveRef>& ref)
    {
        std::string title = "Glint";
        if (ref)
            title += std::string(" - ") + glint::toString(ref->type) + " " + std::to_string(ref->slot);
        m_engine.getWindow().setTitle(title);
    });

    m_picker->setOnObjectMoved([this](const glint::PrimitiveRef& ref, const glm::vec3& position)
    {
        m_ui.setLastMove(ref, position);
    });

    m_engine.getWindow().setScrollCallback([this](double yoffset)
    {
        if (m_ui.isViewportHovered())
            m_camera.zoom(static_cast<float>(yoffset));
    });

    return true;
}

void App::removePrimitive(const glint::PrimitiveRef& ref)
{
    auto selection = m_picker->getSelection();
    if (!m_store.removePrimitive(ref.type, ref.slot))
        return;

    glint::Log::info(std::string("Removed ") + glint::toString(ref.type) + " " + std::to_string(ref.slot));

    // Slots compact on removal, later ones of the same type shift down by one
    if (selection && selection->type == ref.type)
    {
        if (selection->slot == ref.slot)
            m_picker->deselect();
        else if (selection->slot > ref.slot)
            m_picker->select({ ref.type, selection->slot - 1 }, m_camera);
    }
    m_picker->validateSelection();
}

void App::saveScreenshot()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
    localtime_r(&now, &tm);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "render_%04d%02d%02d_%02d%02d%02d.png",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    std::string path(buf);

    if (m_renderer.saveImage(path))
        glint::Log::info("Saved screenshot: " + path);
    else
        glint::Log::error("Failed to save screenshot: " + path);
}

void App::handleInput()
{
    auto* win = m_engine.getWindow().getNativeWindow();

    m_leftMouse.update(win);
    m_rightMouse.update(win);
    m_middleMouse.update(win);

    // Orbit and pan only start inside the viewport but keep going if the pointer leaves it
    if (m_rightMouse.wasPressed() && m_ui.isViewportHovered())
        m_orbiting = true;
    if (!m_rightMouse.isDown())
        m_orbiting = false;
    if (m_orbiting)
        m_camera.rotate(-m_rightMouse.getDeltaX() * ORBIT_SENSITIVITY,
                        m_rightMouse.getDeltaY() * ORBIT_SENSITIVITY);

    if (m_middleMouse.wasPressed() && m_ui.isViewportHovered())
        m_panning = true;
    if (!m_middleMouse.isDown())
        m_panning = false;
    if (m_panning)
        m_camera.pan(m_middleMouse.getDeltaX(), m_middleMouse.getDeltaY(), PAN_SENSITIVITY);

    // Object drag
    if (m_leftMouse.isDown() && m_picker->getDragState().armed)
        m_picker->updateDrag(m_leftMouse.getDeltaX(), m_leftMouse.getDeltaY(), m_camera);
    if (m_leftMouse.wasReleased())
    {
        m_picker->endDrag();
        m_dragArmPending = false;
    }

    const bool typing = ImGui::GetIO().WantTextInput;

    // DEL key deletion (works from any focused window)
    if (!typing && ImGui::IsKeyPressed(ImGuiKey_Delete))
    {
        if (auto selection = m_picker->getSelection())
            removePrimitive(*selection);
    }

    if (ImGui::IsKeyPressed(ImGuiKey_F12))
        saveScreenshot();

    if (ImGui::IsKeyPressed(ImGuiKey_F5))
        m_renderer.reloadShaders();

    // F key: focus camera on selected object
    if (!typing && ImGui::IsKeyPressed(ImGuiKey_F))
    {
        if (auto selection = m_picker->getSelection())
        {
            if (auto position = m_store.getPosition(*selection))
                m_camera.getTarget() = *position;
        }
    }

    if (!typing && ImGui::IsKeyPressed(ImGuiKey_Escape))
        m_picker->deselect();
}

void App::processPicking()
{
    glint::PrimitiveRef removal;
    if (m_ui.consumeRemoveRequest(removal))
        removePrimitive(removal);

    int pickX, pickY;
    if (m_ui.consumePickRequest(pickX, pickY))
    {
        m_picker->requestPick(pickX, pickY);
        m_dragArmPending = true;
    }

    // Clicks resolve against the pass of the mode currently on screen
    m_picker->setIdPass(m_renderer.getIdPass());
    m_picker->processPendingPick(m_camera);

    if (m_dragArmPending && m_leftMouse.isDown())
    {
        if (m_picker->getState() == glint::PickerState::Selected)
            m_picker->beginDrag(m_camera);
        m_dragArmPending = false;
    }
}

void App::run()
{
    while (m_engine.isRunning())
    {
        m_engine.beginFrame();
        handleInput();
        processPicking();

        // Edits from the previous frame's panels and this frame's input are in; draw the result
        m_renderer.render(m_store, m_camera);

        m_ui.renderViewport(m_renderer);
        m_ui.renderHierarchy(m_store, *m_picker, m_camera);
        m_ui.renderInspector(m_store, *m_picker);
        m_ui.renderSettings(m_renderer);
        m_ui.renderConsole();
        m_ui.renderStats(m_renderer, m_store, *m_picker, m_engine);
        m_engine.endFrame();
    }
}

void App::shutdown()
{
    m_engine.getGraphicsContext().waitIdle();
    m_picker.reset();
    m_renderer.shutdown();
    m_engine.shutdown();
}
