#pragma once

#include <glint/scene/primitive.h>

#include <glm/glm.hpp>
#include <imgui.h>

#include <optional>
#include <string>

namespace glint { class Camera; class Engine; class Picker; class SceneStore; }

class SceneRenderer;

class EditorUI
{
public:
    void renderViewport(SceneRenderer& renderer);
    void renderHierarchy(glint::SceneStore& store, glint::Picker& picker, const glint::Camera& camera);
    void renderInspector(glint::SceneStore& store, glint::Picker& picker);
    void renderSettings(SceneRenderer& renderer);
    void renderConsole();
    void renderStats(SceneRenderer& renderer, const glint::SceneStore& store,
                     const glint::Picker& picker, const glint::Engine& engine);

    bool isViewportHovered() const { return m_viewportHovered; }

    // Click position in viewport pixels, top-left origin
    bool consumePickRequest(int& outX, int& outY);
    // Remove button in the hierarchy; App applies it so the selection can be fixed up
    bool consumeRemoveRequest(glint::PrimitiveRef& outRef);

    void setLastMove(const glint::PrimitiveRef& ref, const glm::vec3& position);

private:
    bool m_viewportHovered = false;

    bool m_pickRequested = false;
    int  m_pickX = 0;
    int  m_pickY = 0;

    std::optional<glint::PrimitiveRef> m_pendingRemoval;

    std::string m_lastMove;
};
