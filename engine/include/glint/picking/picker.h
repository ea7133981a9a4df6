#pragma once

#include <glint/scene/primitive.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace glint
{

class Camera;
class IdPass;
class SceneStore;

enum class PickerState { Idle, Selected, Dragging };

const char* toString(PickerState state);

struct DragState
{
    PrimitiveRef ref;
    glm::vec3 planePoint{0.0f};  // object center when the drag plane was captured
    glm::vec3 planeNormal{0.0f}; // camera forward at the same moment
    glm::vec2 pending{0.0f};     // pointer motion held back until the threshold
    bool armed = false;          // pointer is down on the selection
};

// Click-to-select and drag-to-move on top of an identifier pass.
//
//   Idle --pick hit--> Selected --motion >= DRAG_THRESHOLD_PX--> Dragging
//   Dragging --endDrag--> Selected, any state --pick miss / deselect--> Idle
//
// Drag motion moves the object along the camera's horizontal right vector and
// world up, scaled by DRAG_SENSITIVITY * |camera position| so the on-screen
// speed does not depend on how far the camera is.
class Picker
{
public:
    static constexpr float DRAG_THRESHOLD_PX = 3.0f;
    static constexpr float DRAG_SENSITIVITY = 0.002f;

    using SelectedCallback = std::function<void(const std::optional<PrimitiveRef>&)>;
    using MovedCallback = std::function<void(const PrimitiveRef&, const glm::vec3&)>;

    Picker(SceneStore& store, IdPass& idPass);

    // Switch passes when the render path changes; the selection is kept
    void setIdPass(IdPass& idPass) { m_idPass = &idPass; }
    IdPass& getIdPass() const { return *m_idPass; }

    // Runs the identifier pass now and resolves (x, y), clamped into the pass bounds
    std::optional<PrimitiveRef> pick(int x, int y, const Camera& camera);

    // Queue a pick for the next processPendingPick(); a newer request replaces an older one
    void requestPick(int x, int y);
    bool hasPendingPick() const { return m_pending.has_value(); }
    bool processPendingPick(const Camera& camera);
    uint32_t getSupersededCount() const { return m_supersededCount; }

    // Selection without a pick, e.g. from a hierarchy list
    bool select(const PrimitiveRef& ref, const Camera& camera);
    void deselect();

    bool beginDrag(const Camera& camera);
    bool updateDrag(float dx, float dy, const Camera& camera);
    void endDrag();

    // Drops the selection when its slot no longer exists (after a removal)
    void validateSelection();

    PickerState getState() const { return m_state; }
    std::optional<PrimitiveRef> getSelection() const;
    const DragState& getDragState() const { return m_drag; }

    void setOnObjectSelected(SelectedCallback cb) { m_onSelected = std::move(cb); }
    void setOnObjectMoved(MovedCallback cb) { m_onMoved = std::move(cb); }

    // World-space displacement for a pointer delta in pixels
    static glm::vec3 dragOffset(float dx, float dy, const glm::vec3& cameraForward,
                                const glm::vec3& cameraPosition);

private:
    struct PendingPick
    {
        int x = 0;
        int y = 0;
    };

    void setSelection(const PrimitiveRef& ref, const Camera& camera);
    bool moveSelection(float dx, float dy, const Camera& camera);

    SceneStore& m_store;
    IdPass* m_idPass;

    PickerState m_state = PickerState::Idle;
    DragState m_drag;
    std::optional<PendingPick> m_pending;
    uint32_t m_supersededCount = 0;

    SelectedCallback m_onSelected;
    MovedCallback m_onMoved;
};

} // namespace glint
