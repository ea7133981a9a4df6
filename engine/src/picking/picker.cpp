#include <glint/picking/picker.h>
#include <glint/picking/id_pass.h>
#include <glint/core/camera.h>
#include <glint/core/log.h>
#include <glint/scene/object_id.h>
#include <glint/scene/scene_store.h>

#include <algorithm>
#include <string>

namespace glint
{

const char* toString(PickerState state)
{
    switch (state)
    {
        case PickerState::Idle:     return "Idle";
        case PickerState::Selected: return "Selected";
        case PickerState::Dragging: return "Dragging";
    }
    return "Unknown";
}

static std::string describe(const PrimitiveRef& ref)
{
    return std::string(toString(ref.type)) + " " + std::to_string(ref.slot);
}

Picker::Picker(SceneStore& store, IdPass& idPass)
    : m_store(store)
    , m_idPass(&idPass)
{
}

std::optional<PrimitiveRef> Picker::getSelection() const
{
    if (m_state == PickerState::Idle)
        return std::nullopt;
    return m_drag.ref;
}

std::optional<PrimitiveRef> Picker::pick(int x, int y, const Camera& camera)
{
    uint32_t w = m_idPass->getWidth();
    uint32_t h = m_idPass->getHeight();
    if (w == 0 || h == 0)
    {
        Log::warn("Pick ignored: identifier pass has no size");
        return std::nullopt;
    }

    if (!m_idPass->render(m_store, camera))
    {
        Log::error("Identifier pass failed: " + m_idPass->lastError());
        return std::nullopt;
    }

    auto px = static_cast<uint32_t>(std::clamp(x, 0, static_cast<int>(w) - 1));
    auto py = static_cast<uint32_t>(std::clamp(y, 0, static_cast<int>(h) - 1));

    uint8_t channel = m_idPass->readPixel(px, py);
    uint32_t id = ObjectId::fromUnorm(static_cast<float>(channel) / 255.0f);

    // A stale ID from a slot that no longer exists counts as empty space
    auto ref = ObjectId::decode(id);
    if (!ref || !m_store.isValid(*ref))
    {
        deselect();
        return std::nullopt;
    }

    setSelection(*ref, camera);
    return ref;
}

void Picker::requestPick(int x, int y)
{
    if (m_pending)
    {
        ++m_supersededCount;
        Log::info("Pick at (" + std::to_string(m_pending->x) + ", " + std::to_string(m_pending->y)
                  + ") superseded");
    }
    m_pending = PendingPick{ x, y };
}

bool Picker::processPendingPick(const Camera& camera)
{
    if (!m_pending)
        return false;

    PendingPick request = *m_pending;
    m_pending.reset();
    pick(request.x, request.y, camera);
    return true;
}

void Picker::setSelection(const PrimitiveRef& ref, const Camera& camera)
{
    bool changed = m_state == PickerState::Idle || !(m_drag.ref == ref);

    m_drag = DragState{};
    m_drag.ref = ref;
    m_drag.planePoint = m_store.getPosition(ref).value_or(glm::vec3(0.0f));
    m_drag.planeNormal = camera.getForward();
    m_state = PickerState::Selected;

    if (changed)
    {
        Log::info("Selected " + describe(ref));
        if (m_onSelected)
            m_onSelected(ref);
    }
}

bool Picker::select(const PrimitiveRef& ref, const Camera& camera)
{
    if (!m_store.isValid(ref))
        return false;

    setSelection(ref, camera);
    return true;
}

void Picker::deselect()
{
    if (m_state == PickerState::Idle)
        return;

    m_state = PickerState::Idle;
    m_drag = DragState{};
    if (m_onSelected)
        m_onSelected(std::nullopt);
}

bool Picker::beginDrag(const Camera& camera)
{
    if (m_state != PickerState::Selected)
        return false;

    // Re-capture the plane; the camera may have orbited since the selection
    m_drag.planePoint = m_store.getPosition(m_drag.ref).value_or(m_drag.planePoint);
    m_drag.planeNormal = camera.getForward();
    m_drag.pending = glm::vec2(0.0f);
    m_drag.armed = true;
    return true;
}

bool Picker::updateDrag(float dx, float dy, const Camera& camera)
{
    if (m_state == PickerState::Idle || !m_drag.armed)
        return false;

    if (!m_store.isValid(m_drag.ref))
    {
        deselect();
        return false;
    }

    if (m_state == PickerState::Selected)
    {
        m_drag.pending += glm::vec2(dx, dy);
        if (glm::length(m_drag.pending) < DRAG_THRESHOLD_PX)
            return false;

        // Apply everything accumulated so far, the object catches up with the pointer
        m_state = PickerState::Dragging;
        dx = m_drag.pending.x;
        dy = m_drag.pending.y;
        m_drag.pending = glm::vec2(0.0f);
    }

    return moveSelection(dx, dy, camera);
}

bool Picker::moveSelection(float dx, float dy, const Camera& camera)
{
    auto position = m_store.getPosition(m_drag.ref);
    if (!position)
        return false;

    glm::vec3 newPosition = *position + dragOffset(dx, dy, m_drag.planeNormal, camera.getPosition());
    if (!m_store.setPosition(m_drag.ref, newPosition))
        return false;

    if (m_onMoved)
        m_onMoved(m_drag.ref, newPosition);
    return true;
}

void Picker::endDrag()
{
    m_drag.armed = false;
    m_drag.pending = glm::vec2(0.0f);

    if (m_state == PickerState::Dragging)
    {
        m_state = PickerState::Selected;
        if (auto pos = m_store.getPosition(m_drag.ref))
            Log::info("Moved " + describe(m_drag.ref) + " to (" + std::to_string(pos->x) + ", "
                      + std::to_string(pos->y) + ", " + std::to_string(pos->z) + ")");
    }
}

void Picker::validateSelection()
{
    if (m_state != PickerState::Idle && !m_store.isValid(m_drag.ref))
        deselect();
}

glm::vec3 Picker::dragOffset(float dx, float dy, const glm::vec3& cameraForward,
                             const glm::vec3& cameraPosition)
{
    // cross(forward, worldUp) flattened onto the ground plane
    glm::vec3 right(-cameraForward.z, 0.0f, cameraForward.x);
    float len = glm::length(right);
    right = len > 1e-6f ? right / len : glm::vec3(0.0f);

    const glm::vec3 up(0.0f, 1.0f, 0.0f);
    float scale = DRAG_SENSITIVITY * glm::length(cameraPosition);

    return right * (dx * scale) - up * (dy * scale);
}

} // namespace glint
