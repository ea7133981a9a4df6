#include "editor_ui.h"
#include "scene_renderer.h"

#include <glint/core/camera.h>
#include <glint/core/engine.h>
#include <glint/core/log.h>
#include <glint/graphics/graphics_context.h>
#include <glint/picking/picker.h>
#include <glint/scene/scene_store.h>

#include <imgui.h>

#include <cstdio>
#include <iterator>
#include <string>

static constexpr glint::PrimitiveType ALL_TYPES[] = {
    glint::PrimitiveType::Sphere, glint::PrimitiveType::Box, glint::PrimitiveType::Torus
};

static std::string primitiveLabel(const glint::PrimitiveRef& ref)
{
    return std::string(glint::toString(ref.type)) + " " + std::to_string(ref.slot);
}

bool EditorUI::consumePickRequest(int& outX, int& outY)
{
    if (!m_pickRequested)
        return false;

    m_pickRequested = false;
    outX = m_pickX;
    outY = m_pickY;
    return true;
}

bool EditorUI::consumeRemoveRequest(glint::PrimitiveRef& outRef)
{
    if (!m_pendingRemoval)
        return false;

    outRef = *m_pendingRemoval;
    m_pendingRemoval.reset();
    return true;
}

void EditorUI::setLastMove(const glint::PrimitiveRef& ref, const glm::vec3& position)
{
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s -> (%.2f, %.2f, %.2f)",
                  primitiveLabel(ref).c_str(), position.x, position.y, position.z);
    m_lastMove = buf;
}

void EditorUI::renderViewport(SceneRenderer& renderer)
{
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
    ImGui::Begin("Viewport");
    ImGui::PopStyleVar();

    m_viewportHovered = ImGui::IsWindowHovered();

    ImVec2 size = ImGui::GetContentRegionAvail();
    uint32_t w = static_cast<uint32_t>(size.x);
    uint32_t h = static_cast<uint32_t>(size.y);

    if (w > 0 && h > 0)
    {
        renderer.resize(w, h);

        ImVec2 cursor = ImGui::GetCursorScreenPos();
        uintptr_t handle = renderer.getDisplayHandle();

        if (handle == 0)
        {
            // Shader failed to build: show the diagnostic instead of a stale frame
            ImGui::Dummy(size);
            ImGui::SetCursorScreenPos(ImVec2(cursor.x + 12.0f, cursor.y + 12.0f));
            ImGui::BeginGroup();
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
            ImGui::TextUnformatted("GPU raymarch pass disabled");
            ImGui::PopStyleColor();
            ImGui::PushTextWrapPos(cursor.x + size.x - 12.0f);
            const std::string& error = renderer.getShaderError();
            ImGui::TextUnformatted(error.empty() ? "No frame rendered yet" : error.c_str());
            ImGui::PopTextWrapPos();
            if (ImGui::Button("Reload Shaders (F5)"))
                renderer.reloadShaders();
            ImGui::EndGroup();
        }
        else
        {
            if (renderer.displayFlipsUV())
            {
                ImGui::Image(
                    static_cast<ImTextureID>(handle),
                    size,
                    ImVec2(0, 1), ImVec2(1, 0) // flip Y for OpenGL
                );
            }
            else
            {
                ImGui::Image(static_cast<ImTextureID>(handle), size);
            }

            if (ImGui::IsItemHovered() && ImGui::IsMouseClicked(ImGuiMouseButton_Left))
            {
                ImVec2 mouse = ImGui::GetMousePos();
                m_pickX = static_cast<int>(mouse.x - cursor.x);
                m_pickY = static_cast<int>(mouse.y - cursor.y);
                m_pickRequested = true;
            }
        }
    }

    ImGui::End();
}

void EditorUI::renderHierarchy(glint::SceneStore& store, glint::Picker& picker,
                               const glint::Camera& camera)
{
    ImGui::Begin("Hierarchy");

    auto selection = picker.getSelection();

    for (glint::PrimitiveType type : ALL_TYPES)
    {
        ImGui::PushID(static_cast<int>(type));

        int count = store.count(type);
        char header[48];
        std::snprintf(header, sizeof(header), "%ss (%d/%d)", glint::toString(type), count,
                      glint::PRIMITIVE_CAPACITY);

        bool open = ImGui::TreeNodeEx(header, ImGuiTreeNodeFlags_DefaultOpen);

        ImGui::SameLine(ImGui::GetContentRegionMax().x - 40.0f);
        ImGui::BeginDisabled(store.isFull(type));
        if (ImGui::SmallButton("Add"))
        {
            int slot = store.addPrimitive(type);
            if (slot >= 0)
                picker.select({ type, slot }, camera);
        }
        ImGui::EndDisabled();

        if (open)
        {
            for (int slot = 0; slot < count; ++slot)
            {
                glint::PrimitiveRef ref{ type, slot };
                bool selected = selection && *selection == ref;

                ImGui::PushID(slot);
                std::string label = primitiveLabel(ref);
                if (auto mode = store.getParam(type, slot, glint::PrimitiveParam::BlendMode))
                {
                    auto blend = glint::blendModeFromIndex(static_cast<int>(*mode));
                    if (blend && *blend != glint::BlendMode::Union)
                        label += std::string("  [") + glint::toString(*blend) + "]";
                }

                if (ImGui::Selectable(label.c_str(), selected))
                    picker.select(ref, camera);

                if (ImGui::BeginPopupContextItem())
                {
                    if (ImGui::MenuItem("Remove", "Del"))
                        m_pendingRemoval = ref;
                    ImGui::EndPopup();
                }
                ImGui::PopID();
            }
            ImGui::TreePop();
        }

        ImGui::PopID();
    }

    ImGui::Separator();

    ImGui::BeginDisabled(!selection.has_value());
    if (ImGui::Button("Remove Selected") && selection)
        m_pendingRemoval = *selection;
    ImGui::EndDisabled();

    ImGui::End();
}

// One float field through setParam; a rejected value is logged by the store and not applied
static void editParam(glint::SceneStore& store, const glint::PrimitiveRef& ref,
                      glint::PrimitiveParam param, float speed, float minValue, float maxValue)
{
    auto value = store.getParam(ref.type, ref.slot, param);
    if (!value)
        return;

    float v = *value;
    if (ImGui::DragFloat(glint::toString(param), &v, speed, minValue, maxValue, "%.3f"))
        store.setParam(ref.type, ref.slot, param, v);
}

void EditorUI::renderInspector(glint::SceneStore& store, glint::Picker& picker)
{
    ImGui::Begin("Inspector");

    auto selection = picker.getSelection();
    if (!selection || !store.isValid(*selection))
    {
        ImGui::TextDisabled("Nothing selected");
        ImGui::End();
        return;
    }

    const glint::PrimitiveRef ref = *selection;
    ImGui::Text("%s", primitiveLabel(ref).c_str());
    ImGui::TextDisabled("State: %s", glint::toString(picker.getState()));

    ImGui::SeparatorText("Transform");
    editParam(store, ref, glint::PrimitiveParam::CenterX, 0.01f, -50.0f, 50.0f);
    editParam(store, ref, glint::PrimitiveParam::CenterY, 0.01f, -50.0f, 50.0f);
    editParam(store, ref, glint::PrimitiveParam::CenterZ, 0.01f, -50.0f, 50.0f);

    ImGui::SeparatorText("Shape");
    switch (ref.type)
    {
        case glint::PrimitiveType::Sphere:
            editParam(store, ref, glint::PrimitiveParam::Radius, 0.005f, 0.0f, 20.0f);
            break;
        case glint::PrimitiveType::Box:
            editParam(store, ref, glint::PrimitiveParam::HalfExtentX, 0.005f, 0.0f, 20.0f);
            editParam(store, ref, glint::PrimitiveParam::HalfExtentY, 0.005f, 0.0f, 20.0f);
            editParam(store, ref, glint::PrimitiveParam::HalfExtentZ, 0.005f, 0.0f, 20.0f);
            break;
        case glint::PrimitiveType::Torus:
            editParam(store, ref, glint::PrimitiveParam::MajorRadius, 0.005f, 0.0f, 20.0f);
            editParam(store, ref, glint::PrimitiveParam::MinorRadius, 0.005f, 0.0f, 20.0f);
            break;
    }

    ImGui::SeparatorText("Material");
    if (auto color = store.getColor(ref))
    {
        glm::vec3 c = *color;
        if (ImGui::ColorEdit3("Color", &c.x))
        {
            const glint::PrimitiveParam channels[] = {
                glint::PrimitiveParam::ColorR, glint::PrimitiveParam::ColorG, glint::PrimitiveParam::ColorB
            };
            for (int i = 0; i < 3; ++i)
            {
                if (c[i] != (*color)[i])
                    store.setParam(ref.type, ref.slot, channels[i], c[i]);
            }
        }
    }

    ImGui::SeparatorText("Blending");
    if (auto mode = store.getParam(ref.type, ref.slot, glint::PrimitiveParam::BlendMode))
    {
        const char* modes[glint::BLEND_MODE_COUNT];
        for (int i = 0; i < glint::BLEND_MODE_COUNT; ++i)
            modes[i] = glint::toString(*glint::blendModeFromIndex(i));

        int index = static_cast<int>(*mode);
        if (ImGui::Combo("Blend Mode", &index, modes, glint::BLEND_MODE_COUNT))
            store.setParam(ref.type, ref.slot, glint::PrimitiveParam::BlendMode,
                           static_cast<float>(index));

        ImGui::BeginDisabled(index != static_cast<int>(glint::BlendMode::SmoothUnion));
        editParam(store, ref, glint::PrimitiveParam::BlendStrength, 0.005f, 0.0f, 5.0f);
        ImGui::EndDisabled();
    }

    ImGui::End();
}

void EditorUI::renderSettings(SceneRenderer& renderer)
{
    ImGui::Begin("Settings");

    const char* renderModes[] = { "CPU Raymarching", "GPU Raymarching" };
    int modeIndex = static_cast<int>(renderer.getRenderMode());
    if (ImGui::Combo("Render Mode", &modeIndex, renderModes, static_cast<int>(std::size(renderModes))))
        renderer.setRenderMode(static_cast<RenderMode>(modeIndex));

    if (renderer.getRenderMode() == RenderMode::GPURaymarch)
    {
        if (ImGui::SmallButton("Reload Shaders (F5)"))
            renderer.reloadShaders();

        const std::string& error = renderer.getShaderError();
        if (!error.empty())
        {
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.4f, 0.4f, 1.0f));
            ImGui::TextWrapped("%s", error.c_str());
            ImGui::PopStyleColor();
        }
    }

    ImGui::SeparatorText("Marching");
    {
        glint::MarchSettings march = renderer.getMarchSettings();
        bool changed = false;
        changed |= ImGui::SliderInt("Max Steps", &march.maxSteps, 8, 1024);
        changed |= ImGui::DragFloat("Surface Distance", &march.surfDist, 0.0001f, 0.00001f, 0.1f, "%.5f");
        changed |= ImGui::DragFloat("Max Distance", &march.maxDist, 0.5f, 1.0f, 1000.0f, "%.1f");
        if (changed)
            renderer.setMarchSettings(march);
    }

    {
        const char* rules[] = { glint::toString(glint::SmoothPropagation::PreviousTerm),
                                glint::toString(glint::SmoothPropagation::WithinRadius) };
        int rule = static_cast<int>(renderer.getSmoothPropagation());
        if (ImGui::Combo("Smooth Blend", &rule, rules, static_cast<int>(std::size(rules))))
            renderer.setSmoothPropagation(static_cast<glint::SmoothPropagation>(rule));
        if (ImGui::IsItemHovered())
            ImGui::SetTooltip("Within Radius also blends later plain unions near a smooth primitive");
    }

    ImGui::SeparatorText("Lighting");
    {
        glint::ShadingSettings shading = renderer.getShadingSettings();
        bool changed = false;
        changed |= ImGui::DragFloat3("Light Position", &shading.lightPosition.x, 0.05f);
        changed |= ImGui::SliderFloat("Ambient", &shading.ambient, 0.0f, 1.0f, "%.2f");
        changed |= ImGui::Checkbox("Shadows", &shading.shadows);
        changed |= ImGui::SliderFloat("Shadow Factor", &shading.shadowFactor, 0.0f, 1.0f, "%.2f");
        changed |= ImGui::DragFloat("Shadow Offset", &shading.shadowOffset, 0.001f, 0.001f, 0.5f, "%.3f");
        changed |= ImGui::SliderInt("Shadow Steps", &shading.shadowSteps, 1, 256);

        ImGui::SeparatorText("Atmosphere");
        changed |= ImGui::SliderFloat("Fog Density", &shading.fogDensity, 0.0f, 0.2f, "%.3f");
        changed |= ImGui::ColorEdit3("Sky Top", &shading.skyTop.x);
        changed |= ImGui::ColorEdit3("Sky Bottom", &shading.skyBottom.x);

        ImGui::SeparatorText("Post Processing");
        changed |= ImGui::SliderFloat("Gamma", &shading.gamma, 1.0f, 3.0f, "%.2f");

        if (changed)
            renderer.setShadingSettings(shading);
    }

    ImGui::End();
}

void EditorUI::renderConsole()
{
    ImGui::Begin("Console");

    if (ImGui::Button("Clear"))
        glint::Log::clear();

    ImGui::Separator();

    ImGui::BeginChild("LogScroll", ImVec2(0, 0), false, ImGuiWindowFlags_HorizontalScrollbar);

    for (const auto& entry : glint::Log::getEntries())
    {
        ImVec4 color;
        const char* prefix;
        switch (entry.level)
        {
            case glint::Log::Level::Warn:
                color = { 1.0f, 0.8f, 0.0f, 1.0f };
                prefix = "[WARN] ";
                break;
            case glint::Log::Level::Error:
                color = { 1.0f, 0.3f, 0.3f, 1.0f };
                prefix = "[ERROR] ";
                break;
            default:
                color = { 0.8f, 0.8f, 0.8f, 1.0f };
                prefix = "[INFO] ";
                break;
        }
        // Dim timestamp
        char tsBuf[16];
        std::snprintf(tsBuf, sizeof(tsBuf), "[%7.3fs] ", entry.timestamp);
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.45f, 0.45f, 0.45f, 1.0f));
        ImGui::TextUnformatted(tsBuf);
        ImGui::PopStyleColor();
        ImGui::SameLine(0.0f, 0.0f);

        ImGui::PushStyleColor(ImGuiCol_Text, color);
        ImGui::TextUnformatted(prefix);
        ImGui::SameLine(0.0f, 0.0f);
        ImGui::TextUnformatted(entry.message.c_str());
        ImGui::PopStyleColor();
    }

    if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
        ImGui::SetScrollHereY(1.0f);

    ImGui::EndChild();

    ImGui::End();
}

void EditorUI::renderStats(SceneRenderer& renderer, const glint::SceneStore& store,
                           const glint::Picker& picker, const glint::Engine& engine)
{
    ImGui::Begin("Stats");

    const glint::GraphicsContext& ctx = engine.getGraphicsContext();
    float dt = engine.getDeltaTime();

    ImGui::SeparatorText("Performance");
    ImGui::Text("FPS:        %.1f", dt > 0.0f ? 1.0f / dt : 0.0f);
    ImGui::Text("Frame time: %.2f ms", dt * 1000.0f);
    ImGui::Text("Frame:      %llu", static_cast<unsigned long long>(engine.getFrameIndex()));
    ImGui::Text("Render:     %.2f ms", renderer.getLastRenderMs());
    if (renderer.getRenderMode() == RenderMode::CPURaymarch)
        ImGui::Text("Avg steps:  %.1f", renderer.getAverageSteps());

    ImGui::SeparatorText("Scene");
    ImGui::Text("Spheres:    %d / %d", store.count(glint::PrimitiveType::Sphere), glint::PRIMITIVE_CAPACITY);
    ImGui::Text("Boxes:      %d / %d", store.count(glint::PrimitiveType::Box), glint::PRIMITIVE_CAPACITY);
    ImGui::Text("Tori:       %d / %d", store.count(glint::PrimitiveType::Torus), glint::PRIMITIVE_CAPACITY);
    ImGui::Text("Revision:   %llu", static_cast<unsigned long long>(store.revision()));
    ImGui::Text("Uploads:    %llu", static_cast<unsigned long long>(renderer.getSceneUploads()));

    ImGui::SeparatorText("Picking");
    ImGui::Text("State:      %s", glint::toString(picker.getState()));
    ImGui::Text("Superseded: %u", picker.getSupersededCount());
    if (!m_lastMove.empty())
        ImGui::Text("Last move:  %s", m_lastMove.c_str());

    ImGui::SeparatorText("Renderer");
    ImGui::Text("Backend:    %.*s", static_cast<int>(ctx.backendName().size()), ctx.backendName().data());
    std::string device = ctx.deviceName();
    if (!device.empty())
        ImGui::TextWrapped("Device:     %s", device.c_str());
    ImGui::Text("Mode:       %s", toString(renderer.getRenderMode()));
    ImGui::Text("Resolution: %u x %u", renderer.getWidth(), renderer.getHeight());

    ImGui::End();
}
