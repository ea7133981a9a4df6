#include <glint/ui/ui_layer.h>
#include <glint/core/window.h>
#include <glint/core/log.h>
#include <glint/graphics/graphics_context.h>

#include <imgui.h>
#include <imgui_internal.h>
#include <imgui_impl_glfw.h>

#include <GLFW/glfw3.h>

namespace glint
{

bool UILayer::init(Window& window, GraphicsContext& context)
{
    m_context = &context;

    IMGUI_CHECKVERSION();
    if (!ImGui::CreateContext())
    {
        Log::error("Failed to create ImGui context");
        return false;
    }

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
    io.IniFilename = "glint_layout.ini";

    applyTheme();

    context.imguiInit(window.getNativeWindow());
    m_initialized = true;

    return true;
}

void UILayer::applyTheme()
{
    ImGui::StyleColorsDark();

    // Neutral grays with a cyan accent for active widgets
    auto& colors = ImGui::GetStyle().Colors;
    colors[ImGuiCol_WindowBg]           = { 0.09f, 0.09f, 0.10f, 1.0f };
    colors[ImGuiCol_Header]             = { 0.18f, 0.20f, 0.22f, 1.0f };
    colors[ImGuiCol_HeaderHovered]      = { 0.22f, 0.32f, 0.36f, 1.0f };
    colors[ImGuiCol_HeaderActive]       = { 0.16f, 0.42f, 0.48f, 1.0f };
    colors[ImGuiCol_Button]             = { 0.18f, 0.20f, 0.22f, 1.0f };
    colors[ImGuiCol_ButtonHovered]      = { 0.22f, 0.32f, 0.36f, 1.0f };
    colors[ImGuiCol_ButtonActive]       = { 0.16f, 0.42f, 0.48f, 1.0f };
    colors[ImGuiCol_FrameBg]            = { 0.15f, 0.16f, 0.17f, 1.0f };
    colors[ImGuiCol_FrameBgHovered]     = { 0.20f, 0.24f, 0.26f, 1.0f };
    colors[ImGuiCol_FrameBgActive]      = { 0.16f, 0.30f, 0.34f, 1.0f };
    colors[ImGuiCol_SliderGrab]         = { 0.30f, 0.70f, 0.78f, 1.0f };
    colors[ImGuiCol_CheckMark]          = { 0.30f, 0.70f, 0.78f, 1.0f };
    colors[ImGuiCol_Tab]                = { 0.12f, 0.13f, 0.14f, 1.0f };
    colors[ImGuiCol_TabHovered]         = { 0.22f, 0.32f, 0.36f, 1.0f };
    colors[ImGuiCol_TabActive]          = { 0.18f, 0.26f, 0.29f, 1.0f };
    colors[ImGuiCol_TitleBg]            = { 0.12f, 0.13f, 0.14f, 1.0f };
    colors[ImGuiCol_TitleBgActive]      = { 0.12f, 0.13f, 0.14f, 1.0f };

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;
}

void UILayer::shutdown()
{
    if (!m_initialized)
        return;

    if (m_context)
        m_context->imguiShutdown();

    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    m_context = nullptr;
    m_initialized = false;
}

void UILayer::beginFrame()
{
    m_context->imguiNewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    ImGuiWindowFlags windowFlags =
        ImGuiWindowFlags_NoDocking | ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoNavFocus | ImGuiWindowFlags_NoBackground;

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->Pos);
    ImGui::SetNextWindowSize(viewport->Size);
    ImGui::SetNextWindowViewport(viewport->ID);

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));

    ImGui::Begin("GlintDockHost", nullptr, windowFlags);
    ImGui::PopStyleVar(3);

    ImGuiID dockSpaceId = ImGui::GetID("GlintDockSpace");

    // Only lay out from scratch when no saved layout exists for this dockspace
    if (m_layoutPending)
    {
        m_layoutPending = false;
        if (ImGui::DockBuilderGetNode(dockSpaceId) == nullptr)
            buildDefaultLayout(dockSpaceId);
    }

    ImGui::DockSpace(dockSpaceId, ImVec2(0.0f, 0.0f), ImGuiDockNodeFlags_PassthruCentralNode);
    ImGui::End();
}

void UILayer::buildDefaultLayout(unsigned int dockSpaceId)
{
    ImGuiViewport* viewport = ImGui::GetMainViewport();

    ImGui::DockBuilderRemoveNode(dockSpaceId);
    ImGui::DockBuilderAddNode(dockSpaceId, ImGuiDockNodeFlags_DockSpace);
    ImGui::DockBuilderSetNodeSize(dockSpaceId, viewport->Size);

    ImGuiID dockMain = dockSpaceId;

    ImGuiID dockBottom = ImGui::DockBuilderSplitNode(dockMain, ImGuiDir_Down,  0.24f, nullptr, &dockMain);
    ImGuiID dockLeft   = ImGui::DockBuilderSplitNode(dockMain, ImGuiDir_Left,  0.18f, nullptr, &dockMain);
    ImGuiID dockRight  = ImGui::DockBuilderSplitNode(dockMain, ImGuiDir_Right, 0.28f, nullptr, &dockMain);

    // Inspector above Settings, Console beside Stats
    ImGuiID dockRightBottom;
    ImGui::DockBuilderSplitNode(dockRight, ImGuiDir_Down, 0.50f, &dockRightBottom, &dockRight);
    ImGuiID dockBottomRight;
    ImGui::DockBuilderSplitNode(dockBottom, ImGuiDir_Right, 0.30f, &dockBottomRight, &dockBottom);

    ImGui::DockBuilderDockWindow("Viewport",  dockMain);
    ImGui::DockBuilderDockWindow("Hierarchy", dockLeft);
    ImGui::DockBuilderDockWindow("Inspector", dockRight);
    ImGui::DockBuilderDockWindow("Settings",  dockRightBottom);
    ImGui::DockBuilderDockWindow("Console",   dockBottom);
    ImGui::DockBuilderDockWindow("Stats",     dockBottomRight);

    ImGui::DockBuilderFinish(dockSpaceId);
}

void UILayer::endFrame()
{
    ImGui::Render();
    m_context->imguiRenderDrawData();
}

} // namespace glint
