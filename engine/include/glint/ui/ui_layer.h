#pragma once

namespace glint
{

class Window;
class GraphicsContext;

class UILayer
{
public:
    bool init(Window& window, GraphicsContext& context);
    void shutdown();

    void beginFrame();
    void endFrame();

    // Rebuild the default dock layout on the next frame
    void resetLayout() { m_layoutPending = true; }

private:
    void applyTheme();
    void buildDefaultLayout(unsigned int dockSpaceId);

    GraphicsContext* m_context = nullptr;
    bool m_initialized = false;
    bool m_layoutPending = true;
};

} // namespace glint
