#pragma once

#include <glint/graphics/graphics_context.h>

namespace glint
{

class GLContext : public GraphicsContext
{
public:
    bool init(Window& window) override;
    void shutdown() override;
    void beginFrame() override;
    void endFrame() override;
    std::string_view backendName() const override { return "OpenGL"; }
    std::string deviceName() const override { return m_renderer; }
    std::function<void()> getWindowHints() const override;
    void waitIdle() override;

    void imguiInit(GLFWwindow* window) override;
    void imguiShutdown() override;
    void imguiNewFrame() override;
    void imguiRenderDrawData() override;

private:
    Window* m_window = nullptr;
    std::string m_renderer;
};

} // namespace glint
