#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

struct GLFWwindow;

namespace glint
{

class Window;

class GraphicsContext
{
public:
    virtual ~GraphicsContext() = default;

    virtual bool init(Window& window) = 0;
    virtual void shutdown() = 0;

    virtual void beginFrame() = 0;
    virtual void endFrame() = 0;

    virtual std::string_view backendName() const = 0;
    virtual std::string deviceName() const { return {}; }
    virtual std::function<void()> getWindowHints() const = 0;
    virtual void waitIdle() {}

    // ImGui backend integration, implemented by each backend
    virtual void imguiInit(GLFWwindow* window) = 0;
    virtual void imguiShutdown() = 0;
    virtual void imguiNewFrame() = 0;
    virtual void imguiRenderDrawData() = 0;

    static std::unique_ptr<GraphicsContext> create();
};

} // namespace glint
