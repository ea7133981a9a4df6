#pragma once

#include <cstdint>
#include <functional>
#include <string>

struct GLFWwindow;

namespace glint
{

struct WindowConfig
{
    uint32_t width = 1280;
    uint32_t height = 720;
    std::string title = "Glint";
    bool maximized = false;
    bool vsync = true;
};

class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool init(const WindowConfig& config, std::function<void()> preCreateHints = nullptr);
    void shutdown();

    bool shouldClose() const;
    void requestClose();
    void pollEvents();
    void swapBuffers();
    void setTitle(const std::string& title);

    GLFWwindow* getNativeWindow() const { return m_window; }
    uint32_t getWidth() const { return m_width; }
    uint32_t getHeight() const { return m_height; }

    // Size in pixels (differs from the window size on HiDPI displays)
    uint32_t getFramebufferWidth() const { return m_fbWidth; }
    uint32_t getFramebufferHeight() const { return m_fbHeight; }
    bool isVsync() const { return m_vsync; }

    using ResizeCallback = std::function<void(uint32_t, uint32_t)>;
    using ScrollCallback = std::function<void(double)>;

    void setResizeCallback(ResizeCallback cb) { m_resizeCallback = std::move(cb); }
    void setScrollCallback(ScrollCallback cb) { m_scrollCallback = std::move(cb); }

private:
    GLFWwindow* m_window = nullptr;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    uint32_t m_fbWidth = 0;
    uint32_t m_fbHeight = 0;
    bool m_vsync = true;
    bool m_glfwInitialized = false;
    ResizeCallback m_resizeCallback;
    ScrollCallback m_scrollCallback;

    static void onErrorCallback(int code, const char* description);
    static void onWindowSizeCallback(GLFWwindow* window, int width, int height);
    static void onFramebufferSizeCallback(GLFWwindow* window, int width, int height);
    static void onScrollCallback(GLFWwindow* window, double xoffset, double yoffset);
};

} // namespace glint
