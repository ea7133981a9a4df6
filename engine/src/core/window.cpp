#include <glint/core/window.h>
#include <glint/core/log.h>
#include <GLFW/glfw3.h>

namespace glint
{

Window::~Window()
{
    shutdown();
}

void Window::onErrorCallback(int code, const char* description)
{
    Log::error("GLFW error " + std::to_string(code) + ": " + (description ? description : ""));
}

bool Window::init(const WindowConfig& config, std::function<void()> preCreateHints)
{
    glfwSetErrorCallback(onErrorCallback);

    if (!glfwInit())
    {
        Log::error("Failed to initialize GLFW");
        return false;
    }
    m_glfwInitialized = true;

    if (preCreateHints)
        preCreateHints();

    glfwWindowHint(GLFW_MAXIMIZED, config.maximized ? GLFW_TRUE : GLFW_FALSE);

    m_window = glfwCreateWindow(
        static_cast<int>(config.width),
        static_cast<int>(config.height),
        config.title.c_str(),
        nullptr, nullptr
    );

    if (!m_window)
    {
        Log::error("Failed to create GLFW window");
        glfwTerminate();
        m_glfwInitialized = false;
        return false;
    }

    int w, h;
    glfwGetWindowSize(m_window, &w, &h);
    m_width = static_cast<uint32_t>(w);
    m_height = static_cast<uint32_t>(h);

    glfwGetFramebufferSize(m_window, &w, &h);
    m_fbWidth = static_cast<uint32_t>(w);
    m_fbHeight = static_cast<uint32_t>(h);

    glfwSetWindowUserPointer(m_window, this);
    glfwSetWindowSizeCallback(m_window, onWindowSizeCallback);
    glfwSetFramebufferSizeCallback(m_window, onFramebufferSizeCallback);
    glfwSetScrollCallback(m_window, onScrollCallback);

    // Swap interval needs a current context; the graphics context applies it
    m_vsync = config.vsync;

    Log::info("Window created: " + std::to_string(m_width) + "x" + std::to_string(m_height));
    return true;
}

void Window::shutdown()
{
    if (m_window)
    {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_glfwInitialized)
    {
        glfwTerminate();
        m_glfwInitialized = false;
    }
}

bool Window::shouldClose() const
{
    return m_window && glfwWindowShouldClose(m_window);
}

void Window::requestClose()
{
    if (m_window)
        glfwSetWindowShouldClose(m_window, GLFW_TRUE);
}

void Window::pollEvents()
{
    glfwPollEvents();
}

void Window::swapBuffers()
{
    if (m_window)
        glfwSwapBuffers(m_window);
}

void Window::setTitle(const std::string& title)
{
    if (m_window)
        glfwSetWindowTitle(m_window, title.c_str());
}

void Window::onWindowSizeCallback(GLFWwindow* window, int width, int height)
{
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (!self)
        return;

    self->m_width = static_cast<uint32_t>(width);
    self->m_height = static_cast<uint32_t>(height);
}

void Window::onFramebufferSizeCallback(GLFWwindow* window, int width, int height)
{
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (!self)
        return;

    self->m_fbWidth = static_cast<uint32_t>(width);
    self->m_fbHeight = static_cast<uint32_t>(height);

    if (self->m_resizeCallback)
        self->m_resizeCallback(self->m_fbWidth, self->m_fbHeight);
}

void Window::onScrollCallback(GLFWwindow* window, double /*xoffset*/, double yoffset)
{
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self && self->m_scrollCallback)
        self->m_scrollCallback(yoffset);
}

} // namespace glint
