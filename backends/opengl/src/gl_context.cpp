#include <glint/opengl/gl_context.h>
#include <glint/core/window.h>
#include <glint/core/log.h>

#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

namespace glint
{

std::unique_ptr<GraphicsContext> GraphicsContext::create()
{
    return std::make_unique<GLContext>();
}

std::function<void()> GLContext::getWindowHints() const
{
    // Compute shaders and glClearTexImage need 4.4+, the shaders target 4.6
    return []()
    {
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 6);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    };
}

bool GLContext::init(Window& window)
{
    m_window = &window;

    glfwMakeContextCurrent(window.getNativeWindow());
    glfwSwapInterval(window.isVsync() ? 1 : 0);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)))
    {
        Log::error("Failed to initialize GLAD");
        return false;
    }

    if (GLVersion.major < 4 || (GLVersion.major == 4 && GLVersion.minor < 6))
    {
        Log::error("OpenGL 4.6 is required, got " + std::to_string(GLVersion.major) + "."
                   + std::to_string(GLVersion.minor));
        return false;
    }

    m_renderer = reinterpret_cast<const char*>(glGetString(GL_RENDERER));
    Log::info("OpenGL Renderer: " + m_renderer);
    Log::info(std::string("OpenGL Version: ")
              + reinterpret_cast<const char*>(glGetString(GL_VERSION)));

    return true;
}

void GLContext::beginFrame()
{
    int w = static_cast<int>(m_window->getFramebufferWidth());
    int h = static_cast<int>(m_window->getFramebufferHeight());
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glViewport(0, 0, w, h);
    glClearColor(0.08f, 0.08f, 0.09f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void GLContext::endFrame()
{
    m_window->swapBuffers();
    m_window->pollEvents();
}

void GLContext::waitIdle()
{
    glFinish();
}

void GLContext::shutdown()
{
    m_window = nullptr;
}

void GLContext::imguiInit(GLFWwindow* window)
{
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 460");
}

void GLContext::imguiShutdown()
{
    ImGui_ImplOpenGL3_Shutdown();
}

void GLContext::imguiNewFrame()
{
    ImGui_ImplOpenGL3_NewFrame();
}

void GLContext::imguiRenderDrawData()
{
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

} // namespace glint
