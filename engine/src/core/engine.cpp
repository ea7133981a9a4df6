#include <glint/core/engine.h>
#include <glint/core/window.h>
#include <glint/core/log.h>
#include <glint/graphics/graphics_context.h>
#include <glint/ui/ui_layer.h>

#include <GLFW/glfw3.h>

namespace glint
{

Engine::Engine() = default;

Engine::~Engine()
{
    shutdown();
}

bool Engine::init(const EngineConfig& config)
{
    m_context = GraphicsContext::create();
    if (!m_context)
    {
        Log::error("Failed to create graphics context");
        return false;
    }

    Log::info(std::string("Using backend: ") + std::string(m_context->backendName()));

    m_window = std::make_unique<Window>();

    WindowConfig windowConfig;
    windowConfig.width = config.windowWidth;
    windowConfig.height = config.windowHeight;
    windowConfig.title = config.title;
    windowConfig.vsync = config.vsync;
    windowConfig.maximized = config.maximized;

    if (!m_window->init(windowConfig, m_context->getWindowHints()))
    {
        Log::error("Failed to initialize window");
        return false;
    }

    if (!m_context->init(*m_window))
    {
        Log::error("Failed to initialize graphics context");
        return false;
    }

    m_uiLayer = std::make_unique<UILayer>();
    if (!m_uiLayer->init(*m_window, *m_context))
    {
        Log::error("Failed to initialize UI layer");
        return false;
    }

    m_lastFrameTime = glfwGetTime();
    m_running = true;
    Log::info("Glint initialized");
    return true;
}

void Engine::beginFrame()
{
    double now = glfwGetTime();
    m_deltaTime = static_cast<float>(now - m_lastFrameTime);
    m_lastFrameTime = now;
    ++m_frameIndex;

    m_context->beginFrame();
    m_uiLayer->beginFrame();
}

void Engine::endFrame()
{
    m_uiLayer->endFrame();
    m_context->endFrame();
}

bool Engine::isRunning() const
{
    return m_running && !m_window->shouldClose();
}

void Engine::shutdown()
{
    if (!m_running)
        return;

    m_running = false;

    if (m_uiLayer)
    {
        m_uiLayer->shutdown();
        m_uiLayer.reset();
    }

    if (m_context)
    {
        m_context->shutdown();
        m_context.reset();
    }

    if (m_window)
    {
        m_window->shutdown();
        m_window.reset();
    }

    Log::info("Glint shut down");
}

} // namespace glint
