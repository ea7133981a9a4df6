#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace glint
{

class Window;
class GraphicsContext;
class UILayer;

struct EngineConfig
{
    uint32_t windowWidth = 1280;
    uint32_t windowHeight = 720;
    std::string title = "Glint";
    bool vsync = true;
    bool maximized = false;
};

class Engine
{
public:
    Engine();
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool init(const EngineConfig& config);
    void shutdown();

    void beginFrame();
    void endFrame();
    bool isRunning() const;

    // Seconds between the last two beginFrame() calls
    float getDeltaTime() const { return m_deltaTime; }
    uint64_t getFrameIndex() const { return m_frameIndex; }

    Window& getWindow() { return *m_window; }
    const Window& getWindow() const { return *m_window; }
    GraphicsContext& getGraphicsContext() { return *m_context; }
    const GraphicsContext& getGraphicsContext() const { return *m_context; }

private:
    std::unique_ptr<Window> m_window;
    std::unique_ptr<GraphicsContext> m_context;
    std::unique_ptr<UILayer> m_uiLayer;
    bool m_running = false;
    double m_lastFrameTime = 0.0;
    float m_deltaTime = 0.0f;
    uint64_t m_frameIndex = 0;
};

} // namespace glint
