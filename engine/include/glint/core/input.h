#pragma once

struct GLFWwindow;

namespace glint
{

enum class MouseButton { None, Left, Right, Middle };

class Input
{
public:
    static bool isMouseButtonPressed(GLFWwindow* window, MouseButton button);
    static void getCursorPosition(GLFWwindow* window, double& x, double& y);
};

// Per-frame edge and delta tracking for one mouse button
class MouseTracker
{
public:
    explicit MouseTracker(MouseButton button) : m_button(button) {}

    void update(GLFWwindow* window);

    bool isDown() const { return m_down; }
    bool wasPressed() const { return m_down && !m_wasDown; }
    bool wasReleased() const { return !m_down && m_wasDown; }

    double getX() const { return m_x; }
    double getY() const { return m_y; }
    float getDeltaX() const { return m_dx; }
    float getDeltaY() const { return m_dy; }

private:
    MouseButton m_button;
    bool m_down = false;
    bool m_wasDown = false;
    bool m_hasPosition = false;
    double m_x = 0.0, m_y = 0.0;
    float m_dx = 0.0f, m_dy = 0.0f;
};

} // namespace glint
