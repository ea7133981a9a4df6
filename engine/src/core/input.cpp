#include <glint/core/input.h>
#include <GLFW/glfw3.h>

namespace glint
{

bool Input::isMouseButtonPressed(GLFWwindow* window, MouseButton button)
{
    int glfwButton = GLFW_MOUSE_BUTTON_LEFT;
    switch (button)
    {
        case MouseButton::Left:   glfwButton = GLFW_MOUSE_BUTTON_LEFT;   break;
        case MouseButton::Right:  glfwButton = GLFW_MOUSE_BUTTON_RIGHT;  break;
        case MouseButton::Middle: glfwButton = GLFW_MOUSE_BUTTON_MIDDLE; break;
        default: return false;
    }
    return glfwGetMouseButton(window, glfwButton) == GLFW_PRESS;
}

void Input::getCursorPosition(GLFWwindow* window, double& x, double& y)
{
    glfwGetCursorPos(window, &x, &y);
}

void MouseTracker::update(GLFWwindow* window)
{
    double x, y;
    Input::getCursorPosition(window, x, y);

    m_wasDown = m_down;
    m_down = Input::isMouseButtonPressed(window, m_button);

    // Deltas only accumulate while held, starting from the press position
    if (m_down && m_wasDown && m_hasPosition)
    {
        m_dx = static_cast<float>(x - m_x);
        m_dy = static_cast<float>(y - m_y);
    }
    else
    {
        m_dx = 0.0f;
        m_dy = 0.0f;
    }

    m_x = x;
    m_y = y;
    m_hasPosition = true;
}

} // namespace glint
