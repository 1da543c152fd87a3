// =============================================================================
// VOXSTREAM - WINDOW
// GLFW window with an OpenGL 4.5 core context. Keyboard and mouse events are
// folded into one FrameInput per frame using the game's key bindings.
// =============================================================================
#pragma once

#include "Client/ClientSettings.hpp"

#include <array>
#include <cstdint>
#include <string_view>

struct GLFWwindow;

namespace voxstream::client {

// Input gathered between two polls
struct FrameInput {
    // Held keys: WASD, Space, Left Shift
    bool forward = false;
    bool left = false;
    bool backward = false;
    bool right = false;
    bool up = false;
    bool down = false;

    // Went down since the last poll: Escape, F3, F
    bool toggle_capture = false;
    bool toggle_overlay = false;
    bool toggle_flying = false;

    // Cursor motion summed over every event of the frame
    double mouse_dx = 0.0;
    double mouse_dy = 0.0;
    bool mouse_captured = false;
};

// glfwInit / glfwTerminate for the lifetime of the object
class GlfwLibrary {
public:
    GlfwLibrary();
    ~GlfwLibrary();

    GlfwLibrary(const GlfwLibrary&) = delete;
    GlfwLibrary& operator=(const GlfwLibrary&) = delete;

    [[nodiscard]] bool ok() const noexcept { return m_ok; }

private:
    bool m_ok = false;
};

class Window {
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // Creates the window, makes its context current and loads GL entry points
    bool open(const ClientSettings& settings, std::string_view title);
    void close();

    [[nodiscard]] bool is_open() const noexcept { return m_window != nullptr; }
    [[nodiscard]] bool should_close() const;

    // Processes pending events and returns what happened since the last call
    [[nodiscard]] FrameInput poll();
    void present();

    void set_mouse_captured(bool captured);
    [[nodiscard]] bool mouse_captured() const noexcept { return m_captured; }

    [[nodiscard]] float aspect_ratio() const noexcept {
        return m_height > 0 ? static_cast<float>(m_width) / static_cast<float>(m_height) : 1.0f;
    }

    [[nodiscard]] GLFWwindow* handle() const noexcept { return m_window; }

    [[nodiscard]] static double time();

private:
    static constexpr std::size_t KEY_SLOTS = 512;

    [[nodiscard]] static Window* owner(GLFWwindow* window);
    static void on_framebuffer_size(GLFWwindow* window, int width, int height);
    static void on_key(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void on_cursor(GLFWwindow* window, double x, double y);
    static void on_focus(GLFWwindow* window, int focused);

    [[nodiscard]] bool held(int key) const noexcept;
    [[nodiscard]] bool pressed(int key) const noexcept;

    GLFWwindow* m_window = nullptr;
    std::int32_t m_width = 0;
    std::int32_t m_height = 0;

    std::array<bool, KEY_SLOTS> m_held{};
    std::array<bool, KEY_SLOTS> m_pressed{};

    double m_mouse_dx = 0.0;
    double m_mouse_dy = 0.0;
    double m_cursor_x = 0.0;
    double m_cursor_y = 0.0;
    bool m_cursor_known = false;
    bool m_captured = false;
};

} // namespace voxstream::client
