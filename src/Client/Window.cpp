// =============================================================================
// VOXSTREAM - WINDOW IMPLEMENTATION
// =============================================================================

#include "Client/Window.hpp"
#include "Shared/Logger.hpp"

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <iostream>
#include <string>

namespace voxstream::client {

namespace {

#ifndef NDEBUG
void APIENTRY on_gl_message(GLenum /*source*/, GLenum type, GLuint id, GLenum severity,
                            GLsizei /*length*/, const GLchar* message, const void* /*user*/) {
    if (severity == GL_DEBUG_SEVERITY_NOTIFICATION) {
        return;
    }
    const char* level = severity == GL_DEBUG_SEVERITY_HIGH ? "HIGH"
                      : severity == GL_DEBUG_SEVERITY_MEDIUM ? "MEDIUM" : "LOW";
    std::cerr << "[GL " << level << "]" << (type == GL_DEBUG_TYPE_ERROR ? " error" : "")
              << " #" << id << ": " << message << "\n";
    LOG("GL", level, " #", id, ": ", message);
}
#endif

void on_glfw_error(int code, const char* description) {
    std::cerr << "[Window] GLFW error " << code << ": " << description << "\n";
}

} // namespace

// =============================================================================
// GLFW LIBRARY
// =============================================================================

GlfwLibrary::GlfwLibrary() {
    glfwSetErrorCallback(on_glfw_error);
    m_ok = glfwInit() == GLFW_TRUE;
    if (!m_ok) {
        std::cerr << "[Window] Failed to initialize GLFW\n";
    }
}

GlfwLibrary::~GlfwLibrary() {
    if (m_ok) {
        glfwTerminate();
    }
}

// =============================================================================
// LIFETIME
// =============================================================================

Window::~Window() {
    close();
}

bool Window::open(const ClientSettings& settings, std::string_view title) {
    close();

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#ifndef NDEBUG
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
#endif

    const auto width = static_cast<int>(settings.window_width);
    const auto height = static_cast<int>(settings.window_height);
    m_window = glfwCreateWindow(width, height, std::string(title).c_str(), nullptr, nullptr);
    if (!m_window) {
        std::cerr << "[Window] Failed to create " << width << "x" << height << " window\n";
        return false;
    }

    glfwMakeContextCurrent(m_window);
    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        std::cerr << "[Window] Failed to load OpenGL functions\n";
        close();
        return false;
    }

    // Direct state access needs 4.5
    if (!GLAD_GL_VERSION_4_5) {
        std::cerr << "[Window] OpenGL 4.5 required, driver offers " << glGetString(GL_VERSION) << "\n";
        close();
        return false;
    }

    std::cout << "[Window] OpenGL " << glGetString(GL_VERSION) << " on " << glGetString(GL_RENDERER) << "\n";
    LOG("Window", "Opened ", width, "x", height, ", GL ", reinterpret_cast<const char*>(glGetString(GL_VERSION)));

#ifndef NDEBUG
    glEnable(GL_DEBUG_OUTPUT);
    glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
    glDebugMessageCallback(on_gl_message, nullptr);
#endif

    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, on_framebuffer_size);
    glfwSetKeyCallback(m_window, on_key);
    glfwSetCursorPosCallback(m_window, on_cursor);
    glfwSetWindowFocusCallback(m_window, on_focus);

    // HiDPI framebuffers may be larger than the window
    glfwGetFramebufferSize(m_window, &m_width, &m_height);
    glViewport(0, 0, m_width, m_height);

    glfwSwapInterval(1);
    return true;
}

void Window::close() {
    if (m_window) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }
}

bool Window::should_close() const {
    return !m_window || glfwWindowShouldClose(m_window);
}

void Window::present() {
    if (m_window) {
        glfwSwapBuffers(m_window);
    }
}

double Window::time() {
    return glfwGetTime();
}

// =============================================================================
// INPUT
// =============================================================================

FrameInput Window::poll() {
    m_pressed.fill(false);
    m_mouse_dx = 0.0;
    m_mouse_dy = 0.0;

    glfwPollEvents();

    FrameInput input;
    input.forward = held(GLFW_KEY_W);
    input.left = held(GLFW_KEY_A);
    input.backward = held(GLFW_KEY_S);
    input.right = held(GLFW_KEY_D);
    input.up = held(GLFW_KEY_SPACE);
    input.down = held(GLFW_KEY_LEFT_SHIFT);

    input.toggle_capture = pressed(GLFW_KEY_ESCAPE);
    input.toggle_overlay = pressed(GLFW_KEY_F3);
    input.toggle_flying = pressed(GLFW_KEY_F);

    input.mouse_dx = m_mouse_dx;
    input.mouse_dy = m_mouse_dy;
    input.mouse_captured = m_captured;
    return input;
}

void Window::set_mouse_captured(bool captured) {
    if (!m_window) return;

    m_captured = captured;
    glfwSetInputMode(m_window, GLFW_CURSOR, captured ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
    if (glfwRawMouseMotionSupported()) {
        glfwSetInputMode(m_window, GLFW_RAW_MOUSE_MOTION, captured ? GLFW_TRUE : GLFW_FALSE);
    }

    // The cursor jumps when the mode changes
    m_cursor_known = false;
}

bool Window::held(int key) const noexcept {
    return key >= 0 && static_cast<std::size_t>(key) < KEY_SLOTS && m_held[static_cast<std::size_t>(key)];
}

bool Window::pressed(int key) const noexcept {
    return key >= 0 && static_cast<std::size_t>(key) < KEY_SLOTS && m_pressed[static_cast<std::size_t>(key)];
}

// =============================================================================
// GLFW CALLBACKS
// =============================================================================

Window* Window::owner(GLFWwindow* window) {
    return static_cast<Window*>(glfwGetWindowUserPointer(window));
}

void Window::on_framebuffer_size(GLFWwindow* window, int width, int height) {
    if (Window* self = owner(window)) {
        self->m_width = width;
        self->m_height = height;
        glViewport(0, 0, width, height);
    }
}

void Window::on_key(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/) {
    Window* self = owner(window);
    if (!self || key < 0 || static_cast<std::size_t>(key) >= KEY_SLOTS) return;

    const auto slot = static_cast<std::size_t>(key);
    if (action == GLFW_PRESS) {
        self->m_held[slot] = true;
        self->m_pressed[slot] = true;
    } else if (action == GLFW_RELEASE) {
        self->m_held[slot] = false;
    }
}

void Window::on_cursor(GLFWwindow* window, double x, double y) {
    Window* self = owner(window);
    if (!self) return;

    if (self->m_cursor_known) {
        self->m_mouse_dx += x - self->m_cursor_x;
        self->m_mouse_dy += y - self->m_cursor_y;
    }
    self->m_cursor_x = x;
    self->m_cursor_y = y;
    self->m_cursor_known = true;
}

void Window::on_focus(GLFWwindow* window, int focused) {
    Window* self = owner(window);
    if (!self || focused == GLFW_TRUE) return;

    // Releases are lost while unfocused
    self->m_held.fill(false);
    if (self->m_captured) {
        self->set_mouse_captured(false);
    }
}

} // namespace voxstream::client
