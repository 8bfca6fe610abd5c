// =============================================================================
// SKYROAM - WINDOW WRAPPER IMPLEMENTATION
// =============================================================================

#include "Client/Window.hpp"
#include "Shared/Logger.hpp"

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <iostream>
#include <string>

namespace skyroam::client {

namespace {

bool g_glfw_ready = false;
int g_open_windows = 0;

Window* owner_of(GLFWwindow* handle) {
    return static_cast<Window*>(glfwGetWindowUserPointer(handle));
}

const char* gl_string(GLenum name) {
    return reinterpret_cast<const char*>(glGetString(name));
}

#ifndef NDEBUG
void APIENTRY on_gl_message(GLenum /*source*/, GLenum type, GLuint id, GLenum severity,
                            GLsizei /*length*/, const GLchar* message, const void* /*user*/) {
    if (severity == GL_DEBUG_SEVERITY_NOTIFICATION) return;
    const char* level = severity == GL_DEBUG_SEVERITY_HIGH   ? "high"
                      : severity == GL_DEBUG_SEVERITY_MEDIUM ? "medium"
                                                             : "low";
    std::cerr << "[GL] " << level << " #" << id << " (type 0x" << std::hex << type << std::dec
              << "): " << message << "\n";
}
#endif

void request_core_context() {
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
#ifndef NDEBUG
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
#endif
}

bool context_is_45() {
    GLint major = 0;
    GLint minor = 0;
    glGetIntegerv(GL_MAJOR_VERSION, &major);
    glGetIntegerv(GL_MINOR_VERSION, &minor);
    if (major > 4 || (major == 4 && minor >= 5)) {
        return true;
    }
    std::cerr << "[Window] OpenGL 4.5 required, context is " << major << "." << minor << "\n";
    return false;
}

} // namespace

bool initialize_glfw() {
    if (!g_glfw_ready && !glfwInit()) {
        std::cerr << "[Window] glfwInit failed\n";
        return false;
    }
    g_glfw_ready = true;
    return true;
}

void terminate_glfw() {
    if (g_glfw_ready && g_open_windows == 0) {
        glfwTerminate();
        g_glfw_ready = false;
    }
}

Window::~Window() {
    destroy();
}

bool Window::create(std::int32_t width, std::int32_t height, std::string_view title) {
    destroy();
    if (!initialize_glfw()) {
        return false;
    }

    request_core_context();
    const std::string caption(title);
    m_window = glfwCreateWindow(width, height, caption.c_str(), nullptr, nullptr);
    if (!m_window) {
        std::cerr << "[Window] glfwCreateWindow failed for " << width << "x" << height << "\n";
        return false;
    }
    ++g_open_windows;
    glfwMakeContextCurrent(m_window);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        std::cerr << "[Window] glad could not load GL entry points\n";
        destroy();
        return false;
    }
    LOG("Window", "GL ", gl_string(GL_VERSION), " on ", gl_string(GL_RENDERER));
    if (!context_is_45()) {
        destroy();
        return false;
    }

#ifndef NDEBUG
    glEnable(GL_DEBUG_OUTPUT);
    glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
    glDebugMessageCallback(on_gl_message, nullptr);
#endif

    install_callbacks();

    int fb_w = width;
    int fb_h = height;
    glfwGetFramebufferSize(m_window, &fb_w, &fb_h);
    m_fb_width = fb_w;
    m_fb_height = fb_h;
    glViewport(0, 0, fb_w, fb_h);

    // Roof winding from the triangulator is not normalised, so both faces draw
    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_LESS);
    glDisable(GL_CULL_FACE);

    glfwSwapInterval(1);
    return true;
}

void Window::install_callbacks() {
    glfwSetWindowUserPointer(m_window, this);

    glfwSetFramebufferSizeCallback(m_window, [](GLFWwindow* handle, int w, int h) {
        if (Window* self = owner_of(handle)) {
            self->m_fb_width = w;
            self->m_fb_height = h;
            glViewport(0, 0, w, h);
        }
    });
    glfwSetKeyCallback(m_window, [](GLFWwindow* handle, int key, int, int action, int) {
        if (Window* self = owner_of(handle)) self->on_key(key, action);
    });
    glfwSetMouseButtonCallback(m_window, [](GLFWwindow* handle, int button, int action, int) {
        if (Window* self = owner_of(handle)) self->on_button(button, action);
    });
    glfwSetCursorPosCallback(m_window, [](GLFWwindow* handle, double x, double y) {
        if (Window* self = owner_of(handle)) self->on_cursor(x, y);
    });
}

void Window::destroy() {
    if (!m_window) return;
    glfwDestroyWindow(m_window);
    m_window = nullptr;
    --g_open_windows;
}

bool Window::should_close() const {
    return m_window && glfwWindowShouldClose(m_window);
}

void Window::poll_events() {
    m_input.begin_frame();
    glfwPollEvents();
}

void Window::swap_buffers() {
    if (m_window) glfwSwapBuffers(m_window);
}

void Window::set_title(std::string_view title) {
    if (!m_window) return;
    const std::string caption(title);
    glfwSetWindowTitle(m_window, caption.c_str());
}

void Window::set_vsync(bool enabled) {
    glfwSwapInterval(enabled ? 1 : 0);
}

double Window::get_time() {
    return glfwGetTime();
}

// =============================================================================
// INPUT
// =============================================================================

bool Window::is_key_down(std::int32_t key) const {
    return key >= 0 && key < InputState::KEY_COUNT && m_input.keys[key];
}

bool Window::is_key_pressed(std::int32_t key) const {
    return key >= 0 && key < InputState::KEY_COUNT && m_input.keys_pressed[key];
}

bool Window::is_mouse_pressed(std::int32_t button) const {
    return button >= 0 && button < InputState::BUTTON_COUNT && m_input.buttons_pressed[button];
}

void Window::capture_mouse(bool capture) {
    if (!m_window) return;

    m_input.mouse_captured = capture;
    glfwSetInputMode(m_window, GLFW_CURSOR, capture ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
    if (glfwRawMouseMotionSupported()) {
        glfwSetInputMode(m_window, GLFW_RAW_MOUSE_MOTION, capture ? GLFW_TRUE : GLFW_FALSE);
    }
    // Next cursor event re-anchors instead of producing a jump
    m_cursor_reset = true;
}

void Window::on_key(int key, int action) {
    if (key < 0 || key >= InputState::KEY_COUNT) return;
    if (action == GLFW_PRESS) {
        m_input.keys[key] = true;
        m_input.keys_pressed[key] = true;
    } else if (action == GLFW_RELEASE) {
        m_input.keys[key] = false;
    }
}

void Window::on_button(int button, int action) {
    if (button >= 0 && button < InputState::BUTTON_COUNT && action == GLFW_PRESS) {
        m_input.buttons_pressed[button] = true;
    }
}

void Window::on_cursor(double x, double y) {
    if (m_cursor_reset) {
        m_cursor_x = x;
        m_cursor_y = y;
        m_cursor_reset = false;
    }
    m_input.mouse_dx += x - m_cursor_x;
    m_input.mouse_dy += y - m_cursor_y;
    m_cursor_x = x;
    m_cursor_y = y;
}

} // namespace skyroam::client
