// =============================================================================
// SKYROAM - WINDOW WRAPPER
// GLFW window, OpenGL 4.5 context and the per-frame input snapshot
// =============================================================================
#pragma once

#include <cstdint>
#include <string_view>

// Forward declarations
struct GLFWwindow;

namespace skyroam::client {

// =============================================================================
// INPUT STATE
// Edge flags and mouse deltas cover the events of one poll_events() call
// =============================================================================
struct InputState {
    static constexpr int KEY_COUNT = 512;
    static constexpr int BUTTON_COUNT = 8;

    bool keys[KEY_COUNT] = {};
    bool keys_pressed[KEY_COUNT] = {};
    bool buttons_pressed[BUTTON_COUNT] = {};

    double mouse_dx = 0.0;
    double mouse_dy = 0.0;
    bool mouse_captured = false;

    void begin_frame() {
        mouse_dx = 0.0;
        mouse_dy = 0.0;
        for (auto& edge : keys_pressed) edge = false;
        for (auto& edge : buttons_pressed) edge = false;
    }
};

// =============================================================================
// WINDOW CLASS
// =============================================================================
class Window {
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // Opens the window and loads GL; false (with a [Window] message) on failure
    bool create(std::int32_t width, std::int32_t height, std::string_view title);
    void destroy();

    [[nodiscard]] bool should_close() const;
    void poll_events();
    void swap_buffers();
    void set_title(std::string_view title);
    void set_vsync(bool enabled);

    [[nodiscard]] float aspect_ratio() const noexcept {
        return m_fb_height > 0 ? static_cast<float>(m_fb_width) / static_cast<float>(m_fb_height) : 1.0f;
    }
    [[nodiscard]] GLFWwindow* handle() const noexcept { return m_window; }

    [[nodiscard]] const InputState& input() const noexcept { return m_input; }
    [[nodiscard]] bool is_key_down(std::int32_t key) const;
    [[nodiscard]] bool is_key_pressed(std::int32_t key) const;
    [[nodiscard]] bool is_mouse_pressed(std::int32_t button) const;

    // Disabled cursor plus raw motion where the platform has it
    void capture_mouse(bool capture);

    [[nodiscard]] static double get_time();

private:
    void install_callbacks();
    void on_key(int key, int action);
    void on_button(int button, int action);
    void on_cursor(double x, double y);

    GLFWwindow* m_window = nullptr;
    std::int32_t m_fb_width = 0;
    std::int32_t m_fb_height = 0;

    InputState m_input;
    double m_cursor_x = 0.0;
    double m_cursor_y = 0.0;
    bool m_cursor_reset = true;
};

// =============================================================================
// GLFW LIFETIME (once per process)
// =============================================================================
bool initialize_glfw();
void terminate_glfw();

} // namespace skyroam::client
