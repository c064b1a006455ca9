///// Otter: GLFW bootstrap – correct init order and context binding; swapInterval after make current.
///// Schneefuchs: Compatibility context (fixed-function HUD); GLEW init right after make-current; ASCII logs only.
///// Maus: Deterministic behavior; no hidden side-effects; logs via FROSCH_LOG_HOST.
///// Datei: src/glfw_bootstrap.hpp

#pragma once
#include <stdexcept>
#include <string>
#include "settings.hpp"

struct GLFWwindow; // forward decl

namespace frosch {

struct GlfwAppConfig {
    int width  = Settings::width;
    int height = Settings::height;
    bool vsync = Settings::preferVSync;
    std::string title = Settings::windowTitle;
};

// Owns glfwInit/glfwTerminate and the single window. Throws std::runtime_error on failure.
class GlfwApp {
public:
    GlfwApp();
    ~GlfwApp();

    GlfwApp(const GlfwApp&) = delete;
    GlfwApp& operator=(const GlfwApp&) = delete;

    // Initializes GLFW, creates window, makes context current, sets swap interval, inits GLEW.
    GLFWwindow* initAndCreate(const GlfwAppConfig& cfg);

    // Access window (may be nullptr before initAndCreate).
    GLFWwindow* window() const noexcept { return window_; }

private:
    GLFWwindow* window_ = nullptr;
    bool initialized_ = false;

    void initGlfw_();
    void setHints_();
    GLFWwindow* createWindow_(int w, int h, const char* title);
    void makeCurrentAndSetSwapInterval_(GLFWwindow* win, bool vsync);
    void initGlew_();
    void placeWindow_(GLFWwindow* win, int w, int h);
};

} // namespace frosch
