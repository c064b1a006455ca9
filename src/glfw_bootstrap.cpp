///// Otter: Implements GLFW init order; error callback right after glfwInit; swapInterval only after context is current.
///// Schneefuchs: Explicit error logs and exceptions; avoids undefined calls prior to glfwInit.
///// Maus: No printf/fprintf; all logs via FROSCH_LOG_HOST; ASCII only.
///// Datei: src/glfw_bootstrap.cpp

#include "pch.hpp"
#include "glfw_bootstrap.hpp"
#include "frosch_log.hpp"

namespace frosch {

namespace {
    // GLFW-Error-Callback (ASCII only)
    void glfwErrorCallback(int code, const char* description) {
        FROSCH_LOG_HOST("[GLFW-ERROR] code=%d desc=%s", code, description ? description : "(null)");
    }
}

GlfwApp::GlfwApp() = default;

GlfwApp::~GlfwApp() {
    if (window_) {
        FROSCH_LOG_HOST("[GLFW] destroying window");
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (initialized_) {
        FROSCH_LOG_HOST("[GLFW] terminating");
        glfwTerminate();
        initialized_ = false;
    }
}

void GlfwApp::initGlfw_() {
    if (initialized_) return;
    if (!glfwInit()) {
        FROSCH_LOG_HOST("[GLFW] glfwInit failed");
        throw std::runtime_error("glfwInit failed");
    }
    glfwSetErrorCallback(glfwErrorCallback);
    initialized_ = true;
    FROSCH_LOG_HOST("[GLFW] glfwInit ok version=%s", glfwGetVersionString());
}

void GlfwApp::setHints_() {
    glfwDefaultWindowHints();
    // HUD draws with client-side vertex arrays: 2.1 compatibility context.
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_DOUBLEBUFFER, GLFW_TRUE);
    glfwWindowHint(GLFW_RESIZABLE,    GLFW_TRUE);
    glfwWindowHint(GLFW_FLOATING,     GLFW_TRUE); // HUD stays above the game window
    glfwWindowHint(GLFW_VISIBLE,      GLFW_TRUE);
}

GLFWwindow* GlfwApp::createWindow_(int w, int h, const char* title) {
    GLFWwindow* win = glfwCreateWindow(w, h, title, nullptr, nullptr);
    if (!win) {
        FROSCH_LOG_HOST("[GLFW] glfwCreateWindow failed w=%d h=%d title=%s", w, h, title);
        throw std::runtime_error("glfwCreateWindow failed");
    }
    FROSCH_LOG_HOST("[GLFW] window created w=%d h=%d title=%s", w, h, title);
    return win;
}

void GlfwApp::makeCurrentAndSetSwapInterval_(GLFWwindow* win, bool vsync) {
    glfwMakeContextCurrent(win);
    FROSCH_LOG_HOST("[GLFW] context current");
    glfwSwapInterval(vsync ? 1 : 0);
    FROSCH_LOG_HOST("[GLFW] swapInterval=%d", vsync ? 1 : 0);
}

void GlfwApp::initGlew_() {
    glewExperimental = GL_TRUE;
    const GLenum err = glewInit();
    if (err != GLEW_OK) {
        const char* msg = reinterpret_cast<const char*>(glewGetErrorString(err));
        FROSCH_LOG_HOST("[GLEW] glewInit failed -> %s", msg ? msg : "(null)");
        throw std::runtime_error("glewInit failed");
    }
    glGetError(); // GLEW may leave GL_INVALID_ENUM behind
    FROSCH_LOG_HOST("[GLEW] ok GL=%s", reinterpret_cast<const char*>(glGetString(GL_VERSION)));
}

// Fenster zentrieren ODER feste Position setzen (compile-time Branch).
void GlfwApp::placeWindow_(GLFWwindow* win, int w, int h) {
    constexpr bool kHasFixedPos = (Settings::windowPosX >= 0) && (Settings::windowPosY >= 0);
    if constexpr (kHasFixedPos) {
        (void)w; (void)h;
        glfwSetWindowPos(win, Settings::windowPosX, Settings::windowPosY);
    } else {
        GLFWmonitor* mon = glfwGetPrimaryMonitor();
        const GLFWvidmode* vm = mon ? glfwGetVideoMode(mon) : nullptr;
        if (vm) {
            glfwSetWindowPos(win, (vm->width - w) / 2, (vm->height - h) / 2);
        }
    }
}

GLFWwindow* GlfwApp::initAndCreate(const GlfwAppConfig& cfg) {
    initGlfw_();
    setHints_();
    window_ = createWindow_(cfg.width, cfg.height, cfg.title.c_str());
    makeCurrentAndSetSwapInterval_(window_, cfg.vsync);
    initGlew_();
    placeWindow_(window_, cfg.width, cfg.height);
    return window_;
}

} // namespace frosch
