///// Otter: GLFW-Callbacks -> RawInputEvent -> Normalizer -> pendingEdges.
///// Schneefuchs: GLFW_REPEAT aendert keinen Held-Zustand; unbekannte Keys (-1) fallen im Normalizer raus.
///// Maus: Zeitstempel immer glfwGetTime() (monoton); Joystick-Disconnect wird geloggt.
///// Datei: src/glfw_input.cpp

#include "pch.hpp"
#include "glfw_input.hpp"
#include "app_state.hpp"
#include "frosch_log.hpp"
#include "settings.hpp"

namespace frosch {

int GlfwGamepadProvider::slotCount() const {
    return GLFW_JOYSTICK_LAST + 1;
}

bool GlfwGamepadProvider::connected(int slot) const {
    return glfwJoystickIsGamepad(slot) == GLFW_TRUE;
}

bool GlfwGamepadProvider::chargeHeld(int slot) const {
    GLFWgamepadstate st{};
    if (glfwGetGamepadState(slot, &st) != GLFW_TRUE) return false;
    for (int button : Settings::gamepadChargeButtons) {
        if (button >= 0 && button <= GLFW_GAMEPAD_BUTTON_LAST && st.buttons[button] == GLFW_PRESS) {
            return true;
        }
    }
    return false;
}

static_assert(Settings::gamepadSlots == GLFW_JOYSTICK_LAST + 1,
              "Settings::gamepadSlots must match GLFW_JOYSTICK_LAST + 1");

namespace {

    AppState* stateOf(GLFWwindow* window) {
        return static_cast<AppState*>(glfwGetWindowUserPointer(window));
    }

    void queue(AppState& s, const std::optional<InputEdge>& edge) {
        if (edge) s.pendingEdges.push_back(*edge);
    }

    void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
        (void)scancode; (void)mods;
        AppState* s = stateOf(window);
        if (!s) return;

        if (key == GLFW_KEY_ESCAPE) {
            if (action == GLFW_PRESS) glfwSetWindowShouldClose(window, GLFW_TRUE);
            return;
        }
        if (action == GLFW_REPEAT) return;

        RawInputEvent ev;
        ev.source    = InputSource::Keyboard;
        ev.code      = key;
        ev.held      = (action == GLFW_PRESS);
        ev.timestamp = glfwGetTime();
        queue(*s, s->input.normalize(ev));
    }

    void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods) {
        (void)mods;
        AppState* s = stateOf(window);
        if (!s) return;

        RawInputEvent ev;
        ev.source    = InputSource::Mouse;
        ev.code      = button;
        ev.held      = (action == GLFW_PRESS);
        ev.timestamp = glfwGetTime();
        queue(*s, s->input.normalize(ev));
    }

    // Window-channel releases never reach us once unfocused; the System channel keeps its state.
    void focusCallback(GLFWwindow* window, int focused) {
        AppState* s = stateOf(window);
        if (!s || focused == GLFW_TRUE) return;

        queue(*s, s->input.releaseChannel(InputChannel::Window, glfwGetTime()));
        if constexpr (Settings::debugLogging) {
            FROSCH_LOG_HOST("[INPUT] focus lost -> window keyboard/mouse released");
        }
    }

    void framebufferSizeCallback(GLFWwindow* window, int w, int h) {
        AppState* s = stateOf(window);
        if (!s) return;
        s->width  = w;
        s->height = h;
    }

    void joystickCallback(int jid, int event) {
        if (event == GLFW_CONNECTED) {
            const char* name = glfwGetGamepadName(jid);
            FROSCH_LOG_HOST("[INPUT] joystick %d connected gamepad=%d name=%s",
                            jid, glfwJoystickIsGamepad(jid) == GLFW_TRUE ? 1 : 0, name ? name : "(none)");
        } else if (event == GLFW_DISCONNECTED) {
            FROSCH_LOG_HOST("[INPUT] joystick %d disconnected", jid);
        }
    }

} // namespace

namespace GlfwInput {

void install(GLFWwindow* window, AppState& state) {
    glfwSetWindowUserPointer(window, &state);
    glfwGetFramebufferSize(window, &state.width, &state.height);

    glfwSetKeyCallback(window, keyCallback);
    glfwSetMouseButtonCallback(window, mouseButtonCallback);
    glfwSetWindowFocusCallback(window, focusCallback);
    glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);
    glfwSetJoystickCallback(joystickCallback);

    if (!state.systemInput.start(state)) {
        FROSCH_LOG_HOST("[INPUT] keyboard/mouse only while this window has focus; gamepads always");
    }
}

void pollGamepads(AppState& state, double now) {
    static const GlfwGamepadProvider pads;
    queue(state, state.input.pollGamepads(pads, now));
}

} // namespace GlfwInput

} // namespace frosch
