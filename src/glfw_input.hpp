///// Otter: GLFW-Eingabe – Tastatur/Maus per Callback, Gamepads per Polling; alles landet im Normalizer.
///// Schneefuchs: Callbacks finden den AppState ueber den Window-User-Pointer; keine Globals.
///// Maus: Escape schliesst das Fenster und zaehlt nie als Charge; Fokusverlust = Release.
///// Datei: src/glfw_input.hpp

#pragma once

#include "input_normalizer.hpp"

struct GLFWwindow;

namespace frosch {

class AppState;

// Gamepad backend over glfwGetGamepadState.
class GlfwGamepadProvider final : public GamepadStateProvider {
public:
    [[nodiscard]] int  slotCount() const override;
    [[nodiscard]] bool connected(int slot) const override;
    [[nodiscard]] bool chargeHeld(int slot) const override;
};

namespace GlfwInput {

// Sets the window user pointer to `state`, registers key/mouse/focus/size callbacks
// and starts the system-wide listener where available.
void install(GLFWwindow* window, AppState& state);

// Once per refresh, after glfwPollEvents(): poll pads, queue the merged edge (if any).
void pollGamepads(AppState& state, double now);

} // namespace GlfwInput

} // namespace frosch
