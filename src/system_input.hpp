///// Otter: System-weiter Listener – Tastatur/Maus auch, wenn das Spiel den Fokus hat.
///// Schneefuchs: Win32 Raw Input mit RIDEV_INPUTSINK auf einem Message-Only-Fenster; Pumpe = glfwPollEvents.
///// Maus: Ereignisse landen im System-Kanal desselben Normalizers; Fokusverlust betrifft sie nicht.
///// Datei: src/system_input.hpp

#pragma once

namespace frosch {

class AppState;

class SystemInputListener {
public:
    SystemInputListener() = default;
    ~SystemInputListener();

    SystemInputListener(const SystemInputListener&) = delete;
    SystemInputListener& operator=(const SystemInputListener&) = delete;

    // Registers for system-wide keyboard and mouse input. False when unsupported or on failure.
    bool start(AppState& state);

    // Unregisters; releases the System channel (the resulting edge is queued).
    void stop();

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    AppState* state_  = nullptr;
    void*     window_ = nullptr; // HWND of the message-only sink window
    bool      active_ = false;
};

} // namespace frosch
