///// Otter: Input-Normalizer – Tastatur, Maus, Gamepad -> ein abstrakter Charge-Button.
///// Schneefuchs: Keine GLFW-Includes; Gamepad-Polling ueber schmale Provider-Schnittstelle.
///// Maus: OR-Merge-Debounce; Press nur bei "keiner -> irgendeiner", Release nur bei "irgendeiner -> keiner".
///// Datei: src/input_normalizer.hpp

#pragma once

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include "charge_types.hpp"
#include "settings.hpp"

namespace frosch {

enum class InputSource : std::uint8_t { Keyboard = 0, Mouse, Gamepad, Count };

[[nodiscard]] constexpr const char* toString(InputSource s) noexcept {
    switch (s) {
        case InputSource::Keyboard: return "keyboard";
        case InputSource::Mouse:    return "mouse";
        case InputSource::Gamepad:  return "gamepad";
        case InputSource::Count:    break;
    }
    return "unknown";
}

// Where a keyboard/mouse sample came from. Gamepads ignore the channel.
//  - Window: callbacks of our own window, only while it has focus
//  - System: system-wide listener, regardless of which window has focus
enum class InputChannel : std::uint8_t { Window = 0, System };

[[nodiscard]] constexpr const char* toString(InputChannel c) noexcept {
    return c == InputChannel::Window ? "window" : "system";
}

// Raw held-state sample from an input collaborator.
//  - Keyboard: code = key code, held = key down
//  - Mouse:    code = button,   held = button down
//  - Gamepad:  code = pad slot, held = any charge button down on that pad
struct RawInputEvent {
    InputSource source    = InputSource::Keyboard;
    int         code      = 0;
    bool        held      = false;
    double      timestamp = 0.0; // seconds, monotonic
    InputChannel channel  = InputChannel::Window;
};

// Polled gamepad backend (GLFW in the app, fakes in tests).
class GamepadStateProvider {
public:
    virtual ~GamepadStateProvider() = default;

    [[nodiscard]] virtual int  slotCount() const = 0;
    [[nodiscard]] virtual bool connected(int slot) const = 0;
    // Any bound charge button held on this pad. Only queried for connected slots.
    [[nodiscard]] virtual bool chargeHeld(int slot) const = 0;
};

struct NormalizerConfig {
    int mouseChargeButton = Settings::mouseChargeButton;
};

class InputNormalizer {
public:
    // Key codes up to GLFW_KEY_LAST (348) fit comfortably.
    static constexpr std::size_t kKeyCodeCount   = 512;
    static constexpr std::size_t kMouseCodeCount = 8;
    static constexpr std::size_t kGamepadSlots   = static_cast<std::size_t>(Settings::gamepadSlots);

    InputNormalizer() = default;
    explicit InputNormalizer(const NormalizerConfig& cfg) : cfg_(cfg) {}

    // Applies one raw sample; returns an edge only when the merged signal flips.
    std::optional<InputEdge> normalize(const RawInputEvent& ev);

    // Polls every pad once; disconnected pads count as released.
    std::optional<InputEdge> pollGamepads(const GamepadStateProvider& pads, double timestamp);

    // Drops one source on every channel (backend gone).
    std::optional<InputEdge> releaseSource(InputSource source, double timestamp);

    // Drops keyboard and mouse of one channel (Window: focus loss, System: listener stopped).
    std::optional<InputEdge> releaseChannel(InputChannel channel, double timestamp);

    // Drops every source (shutdown, explicit reset).
    std::optional<InputEdge> releaseAll(double timestamp);

    [[nodiscard]] bool anyHeld() const noexcept;
    [[nodiscard]] bool sourceHeld(InputSource source) const noexcept;
    [[nodiscard]] bool channelHeld(InputChannel channel) const noexcept;

private:
    std::optional<InputEdge> edgeFor(bool before, double timestamp) const;

    NormalizerConfig cfg_{};
    static constexpr std::size_t kChannels = 2;

    std::bitset<kKeyCodeCount>   keys_[kChannels]{};
    std::bitset<kMouseCodeCount> mouse_[kChannels]{};
    std::bitset<kGamepadSlots>   pads_{};
};

} // namespace frosch
