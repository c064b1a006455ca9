///// Otter: Normalizer – pro Quelle nur der letzte Held-Zustand, keine Historie.
///// Schneefuchs: Out-of-range-Codes werden ignoriert und (debug) geloggt; ASCII-only.
///// Maus: Edge traegt den Zeitstempel des ausloesenden Rohereignisses.
///// Datei: src/input_normalizer.cpp

#include "input_normalizer.hpp"
#include "frosch_log.hpp"

namespace frosch {

namespace {
    std::size_t channelIndex(InputChannel c) noexcept {
        return c == InputChannel::System ? 1u : 0u;
    }
}

bool InputNormalizer::anyHeld() const noexcept {
    return sourceHeld(InputSource::Keyboard) || sourceHeld(InputSource::Mouse) || pads_.any();
}

bool InputNormalizer::sourceHeld(InputSource source) const noexcept {
    switch (source) {
        case InputSource::Keyboard: return keys_[0].any() || keys_[1].any();
        case InputSource::Mouse:    return mouse_[0].any() || mouse_[1].any();
        case InputSource::Gamepad:  return pads_.any();
        case InputSource::Count:    break;
    }
    return false;
}

bool InputNormalizer::channelHeld(InputChannel channel) const noexcept {
    const std::size_t c = channelIndex(channel);
    return keys_[c].any() || mouse_[c].any();
}

std::optional<InputEdge> InputNormalizer::edgeFor(bool before, double timestamp) const {
    const bool after = anyHeld();
    if (before == after) return std::nullopt;

    InputEdge edge;
    edge.kind            = after ? EdgeKind::Press : EdgeKind::Release;
    edge.sourceTimestamp = timestamp;
    if constexpr (Settings::debugLogging) {
        FROSCH_LOG_HOST("[INPUT] edge=%s t=%.4f", toString(edge.kind), timestamp);
    }
    return edge;
}

std::optional<InputEdge> InputNormalizer::normalize(const RawInputEvent& ev) {
    const bool before = anyHeld();
    const std::size_t c = channelIndex(ev.channel);

    switch (ev.source) {
        case InputSource::Keyboard:
            if (ev.code < 0 || static_cast<std::size_t>(ev.code) >= kKeyCodeCount) {
                if constexpr (Settings::debugLogging) {
                    FROSCH_LOG_HOST("[INPUT] keyboard code=%d out of range, ignored", ev.code);
                }
                return std::nullopt;
            }
            keys_[c].set(static_cast<std::size_t>(ev.code), ev.held);
            break;

        case InputSource::Mouse:
            if (ev.code != cfg_.mouseChargeButton
                || ev.code < 0 || static_cast<std::size_t>(ev.code) >= kMouseCodeCount) {
                return std::nullopt; // not bound to the charge action
            }
            mouse_[c].set(static_cast<std::size_t>(ev.code), ev.held);
            break;

        case InputSource::Gamepad:
            if (ev.code < 0 || static_cast<std::size_t>(ev.code) >= kGamepadSlots) {
                if constexpr (Settings::debugLogging) {
                    FROSCH_LOG_HOST("[INPUT] gamepad slot=%d out of range, ignored", ev.code);
                }
                return std::nullopt;
            }
            pads_.set(static_cast<std::size_t>(ev.code), ev.held);
            break;

        case InputSource::Count:
            return std::nullopt;
    }

    return edgeFor(before, ev.timestamp);
}

std::optional<InputEdge> InputNormalizer::pollGamepads(const GamepadStateProvider& pads, double timestamp) {
    const bool before = anyHeld();

    const int slots = pads.slotCount();
    for (std::size_t i = 0; i < kGamepadSlots; ++i) {
        const int slot = static_cast<int>(i);
        bool held = false;
        if (slot < slots && pads.connected(slot)) {
            held = pads.chargeHeld(slot);
        } else if (pads_.test(i)) {
            FROSCH_LOG_HOST("[INPUT] gamepad slot=%d gone while held -> release", slot);
        }
        pads_.set(i, held);
    }

    return edgeFor(before, timestamp);
}

std::optional<InputEdge> InputNormalizer::releaseSource(InputSource source, double timestamp) {
    const bool before = anyHeld();
    switch (source) {
        case InputSource::Keyboard: keys_[0].reset();  keys_[1].reset();  break;
        case InputSource::Mouse:    mouse_[0].reset(); mouse_[1].reset(); break;
        case InputSource::Gamepad:  pads_.reset();  break;
        case InputSource::Count:    break;
    }
    return edgeFor(before, timestamp);
}

std::optional<InputEdge> InputNormalizer::releaseChannel(InputChannel channel, double timestamp) {
    const bool before = anyHeld();
    const std::size_t c = channelIndex(channel);
    keys_[c].reset();
    mouse_[c].reset();
    return edgeFor(before, timestamp);
}

std::optional<InputEdge> InputNormalizer::releaseAll(double timestamp) {
    const bool before = anyHeld();
    for (std::size_t c = 0; c < kChannels; ++c) {
        keys_[c].reset();
        mouse_[c].reset();
    }
    pads_.reset();
    return edgeFor(before, timestamp);
}

} // namespace frosch
