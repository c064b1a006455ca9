///// Otter: Raw-Input-Mapping; reine Funktionen, testbar ohne Windows.
///// Schneefuchs: Auto-Repeat kommt als weiteres Make-Paket; der Normalizer ist dafuer idempotent.
///// Maus: Left button = Settings::mouseChargeButton im System-Kanal.
///// Datei: src/raw_input_map.cpp

#include "raw_input_map.hpp"
#include "settings.hpp"

namespace frosch {

namespace RawInputMap {

std::vector<RawInputEvent> fromKeyboard(int virtualKey, unsigned flags, double timestamp) {
    std::vector<RawInputEvent> out;
    if (virtualKey <= 0 || virtualKey >= kVirtualKeyFake || virtualKey == kVirtualKeyEscape) {
        return out;
    }

    RawInputEvent ev;
    ev.source    = InputSource::Keyboard;
    ev.code      = virtualKey;
    ev.held      = (flags & kKeyBreak) == 0;
    ev.timestamp = timestamp;
    ev.channel   = InputChannel::System;
    out.push_back(ev);
    return out;
}

std::vector<RawInputEvent> fromMouseButtons(unsigned buttonFlags, double timestamp) {
    std::vector<RawInputEvent> out;

    RawInputEvent ev;
    ev.source    = InputSource::Mouse;
    ev.code      = Settings::mouseChargeButton;
    ev.timestamp = timestamp;
    ev.channel   = InputChannel::System;

    if (buttonFlags & kMouseLeftDown) {
        ev.held = true;
        out.push_back(ev);
    }
    if (buttonFlags & kMouseLeftUp) {
        ev.held = false;
        out.push_back(ev);
    }
    return out;
}

} // namespace RawInputMap

} // namespace frosch
