///// Otter: Raw-Input-Mapping – Win32-Rohdaten (VKey/Flags, Button-Flags) -> RawInputEvent im System-Kanal.
///// Schneefuchs: Keine <windows.h>; Flag-Werte hier gespiegelt, der Win32-Listener prueft sie per static_assert.
///// Maus: Escape zaehlt nie als Charge; nur die linke Maustaste.
///// Datei: src/raw_input_map.hpp

#pragma once

#include <vector>
#include "input_normalizer.hpp"

namespace frosch {

namespace RawInputMap {

// winuser.h values
inline constexpr unsigned kKeyBreak         = 0x0001; // RI_KEY_BREAK
inline constexpr unsigned kMouseLeftDown    = 0x0001; // RI_MOUSE_LEFT_BUTTON_DOWN
inline constexpr unsigned kMouseLeftUp      = 0x0002; // RI_MOUSE_LEFT_BUTTON_UP
inline constexpr int      kVirtualKeyEscape = 0x1B;   // VK_ESCAPE
inline constexpr int      kVirtualKeyFake   = 0xFF;   // overrun / fake key

// One RAWKEYBOARD packet. Empty for Escape and codes that are not real keys.
[[nodiscard]] std::vector<RawInputEvent> fromKeyboard(int virtualKey, unsigned flags, double timestamp);

// One RAWMOUSE usButtonFlags word. Down before up when both arrive in one packet.
[[nodiscard]] std::vector<RawInputEvent> fromMouseButtons(unsigned buttonFlags, double timestamp);

} // namespace RawInputMap

} // namespace frosch
