///// Otter: Zentraler HUD-Builder – ASCII-only; baut Text nur aus dem Snapshot.
///// Schneefuchs: Header/Source synchron; keine GL-Includes; /WX-fest.
///// Maus: Eine Quelle fuer die Frame-Zahl; deterministische Formatierung; keine Seiteneffekte.
///// Datei: src/hud_text.hpp

#pragma once

#include <cstdint>
#include <string>
#include "charge_types.hpp"

namespace HudText {

// HUD text block, one "label  value" line each. No side effects, ASCII-only.
[[nodiscard]] std::string build(const frosch::Snapshot& snap, int displayHz);

// Frames the gauge should show: the running charge, else the last completed one.
[[nodiscard]] std::uint64_t gaugeFrames(const frosch::Snapshot& snap) noexcept;

} // namespace HudText
