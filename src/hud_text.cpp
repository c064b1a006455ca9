///// Otter: HUD text builder – laufende Charge, letzte Charge, Tick, Display-Hz.
///// Schneefuchs: ASCII-only; sicheres snprintf-Append ohne NUL.
///// Maus: API stabil halten; "-" fuer fehlende Werte statt 0 (0 Frames ist ein gueltiger Wert).
///// Datei: src/hud_text.cpp

#include "hud_text.hpp"
#include "settings.hpp"
#include <algorithm>
#include <cstdio>
#include <string>

namespace HudText {

static inline void appendKV(std::string& buf, const char* label, const char* value) {
    char line[96];
    const int n = std::snprintf(line, sizeof(line), "%-8s %s\n", label, value);
    if (n > 0) {
        // Append at most sizeof(line)-1 to avoid embedding the terminating NUL
        const size_t toAppend = static_cast<size_t>(std::min(n, static_cast<int>(sizeof(line) - 1)));
        buf.append(line, toAppend);
    }
}

std::string build(const frosch::Snapshot& snap, int displayHz) {
    std::string hud;
    hud.reserve(192);

    {
        char v[48];
        if (snap.activeChargeFrames) {
            std::snprintf(v, sizeof(v), "HOLD %llu",
                          static_cast<unsigned long long>(*snap.activeChargeFrames));
        } else {
            std::snprintf(v, sizeof(v), "-");
        }
        appendKV(hud, "charge", v);
    }
    {
        char v[48];
        if (snap.lastCompletedChargeFrames) {
            std::snprintf(v, sizeof(v), "%llu f",
                          static_cast<unsigned long long>(*snap.lastCompletedChargeFrames));
        } else {
            std::snprintf(v, sizeof(v), "-");
        }
        appendKV(hud, "last", v);
    }
    { char v[48]; std::snprintf(v, sizeof(v), "%u", snap.completedCharges); appendKV(hud, "count", v); }
    { char v[48]; std::snprintf(v, sizeof(v), "%llu", static_cast<unsigned long long>(snap.currentTick)); appendKV(hud, "tick", v); }
    {
        char v[48];
        if (displayHz > 0) std::snprintf(v, sizeof(v), "%d Hz (logic %d)", displayHz, Settings::logicalFps);
        else               std::snprintf(v, sizeof(v), "n/a (logic %d)", Settings::logicalFps);
        appendKV(hud, "display", v);
    }

    return hud;
}

std::uint64_t gaugeFrames(const frosch::Snapshot& snap) noexcept {
    if (snap.activeChargeFrames)        return *snap.activeChargeFrames;
    if (snap.lastCompletedChargeFrames) return *snap.lastCompletedChargeFrames;
    return 0;
}

} // namespace HudText
