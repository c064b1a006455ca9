///// Otter: Snapshot wird pro Aufruf neu gebaut, nie in-place veraendert.
///// Schneefuchs: Reine Lesefunktion; const bis zum Ende.
///// Maus: Doppelter sample() ohne Zwischenschritt liefert identische Werte.
///// Datei: src/render_bridge.cpp

#include "render_bridge.hpp"
#include "charge_counter.hpp"
#include "fixed_step_clock.hpp"

namespace frosch {

Snapshot RenderBridge::sample() const {
    Snapshot s;
    s.currentTick        = clock_.currentTick();
    s.activeChargeFrames = counter_.runningFrames(s.currentTick);
    if (const auto& last = counter_.lastCompleted()) {
        s.lastCompletedChargeFrames = last->frameCount();
    }
    s.completedCharges = counter_.completedCount();
    return s;
}

} // namespace frosch
