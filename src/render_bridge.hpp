///// Otter: Render-Bridge – liest Tick und Charge-Zustand, liefert einen unveraenderlichen Snapshot.
///// Schneefuchs: Strikt downstream; loest weder Ticks noch Edges aus; keine GL-Includes.
///// Maus: Keine Interpolation, keine Rundung – nur die autoritative Tick-Arithmetik.
///// Datei: src/render_bridge.hpp

#pragma once

#include "charge_types.hpp"

namespace frosch {

class FixedStepClock;
class ChargeCounter;

class RenderBridge {
public:
    RenderBridge(const FixedStepClock& clock, const ChargeCounter& counter) noexcept
        : clock_(clock), counter_(counter) {}

    // At most once per display refresh, after the clock advanced.
    [[nodiscard]] Snapshot sample() const;

private:
    const FixedStepClock& clock_;
    const ChargeCounter&  counter_;
};

} // namespace frosch
