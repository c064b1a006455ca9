///// Otter: Charge-Counter – Zustandsmaschine Idle/Charging; Frames = Tick-Differenz, nie ein Extra-Zaehler.
///// Schneefuchs: Reihenfolgeverletzung -> OutOfOrderEdge, Session verworfen, zurueck auf Idle.
///// Maus: Offene Charge am Sitzungsende wird Abandoned, nie ein erfundenes Completed.
///// Datei: src/charge_counter.hpp

#pragma once

#include <cstdint>
#include <optional>
#include "charge_types.hpp"

namespace frosch {

struct EdgeResult {
    std::optional<ChargeSession> completed;       // set on a valid Release while Charging
    ChargeError                  error   = ChargeError::None;
    bool                         ignored = false; // edge had no effect (Press while Charging, stray Release)

    [[nodiscard]] bool ok() const noexcept { return error == ChargeError::None; }
};

class ChargeCounter {
public:
    ChargeCounter() = default;

    // Consumes one edge observed at logical tick `tick`.
    EdgeResult onEdge(InputEdge edge, LogicalTick tick);

    // Closes an open charge at session end. Empty when idle.
    std::optional<ChargeSession> abandon(LogicalTick tick);

    // Forget everything (paired with a clock reset).
    void reset() noexcept;

    [[nodiscard]] ChargeStatus state() const noexcept {
        return active_ ? ChargeStatus::Charging : ChargeStatus::Idle;
    }

    // Frames held so far, derived from the clock's tick. Empty while idle.
    [[nodiscard]] std::optional<FrameCount> runningFrames(LogicalTick now) const noexcept;

    [[nodiscard]] const std::optional<ChargeSession>& activeSession() const noexcept { return active_; }
    [[nodiscard]] const std::optional<ChargeSession>& lastCompleted() const noexcept { return lastCompleted_; }
    [[nodiscard]] std::uint32_t completedCount() const noexcept { return completedCount_; }
    [[nodiscard]] std::uint32_t errorCount() const noexcept { return errorCount_; }

private:
    EdgeResult fail(const char* why, LogicalTick tick, bool expectStrayRelease);

    std::optional<ChargeSession> active_;
    std::optional<ChargeSession> lastCompleted_;
    std::optional<LogicalTick>   lastEdgeTick_;
    bool                         seenPress_          = false;
    bool                         expectStrayRelease_ = false;
    std::uint32_t                completedCount_     = 0;
    std::uint32_t                errorCount_         = 0;
};

} // namespace frosch
