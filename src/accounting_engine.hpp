///// Otter: Accounting-Engine – besitzt Clock, Counter und Bridge; eine Instanz pro Sitzung, kein Singleton.
///// Schneefuchs: Reihenfolge pro Refresh fest verdrahtet: Edges -> advance -> sample.
///// Maus: Nicht kopierbar (Bridge haelt Referenzen); mehrere Instanzen parallel moeglich (Tests).
///// Datei: src/accounting_engine.hpp

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "charge_counter.hpp"
#include "charge_types.hpp"
#include "fixed_step_clock.hpp"
#include "render_bridge.hpp"

namespace frosch {

// Outcome of one driving-loop iteration.
struct FrameReport {
    Snapshot                   snapshot;
    std::vector<ChargeSession> completed;         // sessions closed during this iteration
    std::size_t                ticksProduced  = 0;
    std::uint32_t              edgeErrors     = 0; // OutOfOrderEdge count this iteration
    ChargeError                clockError     = ChargeError::None;
};

class AccountingEngine {
public:
    AccountingEngine() : AccountingEngine(ClockConfig{}) {}
    explicit AccountingEngine(const ClockConfig& cfg);

    AccountingEngine(const AccountingEngine&) = delete;
    AccountingEngine& operator=(const AccountingEngine&) = delete;
    AccountingEngine(AccountingEngine&&) = delete;
    AccountingEngine& operator=(AccountingEngine&&) = delete;

    // One refresh: edges at the current tick, then advance, then sample.
    FrameReport step(const std::vector<InputEdge>& edges, double elapsedRealSeconds);

    // Single operations, for hosts that sequence the loop themselves.
    EdgeResult    applyEdge(InputEdge edge);
    AdvanceResult advance(double elapsedRealSeconds) { return clock_.advance(elapsedRealSeconds); }
    [[nodiscard]] Snapshot sample() const { return bridge_.sample(); }

    // Session end: an open charge becomes Abandoned (logged, never Completed).
    std::optional<ChargeSession> endSession();

    // Tick 0, empty accumulator, idle counter.
    void reset() noexcept;

    [[nodiscard]] const FixedStepClock& clock()   const noexcept { return clock_; }
    [[nodiscard]] const ChargeCounter&  counter() const noexcept { return counter_; }

private:
    FixedStepClock clock_;
    ChargeCounter  counter_;
    RenderBridge   bridge_; // declared last: binds to the two members above
};

} // namespace frosch
