///// Otter: Gemeinsame Werttypen der Frame-Buchhaltung – Tick, Edge, Session, Snapshot.
///// Schneefuchs: trivially-copyable, keine GL/GLFW-Includes; Fehler als Werte (ChargeError).
///// Maus: Frame-Zahlen sind immer Tick-Differenzen; std::optional statt Sentinel-Werte.
///// Datei: src/charge_types.hpp

#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>

namespace frosch {

// One unit = exactly one logical frame (1/60 s of simulated time).
using LogicalTick = std::uint64_t;

// Frame count of a charge; always a difference of two LogicalTicks.
using FrameCount = std::uint64_t;

enum class ChargeError : std::uint8_t {
    None = 0,
    InvalidInterval,   // negative/NaN/inf elapsed time handed to the clock
    OutOfOrderEdge,    // edge sequencing violated (tick regression, orphan release)
};

[[nodiscard]] constexpr const char* toString(ChargeError e) noexcept {
    switch (e) {
        case ChargeError::None:            return "None";
        case ChargeError::InvalidInterval: return "InvalidInterval";
        case ChargeError::OutOfOrderEdge:  return "OutOfOrderEdge";
    }
    return "Unknown";
}

enum class EdgeKind : std::uint8_t { Press, Release };

[[nodiscard]] constexpr const char* toString(EdgeKind k) noexcept {
    return k == EdgeKind::Press ? "Press" : "Release";
}

// Transition of the merged charge button. Consumed once by the ChargeCounter.
struct InputEdge {
    EdgeKind kind            = EdgeKind::Press;
    double   sourceTimestamp = 0.0; // seconds, monotonic source clock
};

enum class ChargeStatus : std::uint8_t {
    Idle,
    Charging,
    Completed,
    Abandoned,  // still open when the session ended; has no endTick
};

[[nodiscard]] constexpr const char* toString(ChargeStatus s) noexcept {
    switch (s) {
        case ChargeStatus::Idle:      return "Idle";
        case ChargeStatus::Charging:  return "Charging";
        case ChargeStatus::Completed: return "Completed";
        case ChargeStatus::Abandoned: return "Abandoned";
    }
    return "Unknown";
}

struct ChargeSession {
    LogicalTick                startTick = 0;
    std::optional<LogicalTick> endTick;          // absent while held and when abandoned
    ChargeStatus               status    = ChargeStatus::Idle;

    // Only meaningful for Completed sessions.
    [[nodiscard]] FrameCount frameCount() const noexcept {
        return endTick ? (*endTick - startTick) : 0;
    }
};

// Immutable per-refresh view for the renderer. Replaced wholesale on every sample.
struct Snapshot {
    LogicalTick               currentTick = 0;
    std::optional<FrameCount> activeChargeFrames;        // empty while idle
    std::optional<FrameCount> lastCompletedChargeFrames; // empty until the first release
    std::uint32_t             completedCharges = 0;

    [[nodiscard]] bool charging() const noexcept { return activeChargeFrames.has_value(); }

    friend bool operator==(const Snapshot& a, const Snapshot& b) noexcept {
        return a.currentTick == b.currentTick
            && a.activeChargeFrames == b.activeChargeFrames
            && a.lastCompletedChargeFrames == b.lastCompletedChargeFrames
            && a.completedCharges == b.completedCharges;
    }
    friend bool operator!=(const Snapshot& a, const Snapshot& b) noexcept { return !(a == b); }
};

static_assert(std::is_trivially_copyable<InputEdge>::value,
              "InputEdge must remain trivially copyable");

} // namespace frosch
