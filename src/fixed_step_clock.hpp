///// Otter: Fixed-Step-Clock – Akkumulator entkoppelt Display-Refresh von der 60-Hz-Logik.
///// Schneefuchs: Header/Source synchron; keine GLFW-Abhaengigkeit; Fehler als Wert, wirft nie.
///// Maus: Clamp + Catch-up-Deckel gegen Stall-Lawinen; Tick steigt exakt um 1 pro Schritt.
///// Datei: src/fixed_step_clock.hpp

#pragma once

#include <cstddef>
#include <vector>
#include "charge_types.hpp"
#include "settings.hpp"

namespace frosch {

struct ClockConfig {
    // Length of one logical frame (s). Fixed by product intent; tests may vary it.
    double frameDuration          = Settings::frameDuration;
    // Elapsed samples above this are clamped before accumulating (s). At most 60.
    double maxElapsedClampSeconds = Settings::maxElapsedClampSeconds;
    // Upper bound on ticks emitted by one advance().
    int    maxCatchUpTicksPerCall = Settings::maxCatchUpTicksPerCall;
};

struct AdvanceResult {
    std::vector<LogicalTick> ticks;     // ascending, contiguous, may be empty
    ChargeError              error   = ChargeError::None;
    bool                     clamped = false; // elapsed hit the clamp ceiling
    bool                     capped  = false; // catch-up cap dropped whole frames

    [[nodiscard]] bool ok() const noexcept { return error == ChargeError::None; }
};

class FixedStepClock {
public:
    FixedStepClock() : FixedStepClock(ClockConfig{}) {}
    explicit FixedStepClock(const ClockConfig& cfg);

    // Accumulate elapsedRealSeconds and emit every whole logical frame it completes.
    // Negative/NaN/inf input: zero effect, error = InvalidInterval, logged.
    AdvanceResult advance(double elapsedRealSeconds);

    // Back to tick 0 with an empty accumulator.
    void reset() noexcept;

    [[nodiscard]] LogicalTick currentTick() const noexcept { return tick_; }

    // Residue in seconds, always in [0, frameDuration).
    [[nodiscard]] double accumulator() const noexcept { return accFrames_ * cfg_.frameDuration; }

    // Residue as a fraction of one frame in [0,1); for render interpolation only.
    [[nodiscard]] double interpolationAlpha() const noexcept { return accFrames_; }

    [[nodiscard]] double frameDuration() const noexcept { return cfg_.frameDuration; }
    [[nodiscard]] const ClockConfig& config() const noexcept { return cfg_; }

private:
    ClockConfig cfg_;
    double      framesPerSecond_ = 0.0;

    // Accumulator kept in frame units: integer frame boundaries stay exact in double.
    double      accFrames_ = 0.0;
    LogicalTick tick_      = 0;
};

} // namespace frosch
