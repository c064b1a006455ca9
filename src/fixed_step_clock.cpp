///// Otter: Standard-Fixed-Timestep (Akkumulator), aber in Frame-Einheiten gerechnet.
///// Schneefuchs: NaN/Inf/negativ -> InvalidInterval, kein Zustandswechsel; ASCII-Logs.
///// Maus: Clamp vor dem Akkumulieren; Catch-up-Deckel verwirft ganze Frames, nie Teilreste.
///// Datei: src/fixed_step_clock.cpp

#include "fixed_step_clock.hpp"
#include "frosch_log.hpp"

#include <algorithm>
#include <cmath>

namespace frosch {

namespace {
    // Configurable bounds; keep accFrames_ small enough for exact integer frames.
    constexpr double kMinFrameDuration   = 1e-4;  // 10 kHz
    constexpr double kMaxElapsedClampSec = 60.0;

    // 1/(1/60.0) lands a few ulps off 60; snap to the integer rate when that close.
    double framesPerSecondFor(double frameDuration) {
        const double raw     = 1.0 / frameDuration;
        const double rounded = std::round(raw);
        return (std::abs(raw - rounded) < 1e-9) ? rounded : raw;
    }
}

FixedStepClock::FixedStepClock(const ClockConfig& cfg)
    : cfg_(cfg)
{
    if (!(std::isfinite(cfg_.frameDuration) && cfg_.frameDuration >= kMinFrameDuration)) {
        FROSCH_LOG_HOST("[CLOCK] invalid frameDuration=%f, using default %f",
                        cfg_.frameDuration, Settings::frameDuration);
        cfg_.frameDuration = Settings::frameDuration;
    }
    if (!(std::isfinite(cfg_.maxElapsedClampSeconds) && cfg_.maxElapsedClampSeconds > 0.0)) {
        FROSCH_LOG_HOST("[CLOCK] invalid maxElapsedClampSeconds=%f, using default %f",
                        cfg_.maxElapsedClampSeconds, Settings::maxElapsedClampSeconds);
        cfg_.maxElapsedClampSeconds = Settings::maxElapsedClampSeconds;
    } else if (cfg_.maxElapsedClampSeconds > kMaxElapsedClampSec) {
        FROSCH_LOG_HOST("[CLOCK] maxElapsedClampSeconds=%f above ceiling, using %f",
                        cfg_.maxElapsedClampSeconds, kMaxElapsedClampSec);
        cfg_.maxElapsedClampSeconds = kMaxElapsedClampSec;
    }
    cfg_.maxCatchUpTicksPerCall = std::max(cfg_.maxCatchUpTicksPerCall, 1);
    framesPerSecond_ = framesPerSecondFor(cfg_.frameDuration);
}

AdvanceResult FixedStepClock::advance(double elapsedRealSeconds) {
    AdvanceResult result;

    if (!std::isfinite(elapsedRealSeconds) || elapsedRealSeconds < 0.0) {
        FROSCH_LOG_HOST("[CLOCK] InvalidInterval: elapsed=%f rejected (tick=%llu)",
                        elapsedRealSeconds, static_cast<unsigned long long>(tick_));
        result.error = ChargeError::InvalidInterval;
        return result;
    }

    double dt = elapsedRealSeconds;
    if (dt > cfg_.maxElapsedClampSeconds) {
        if constexpr (Settings::debugLogging) {
            FROSCH_LOG_HOST("[CLOCK] clamp elapsed=%.4fs -> %.4fs", dt, cfg_.maxElapsedClampSeconds);
        }
        dt = cfg_.maxElapsedClampSeconds;
        result.clamped = true;
    }

    accFrames_ += dt * framesPerSecond_;

    const int cap = cfg_.maxCatchUpTicksPerCall;
    // min in double: accFrames_ may exceed int range before the cap applies.
    const double wanted = std::min(static_cast<double>(cap), std::floor(accFrames_) + 1.0);
    result.ticks.reserve(static_cast<std::size_t>(wanted));

    while (accFrames_ >= 1.0) {
        if (static_cast<int>(result.ticks.size()) >= cap) {
            // Stall surplus: drop whole frames, keep the sub-frame residue.
            const double dropped = std::floor(accFrames_);
            accFrames_ -= dropped;
            result.capped = true;
            if constexpr (Settings::debugLogging) {
                FROSCH_LOG_HOST("[CLOCK] catch-up cap=%d reached, dropped %.0f frames", cap, dropped);
            }
            break;
        }
        accFrames_ -= 1.0;
        ++tick_;
        result.ticks.push_back(tick_);
    }

    // Guard against float residue creeping below zero.
    if (accFrames_ < 0.0) accFrames_ = 0.0;

    return result;
}

void FixedStepClock::reset() noexcept {
    accFrames_ = 0.0;
    tick_      = 0;
}

} // namespace frosch
