///// Otter: Refresh-Meter – Ramp-EMA mit Spike-Daempfung fuer eine ruhige HUD-Anzeige.
///// Schneefuchs: Keine iostreams; ASCII-only; deterministisch.
///// Maus: Schnelle Konvergenz, dann stabil; NaN/Inf und Null-Intervalle verworfen.
///// Datei: src/refresh_meter.cpp

#include "refresh_meter.hpp"
#include <algorithm>
#include <cmath>

namespace {
    // Smoothing parameters: fast ramp for first frames, then stable.
    constexpr double       kAlphaFast   = 0.45;  // startup smoothing
    constexpr double       kAlphaStable = 0.10;  // steady-state smoothing
    constexpr unsigned int kRampFrames  = 20;    // number of fast frames

    // Spike damping: bound new samples relative to previous EMA.
    constexpr double kSpikeMinRatio = 0.50;
    constexpr double kSpikeMaxRatio = 2.00;

    constexpr double kEps   = 1e-6;  // avoid div-by-zero
    constexpr int    kClamp = 1000;  // sanity clamp for HUD (Hz)
}

namespace frosch {

void RefreshMeter::update(double intervalSeconds) noexcept {
    if (!std::isfinite(intervalSeconds) || intervalSeconds <= 0.0) return;
    const double ms = intervalSeconds * 1000.0;

    if (frames_ == 0 || emaMs_ <= kEps) {
        emaMs_  = ms;
        frames_ = 1;
        return;
    }

    const double alpha  = (frames_ < kRampFrames) ? kAlphaFast : kAlphaStable;
    const double sample = std::clamp(ms, emaMs_ * kSpikeMinRatio, emaMs_ * kSpikeMaxRatio);
    emaMs_ = alpha * sample + (1.0 - alpha) * emaMs_;
    ++frames_;
}

double RefreshMeter::currentHz() const noexcept {
    if (!std::isfinite(emaMs_) || emaMs_ <= kEps) return 0.0;
    return std::min(1000.0 / emaMs_, static_cast<double>(kClamp));
}

int RefreshMeter::currentHzInt() const noexcept {
    const double hz = currentHz();
    return (hz <= 0.0) ? 0 : static_cast<int>(std::lround(hz));
}

void RefreshMeter::reset() noexcept {
    emaMs_  = 0.0;
    frames_ = 0;
}

} // namespace frosch
