///// Otter: Refresh-Meter – glaettet Display-Intervalle zu einer ruhigen Hz-Anzeige.
///// Schneefuchs: Header/Source strikt getrennt; ASCII-only; nur Anzeige, speist nie die Logik-Uhr.
///// Maus: Keine iostreams; API minimal; NaN/Inf-Filter.
///// Datei: src/refresh_meter.hpp

#pragma once

namespace frosch {

class RefreshMeter {
public:
    /// Update once per display refresh with the real interval in seconds.
    void update(double intervalSeconds) noexcept;

    /// Smoothed refresh rate in Hz (0 before the first valid sample).
    [[nodiscard]] double currentHz() const noexcept;

    /// Same as above, rounded for the HUD.
    [[nodiscard]] int currentHzInt() const noexcept;

    /// Reset EMA state (e.g. after the window moved to another monitor).
    void reset() noexcept;

private:
    double       emaMs_  = 0.0;
    unsigned int frames_ = 0;
};

} // namespace frosch
