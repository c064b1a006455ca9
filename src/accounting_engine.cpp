///// Otter: Engine-Schritt – exakt die Refresh-Reihenfolge; Fehler zaehlen, Loop laeuft weiter.
///// Schneefuchs: Keine Exceptions im Pfad; Clock-Fehler ist Null-Effekt.
///// Maus: Completed-Sessions werden pro Schritt gesammelt und weitergereicht.
///// Datei: src/accounting_engine.cpp

#include "accounting_engine.hpp"

namespace frosch {

AccountingEngine::AccountingEngine(const ClockConfig& cfg)
    : clock_(cfg)
    , counter_()
    , bridge_(clock_, counter_)
{}

EdgeResult AccountingEngine::applyEdge(InputEdge edge) {
    return counter_.onEdge(edge, clock_.currentTick());
}

FrameReport AccountingEngine::step(const std::vector<InputEdge>& edges, double elapsedRealSeconds) {
    FrameReport report;

    for (const InputEdge& edge : edges) {
        EdgeResult r = applyEdge(edge);
        if (r.completed) report.completed.push_back(*r.completed);
        if (!r.ok()) ++report.edgeErrors;
    }

    const AdvanceResult adv = clock_.advance(elapsedRealSeconds);
    report.ticksProduced = adv.ticks.size();
    report.clockError    = adv.error;

    report.snapshot = bridge_.sample();
    return report;
}

std::optional<ChargeSession> AccountingEngine::endSession() {
    return counter_.abandon(clock_.currentTick());
}

void AccountingEngine::reset() noexcept {
    clock_.reset();
    counter_.reset();
}

} // namespace frosch
