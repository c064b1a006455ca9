///// Otter: Charge-Counter – Press oeffnet, Release schliesst; frameCount = endTick - startTick.
///// Schneefuchs: Tick-Regression und verwaiste Releases schlagen laut fehl, nie still falsch.
///// Maus: Eine Log-Zeile pro abgeschlossener Charge; Fehler immer geloggt.
///// Datei: src/charge_counter.cpp

#include "charge_counter.hpp"
#include "frosch_log.hpp"
#include "settings.hpp"

namespace frosch {

EdgeResult ChargeCounter::fail(const char* why, LogicalTick tick, bool expectStrayRelease) {
    FROSCH_LOG_HOST("[CHARGE] OutOfOrderEdge: %s at tick=%llu (session %s)",
                    why, static_cast<unsigned long long>(tick),
                    active_ ? "discarded" : "none");
    active_.reset();
    lastEdgeTick_       = tick; // new baseline so the machine recovers
    expectStrayRelease_ = expectStrayRelease;
    ++errorCount_;

    EdgeResult r;
    r.error = ChargeError::OutOfOrderEdge;
    return r;
}

EdgeResult ChargeCounter::onEdge(InputEdge edge, LogicalTick tick) {
    if (lastEdgeTick_ && tick < *lastEdgeTick_) {
        // A Press that regressed leaves the button physically held; its Release is expected.
        return fail("tick regression", tick, edge.kind == EdgeKind::Press);
    }

    EdgeResult r;

    if (edge.kind == EdgeKind::Press) {
        lastEdgeTick_ = tick;
        seenPress_    = true;
        if (active_) {
            r.ignored = true; // charge already open, no re-entry
            return r;
        }
        ChargeSession s;
        s.startTick = tick;
        s.status    = ChargeStatus::Charging;
        active_     = s;
        expectStrayRelease_ = false;
        if constexpr (Settings::debugLogging) {
            FROSCH_LOG_HOST("[CHARGE] press tick=%llu", static_cast<unsigned long long>(tick));
        }
        return r;
    }

    // Release
    if (!active_) {
        if (!seenPress_ || expectStrayRelease_) {
            // Started mid-hold, or the matching session was already discarded.
            expectStrayRelease_ = false;
            lastEdgeTick_ = tick;
            r.ignored = true;
            return r;
        }
        return fail("release without open charge", tick, false);
    }

    // lastEdgeTick_ >= startTick while charging, so the regression check above covers tick < startTick.
    lastEdgeTick_ = tick;

    ChargeSession done = *active_;
    done.endTick = tick;
    done.status  = ChargeStatus::Completed;
    active_.reset();

    lastCompleted_ = done;
    ++completedCount_;

    FROSCH_LOG_HOST("[CHARGE] completed frames=%llu start=%llu end=%llu",
                    static_cast<unsigned long long>(done.frameCount()),
                    static_cast<unsigned long long>(done.startTick),
                    static_cast<unsigned long long>(tick));

    r.completed = done;
    return r;
}

std::optional<ChargeSession> ChargeCounter::abandon(LogicalTick tick) {
    if (!active_) return std::nullopt;

    ChargeSession s = *active_;
    s.status = ChargeStatus::Abandoned;
    active_.reset();

    const unsigned long long held =
        (tick >= s.startTick) ? static_cast<unsigned long long>(tick - s.startTick) : 0ull;
    FROSCH_LOG_HOST("[CHARGE] abandoned open charge start=%llu held=%llu frames (not reported)",
                    static_cast<unsigned long long>(s.startTick), held);
    return s;
}

void ChargeCounter::reset() noexcept {
    active_.reset();
    lastCompleted_.reset();
    lastEdgeTick_.reset();
    seenPress_          = false;
    expectStrayRelease_ = false;
    completedCount_     = 0;
    errorCount_         = 0;
}

std::optional<FrameCount> ChargeCounter::runningFrames(LogicalTick now) const noexcept {
    if (!active_) return std::nullopt;
    return (now >= active_->startTick) ? (now - active_->startTick) : FrameCount{0};
}

} // namespace frosch
