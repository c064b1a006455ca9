///// Otter: Host-Schleife; pro Refresh genau ein Engine-Schritt.
///// Schneefuchs: Elapsed nur aus glfwGetTime() (monoton), nie aus einem Callback-Delta.
///// Maus: Fixe Log-Kadenz fuer [LOOP]; eine Zeile pro Ereignis; Fehler zaehlen, nie abbrechen.
///// Datei: src/charge_loop.cpp

#include "pch.hpp"
#include "charge_loop.hpp"
#include "app_state.hpp"
#include "glfw_input.hpp"
#include "hud.hpp"
#include "settings.hpp"
#include "frosch_log.hpp"

namespace frosch {

namespace ChargeLoop {

void begin(AppState& state) {
    state.lastTime     = glfwGetTime();
    state.refreshCount = 0;
    state.pendingEdges.clear();
    state.lastSnapshot = state.engine.sample();
    FROSCH_LOG_HOST("[LOOP] begin t=%.3f tick=%llu", state.lastTime,
                    static_cast<unsigned long long>(state.lastSnapshot.currentTick));
}

void refreshFrame(AppState& state) {
    // (1) Input: callbacks fire inside glfwPollEvents, then gamepads are polled.
    glfwPollEvents();
    const double now = glfwGetTime();
    GlfwInput::pollGamepads(state, now);

    // (2) Clock + counter + (3) sample, in that order.
    const double elapsed = now - state.lastTime;
    state.lastTime = now;

    const FrameReport report = state.engine.step(state.pendingEdges, elapsed);
    state.pendingEdges.clear();
    state.lastSnapshot = report.snapshot;
    ++state.refreshCount;

    state.refresh.update(elapsed);

    if (report.clockError != ChargeError::None || report.edgeErrors > 0) {
        FROSCH_LOG_HOST("[LOOP] refresh=%u clock=%s edgeErrors=%u (continuing)",
                        state.refreshCount, toString(report.clockError), report.edgeErrors);
    }

    // (4) Render collaborator.
    Hud::draw(state.lastSnapshot, state.refresh.currentHzInt(), state.width, state.height);
    glfwSwapBuffers(state.window);

    if constexpr (Settings::performanceLogging) {
        if ((state.refreshCount % static_cast<unsigned>(Settings::loopLogEvery)) == 0u) {
            FROSCH_LOG_HOST("[LOOP] refresh=%u tick=%llu display=%.1fHz dt=%.3fms",
                            state.refreshCount,
                            static_cast<unsigned long long>(state.lastSnapshot.currentTick),
                            state.refresh.currentHz(), elapsed * 1000.0);
        }
    }
}

void end(AppState& state) {
    // Release edges are dropped: an open charge ends as Abandoned, not Completed.
    state.systemInput.stop();
    (void)state.input.releaseAll(glfwGetTime());
    state.pendingEdges.clear();
    state.engine.endSession();
    Hud::cleanup();
    FROSCH_LOG_HOST("[LOOP] end refreshes=%u tick=%llu charges=%u",
                    state.refreshCount,
                    static_cast<unsigned long long>(state.engine.clock().currentTick()),
                    state.engine.counter().completedCount());
}

} // namespace ChargeLoop

} // namespace frosch
