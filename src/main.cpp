///// Otter: Main setzt GLFW-App, Engine und Host-State auf und faehrt die Refresh-Schleife.
///// Schneefuchs: Engine explizit besessen und per Referenz gereicht; Bootstrap-Fehler werfen, hier gefangen.
///// Maus: Deterministische ASCII-Logs; sauberer Shutdown mit Abandon der offenen Charge.
///// Datei: src/main.cpp

#include "pch.hpp"
#include "accounting_engine.hpp"
#include "app_state.hpp"
#include "charge_loop.hpp"
#include "glfw_bootstrap.hpp"
#include "glfw_input.hpp"
#include "settings.hpp"
#include "frosch_log.hpp"

#include <cstdlib>
#include <exception>

int main()
{
    FROSCH_LOG_HOST("[BOOT] Frosch frame counter started (logic %d Hz, clamp %.3fs, catch-up %d)",
                    Settings::logicalFps, Settings::maxElapsedClampSeconds, Settings::maxCatchUpTicksPerCall);

    try {
        frosch::GlfwApp app;
        GLFWwindow* window = app.initAndCreate(frosch::GlfwAppConfig{});

        frosch::AccountingEngine engine;
        frosch::AppState state(engine, window);
        frosch::GlfwInput::install(window, state);

        frosch::ChargeLoop::begin(state);
        while (!glfwWindowShouldClose(window)) {
            frosch::ChargeLoop::refreshFrame(state);
        }
        frosch::ChargeLoop::end(state);
    } catch (const std::exception& e) {
        FROSCH_LOG_HOST("[FATAL] %s - aborting", e.what());
        FroschLogger::flushLogs();
        return EXIT_FAILURE;
    }

    FROSCH_LOG_HOST("[EXIT] Clean shutdown");
    return EXIT_SUCCESS;
}
