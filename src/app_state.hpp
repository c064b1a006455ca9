///// Otter: App-State – alles, was die Host-Schleife pro Refresh braucht, an einem Ort.
///// Schneefuchs: Engine wird von aussen besessen und per Referenz gereicht (kein Singleton).
///// Maus: Pending-Edges leben nur bis zum naechsten step(); Header schlank, GLFWwindow vorwaerts deklariert.
///// Datei: src/app_state.hpp

#pragma once

#include <vector>
#include "accounting_engine.hpp"
#include "charge_types.hpp"
#include "input_normalizer.hpp"
#include "refresh_meter.hpp"
#include "system_input.hpp"

struct GLFWwindow;

namespace frosch {

class AppState {
public:
    AppState(AccountingEngine& eng, GLFWwindow* win) noexcept
        : engine(eng), window(win) {}

    AccountingEngine& engine;

    // 🖼️ Fenster/Viewport
    GLFWwindow* window = nullptr;
    int         width  = 0;
    int         height = 0;

    // 🎮 Eingabe -> Edges (von Callbacks befuellt, von step() verbraucht)
    InputNormalizer        input;
    std::vector<InputEdge> pendingEdges;

    // 🕒 Zeitsteuerung pro Refresh
    double       lastTime     = 0.0;
    unsigned int refreshCount = 0;
    RefreshMeter refresh;

    // 📈 Letzter Snapshot fuer HUD
    Snapshot lastSnapshot;

    // 🌐 System-weite Eingabe; zuletzt deklariert, damit sie vor input/pendingEdges stirbt
    SystemInputListener systemInput;
};

} // namespace frosch
