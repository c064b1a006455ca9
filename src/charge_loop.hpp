///// Otter: Charge-Loop-API – ein Aufruf pro Display-Refresh; minimal & stabil.
///// Schneefuchs: Schlanker Header; nur AppState vorwaerts deklariert; ASCII-only.
///// Maus: Reihenfolge (Input -> Clock -> Sample -> HUD) lebt in der Source, nicht beim Aufrufer.
///// Datei: src/charge_loop.hpp

#pragma once

namespace frosch {

class AppState;

namespace ChargeLoop {

// Seeds the real-time reference; call once before the first refreshFrame().
void begin(AppState& state);

// 🎬 Kompletter Refresh: Events, Gamepads, Engine-Step, HUD, Swap.
void refreshFrame(AppState& state);

// Session end: abandons an open charge and releases GL resources.
void end(AppState& state);

} // namespace ChargeLoop

} // namespace frosch
