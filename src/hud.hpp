// Datei: src/hud.hpp
// 🐭 Maus-Kommentar: HUD per stb_easy_font – kein Shader, keine Init-Fragilitaet. Zeigt nur, was der Snapshot sagt.
// 🦦 Otter: Gauge mit Tick-Marks; darf optisch daneben liegen, die Zahl ist die Wahrheit.

#pragma once

#include "charge_types.hpp"

namespace Hud {

// Rendert Text-Panel und Gauge fuer den aktuellen Snapshot.
void draw(const frosch::Snapshot& snap, int displayHz, int width, int height);

// Gibt VBO frei (idempotent).
void cleanup();

} // namespace Hud
