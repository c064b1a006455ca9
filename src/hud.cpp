// Datei: src/hud.cpp
// 🐭 Maus-Kommentar: HUD-Textbox oben links (Margin 16), Gauge unten. Fixed-function GL, ein VBO fuer alles.
// 🦦 Otter: Farben: gruen = laeuft, bernstein = letzte Charge.

#include "pch.hpp"
#include "hud.hpp"
#include "hud_text.hpp"
#include "settings.hpp"
#include "frosch_log.hpp"
#define STB_EASY_FONT_IMPLEMENTATION
#include <stb_easy_font.h>
#include <clocale>
#include <cstdio>
#include <string>
#include <vector>

namespace Hud {

static GLuint vbo = 0;

static void drawArrays(GLenum mode, const float* xy, GLsizei vertexCount) {
    if (vertexCount <= 0) return;
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(vertexCount) * 2 * sizeof(float), xy, GL_DYNAMIC_DRAW);
    glVertexPointer(2, GL_FLOAT, 0, nullptr);
    glDrawArrays(mode, 0, vertexCount);
}

static void drawRect(float x0, float y0, float x1, float y1, GLenum mode) {
    const float q[] = { x0, y0,  x1, y0,  x1, y1,  x0, y1 };
    drawArrays(mode, q, 4);
}

static void drawText(const std::string& text, float x, float y, float scale) {
    // stb_easy_font: 4 Vertices pro Quad, je x,y,z + 4 Byte Farbe = 16 Byte
    static char buffer[60000];
    unsigned char color[4] = { 255, 255, 255, 255 };

    glPushMatrix();
    glTranslatef(x, y, 0.0f);
    glScalef(scale, scale, 1.0f);

    const int quads = stb_easy_font_print(0.0f, 0.0f, const_cast<char*>(text.c_str()), color, buffer, sizeof(buffer));
    if (quads > 0) {
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(quads) * 4 * 16, buffer, GL_DYNAMIC_DRAW);
        glVertexPointer(2, GL_FLOAT, 16, nullptr);
        glDrawArrays(GL_QUADS, 0, quads * 4);
    }
    glPopMatrix();

    if constexpr (Settings::debugLogging) {
        FROSCH_LOG_HOST("[HUD] text %d quads", quads);
    }
}

// Gauge: 0..gaugeMaxFrames, ein Tick-Mark alle gaugeTickEvery Frames.
static void drawGauge(const frosch::Snapshot& snap, float x0, float y0, float x1, float y1) {
    const std::uint64_t frames = HudText::gaugeFrames(snap);
    const float maxF = static_cast<float>(Settings::gaugeMaxFrames);
    const float f    = static_cast<float>(frames < static_cast<std::uint64_t>(Settings::gaugeMaxFrames)
                                          ? frames : static_cast<std::uint64_t>(Settings::gaugeMaxFrames));
    const float fillX = x0 + (x1 - x0) * (f / maxF);

    glColor4f(0.1f, 0.1f, 0.1f, 0.6f);
    drawRect(x0, y0, x1, y1, GL_QUADS);

    if (snap.charging()) glColor4f(0.30f, 0.85f, 0.40f, 0.9f);
    else                 glColor4f(1.00f, 0.82f, 0.32f, 0.9f);
    drawRect(x0, y0, fillX, y1, GL_QUADS);

    std::vector<float> ticks;
    ticks.reserve(static_cast<size_t>(Settings::gaugeMaxFrames / Settings::gaugeTickEvery + 1) * 4);
    for (int t = 0; t <= Settings::gaugeMaxFrames; t += Settings::gaugeTickEvery) {
        const float tx = x0 + (x1 - x0) * (static_cast<float>(t) / maxF);
        const float ty = (t % (Settings::gaugeTickEvery * 3) == 0) ? y0 - 6.0f : y0 - 3.0f;
        ticks.insert(ticks.end(), { tx, ty, tx, y1 });
    }
    glColor4f(0.85f, 0.85f, 0.85f, 0.9f);
    drawArrays(GL_LINES, ticks.data(), static_cast<GLsizei>(ticks.size() / 2));

    glColor4f(0.3f, 0.3f, 0.3f, 0.9f); // Rahmen
    drawRect(x0, y0, x1, y1, GL_LINE_LOOP);
}

void draw(const frosch::Snapshot& snap, int displayHz, int width, int height) {
    if (width <= 0 || height <= 0) return; // minimiert
    if (!vbo) glGenBuffers(1, &vbo);

    glViewport(0, 0, width, height);
    glClearColor(0.05f, 0.06f, 0.07f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    glUseProgram(0);
    glDisable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);
    glDisable(GL_TEXTURE_2D);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    glMatrixMode(GL_PROJECTION);
    glPushMatrix();
    glLoadIdentity();
    glOrtho(0.0, width, height, 0.0, -1.0, 1.0);
    glMatrixMode(GL_MODELVIEW);
    glPushMatrix();
    glLoadIdentity();

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glEnableClientState(GL_VERTEX_ARRAY);

    std::setlocale(LC_NUMERIC, "C");

    // === Layout ===
    const float margin = Settings::hudMargin;
    const float w      = static_cast<float>(width);
    const float h      = static_cast<float>(height);

    // === Grosse Zahl: laufende Charge, sonst letzte ===
    {
        char big[32];
        std::snprintf(big, sizeof(big), "%llu", static_cast<unsigned long long>(HudText::gaugeFrames(snap)));
        if (snap.charging()) glColor4f(0.30f, 0.85f, 0.40f, 1.0f);
        else                 glColor4f(1.00f, 0.82f, 0.32f, 1.0f);
        drawText(big, w - margin - 120.0f, margin, Settings::hudTextScale * 3.0f);
    }

    // === Text-Panel ===
    glColor4f(1.0f, 1.0f, 1.0f, 1.0f);
    drawText(HudText::build(snap, displayHz), margin, margin, Settings::hudTextScale);

    // === Gauge ===
    drawGauge(snap, margin, h - margin - 24.0f, w - margin, h - margin);

    glDisableClientState(GL_VERTEX_ARRAY);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    glMatrixMode(GL_MODELVIEW);  glPopMatrix();
    glMatrixMode(GL_PROJECTION); glPopMatrix();

    if constexpr (Settings::debugLogging) {
        const GLenum err = glGetError();
        if (err != GL_NO_ERROR) FROSCH_LOG_HOST("[HUD] OpenGL error after draw: 0x%x", err);
    }
}

void cleanup() {
    if (vbo) glDeleteBuffers(1, &vbo);
    vbo = 0;
}

} // namespace Hud
