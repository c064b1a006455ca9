///// Otter: Central config; every value documented (purpose, range, default).
///// Schneefuchs: No hidden macros; single source of truth for timing and input flags.
///// Maus: frameDuration is fixed at 1/60 s by product intent; ASCII-only logs.
///// Datei: src/settings.hpp

#pragma once

// ============================================================================
// Central project settings – fully documented (only active/used switches).
// Policy: All runtime LOG/DEBUG output must be English and ASCII-only.
// No hidden semantics. Values are stable and compile-time constant.
// ============================================================================

namespace Settings {

// ============================== Logical Clock ================================

    // logicalFps
    // Rate of the logical game clock. Jump charge is defined in these frames.
    // Range: fixed | Default: 60
    inline constexpr int logicalFps = 60;

    // frameDuration
    // Length of one logical frame in seconds. Not user-adjustable.
    // Range: fixed | Default: 1/60
    inline constexpr double frameDuration = 1.0 / static_cast<double>(logicalFps);

    // maxElapsedClampSeconds
    // Upper bound for one elapsed-time sample (window stall, breakpoint, hidden tab).
    // Range: 0.05 .. 1.0 (seconds) | Default: 0.25
    inline constexpr double maxElapsedClampSeconds = 0.25;

    // maxCatchUpTicksPerCall
    // Hard cap on ticks emitted by a single advance() after a stall.
    // Range: 1 .. 60 | Default: 15  (= clamp ceiling / frameDuration)
    inline constexpr int maxCatchUpTicksPerCall = 15;

// ============================== Logging / Perf ===============================

    // debugLogging
    // Targeted debug/diagnostic output (edges, ticks, HUD).
    // Range: {false, true} | Default: false
    inline constexpr bool debugLogging = false;

    // performanceLogging
    // Condensed [LOOP] logs at a fixed cadence (refresh rate, tick).
    // Range: {false, true} | Default: true
    inline constexpr bool performanceLogging = true;

    // loopLogEvery
    // Cadence of [LOOP] lines in display refreshes.
    // Range: 30 .. 3600 | Default: 600
    inline constexpr int loopLogEvery = 600;

// ============================== Framerate / VSync ============================

    // preferVSync
    // Present on display refresh. The logical clock does not depend on it.
    inline constexpr bool preferVSync = true; // {false,true} | Default: true

// ============================== Input ========================================

    // Gamepad buttons (GLFW_GAMEPAD_BUTTON_*) that hold the charge.
    // A = 0, RIGHT_BUMPER = 5.
    inline constexpr int gamepadChargeButtons[] = { 0, 5 };

    // Mouse button (GLFW_MOUSE_BUTTON_*) that holds the charge. Left = 0.
    inline constexpr int mouseChargeButton = 0;

    // systemWideInput
    // Also listen to keyboard/left mouse while another window (the game) has focus.
    // Win32 raw input (RIDEV_INPUTSINK); other platforms fall back to window focus only.
    // Range: {false, true} | Default: true
    inline constexpr bool systemWideInput = true;

    // Number of joystick slots polled (GLFW_JOYSTICK_LAST + 1).
    inline constexpr int gamepadSlots = 16;

// ============================== Overlays / HUD ===============================

    inline constexpr float hudMargin      = 16.0f;  // px
    inline constexpr float hudTextScale   = 2.0f;   // 1.0 .. 4.0
    inline constexpr int   gaugeMaxFrames = 120;    // frames shown on the gauge
    inline constexpr int   gaugeTickEvery = 10;     // one tick mark per N frames

// ============================== Start / Window ===============================

    inline constexpr int         width      = 520;  // px
    inline constexpr int         height     = 260;  // px
    inline constexpr int         windowPosX = 100;  // px (<0 => centered)
    inline constexpr int         windowPosY = 100;  // px
    inline constexpr const char* windowTitle = "Frosch Frame Counter";

// ============================== Sanity checks ================================

static_assert(logicalFps > 0, "logicalFps must be > 0");
static_assert(maxElapsedClampSeconds > 0.0, "maxElapsedClampSeconds must be > 0");
static_assert(maxCatchUpTicksPerCall > 0, "maxCatchUpTicksPerCall must be > 0");
static_assert(loopLogEvery > 0, "loopLogEvery must be > 0");
static_assert(gaugeTickEvery > 0 && gaugeMaxFrames >= gaugeTickEvery,
              "gaugeTickEvery must be > 0 and <= gaugeMaxFrames");

} // namespace Settings
