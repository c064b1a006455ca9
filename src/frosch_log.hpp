// MAUS:
// Datei: src/frosch_log.hpp
// 🐭 Maus: Host-only Logging, klarer Vertrag, ASCII-only.
// 🦦 Otter: Ein Makro fuer alle Module; Tags in eckigen Klammern ([CLOCK], [CHARGE], ...).
// 🦊 Schneefuchs: Keine Header-Seiteneffekte, /WX-fest; Test-Sink statt stdout umleitbar.
#pragma once

#include <cstdarg>
#include <functional>
#include <string>

namespace FroschLogger {
    // Thread-safe host logger with uniform formatting.
    void logMessage(const char* file, int line, const char* fmt, ...);
    void flushLogs();

    // Optional: also mirror logs to the Windows debugger (OutputDebugStringA).
    // Default: enabled on Windows, ignored elsewhere.
    void setMirrorToDebugger(bool enable) noexcept;

    // Receives the formatted message (without timestamp/location prefix).
    // While a sink is installed, stdout stays quiet. Pass {} to restore stdout.
    using Sink = std::function<void(const std::string& message)>;
    void setSink(Sink sink);
}

// Variadic convenience macro: captures call site file/line.
#define FROSCH_LOG_HOST(...) ::FroschLogger::logMessage(__FILE__, __LINE__, __VA_ARGS__)
