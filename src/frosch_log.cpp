// MAUS:
// Datei: src/frosch_log.cpp
// 🐭 Maus-Kommentar: Host-Logging – praezise Zeitstempel, ASCII-only.
// 🦦 Otter: Ein Format fuer alle Tags; Sink fuer Tests.
// 🦊 Schneefuchs: Thread-safe, /WX-fest, kein strncat.

#include "frosch_log.hpp"
#include <chrono>
#include <ctime>
#include <mutex>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

#if defined(_WIN32)
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #include <windows.h> // OutputDebugStringA
#endif

namespace FroschLogger {
    namespace {
        std::mutex g_logMutex;
        Sink       g_sink;
    #if defined(_WIN32)
        bool g_mirrorToDebugger = true;  // default: mirror logs to debugger
    #else
        bool g_mirrorToDebugger = false;
    #endif

        // Plattformuebergreifend, threadsicher
        void getLocalTime(std::tm& out, std::time_t t) {
        #if defined(_WIN32)
            localtime_s(&out, &t);
        #else
            localtime_r(&t, &out);
        #endif
        }
    } // anon

    void setMirrorToDebugger(bool enable) noexcept {
        std::lock_guard<std::mutex> guard(g_logMutex);
        g_mirrorToDebugger = enable;
    }

    void setSink(Sink sink) {
        std::lock_guard<std::mutex> guard(g_logMutex);
        g_sink = std::move(sink);
    }

    void logMessage(const char* file, int line, const char* fmt, ...) {
        // Message body first, sized by a dry run; reused for sink, stdout and debugger.
        std::string body;
        va_list args;
        va_start(args, fmt);
        va_list sizingArgs;
        va_copy(sizingArgs, args);
        const int m = std::vsnprintf(nullptr, 0, fmt, sizingArgs);
        va_end(sizingArgs);
        if (m > 0) {
            body.resize(static_cast<std::size_t>(m) + 1);
            std::vsnprintf(&body[0], body.size(), fmt, args);
            body.resize(static_cast<std::size_t>(m));
        }
        va_end(args);

        std::unique_lock<std::mutex> lock(g_logMutex);

        if (g_sink) {
            // Called unlocked: a sink may log itself.
            const Sink sink = g_sink;
            lock.unlock();
            sink(body);
            return;
        }

        // Filename only (strip path)
        const char* base = std::strrchr(file, '\\');
        if (!base) base = std::strrchr(file, '/');
        base = base ? base + 1 : file;

        // Timestamp (YYYY-MM-DD HH:MM:SS.mmm)
        const auto now = std::chrono::system_clock::now();
        const auto t   = std::chrono::system_clock::to_time_t(now);
        const auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                             now.time_since_epoch()) % 1000;

        std::tm tm{};
        getLocalTime(tm, t);

        char ts[32];
        std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

        char prefix[96];
        std::snprintf(prefix, sizeof(prefix), "[%s.%03lld][%s][%d]: ",
                      ts, static_cast<long long>(ms.count()), base, line);

        // ----- stdout pass -----
        std::fputs(prefix, stdout);
        std::fputs(body.c_str(), stdout);
        std::fputc('\n', stdout);
        std::fflush(stdout);

        // ----- optional debugger mirror (Windows) -----
    #if defined(_WIN32)
        if (g_mirrorToDebugger) {
            const std::string full = std::string(prefix) + body + "\n";
            OutputDebugStringA(full.c_str());
        }
    #endif
    }

    void flushLogs() { std::fflush(stdout); }

} // namespace FroschLogger
