// tests/log_capture.hpp
//
// Collects FROSCH_LOG_HOST messages for the lifetime of the object.
#pragma once

#include <string>
#include <vector>

#include "frosch_log.hpp"

namespace frosch::test {

class LogCapture {
public:
    LogCapture() {
        FroschLogger::setSink([this](const std::string& m) { lines.push_back(m); });
    }
    ~LogCapture() {
        FroschLogger::setSink([](const std::string&) {});
    }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(const std::string& needle) const {
        for (const auto& l : lines) {
            if (l.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> lines;
};

} // namespace frosch::test
