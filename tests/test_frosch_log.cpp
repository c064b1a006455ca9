#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "frosch_log.hpp"
#include "log_capture.hpp"

TEST_CASE("FroschLogger: sink receives the formatted message body")
{
    frosch::test::LogCapture log;
    FROSCH_LOG_HOST("[TEST] value=%d name=%s", 7, "frosch");

    REQUIRE(log.lines.size() == 1);
    CHECK(log.lines.front() == "[TEST] value=7 name=frosch");
}

TEST_CASE("FroschLogger: messages longer than 1024 characters are not cut short")
{
    frosch::test::LogCapture log;
    const std::string longText(2000, 'x');
    FROSCH_LOG_HOST("[TEST] %s END", longText.c_str());

    REQUIRE(log.lines.size() == 1);
    const std::string& line = log.lines.front();
    CHECK(line.size() == 7 + longText.size() + 4);
    CHECK(line.compare(line.size() - 3, 3, "END") == 0);
}

TEST_CASE("FroschLogger: a sink may log from inside itself")
{
    std::vector<std::string> seen;
    FroschLogger::setSink([&seen](const std::string& m) {
        seen.push_back(m);
        if (seen.size() == 1) FROSCH_LOG_HOST("[TEST] nested");
    });

    FROSCH_LOG_HOST("[TEST] outer");
    FroschLogger::setSink([](const std::string&) {});

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "[TEST] outer");
    CHECK(seen[1] == "[TEST] nested");
}
