#include <doctest/doctest.h>

#include "charge_counter.hpp"
#include "log_capture.hpp"

using frosch::ChargeCounter;
using frosch::ChargeError;
using frosch::ChargeStatus;
using frosch::EdgeKind;
using frosch::EdgeResult;
using frosch::InputEdge;

namespace {
    InputEdge press(double t = 0.0)   { return InputEdge{EdgeKind::Press, t}; }
    InputEdge release(double t = 0.0) { return InputEdge{EdgeKind::Release, t}; }
}

TEST_CASE("ChargeCounter: press at tick 10, release at tick 130 completes with 120 frames")
{
    ChargeCounter c;
    CHECK(c.state() == ChargeStatus::Idle);

    EdgeResult p = c.onEdge(press(), 10);
    CHECK(p.ok());
    CHECK_FALSE(p.ignored);
    CHECK(c.state() == ChargeStatus::Charging);
    REQUIRE(c.activeSession());
    CHECK(c.activeSession()->startTick == 10);
    CHECK_FALSE(c.activeSession()->endTick);

    CHECK(c.runningFrames(70) == 60u);

    EdgeResult r = c.onEdge(release(), 130);
    CHECK(r.ok());
    REQUIRE(r.completed);
    CHECK(r.completed->status == ChargeStatus::Completed);
    CHECK(r.completed->startTick == 10);
    CHECK(r.completed->endTick == 130u);
    CHECK(r.completed->frameCount() == 120);

    CHECK(c.state() == ChargeStatus::Idle);
    CHECK_FALSE(c.runningFrames(131));
    REQUIRE(c.lastCompleted());
    CHECK(c.lastCompleted()->frameCount() == 120);
    CHECK(c.completedCount() == 1);
}

TEST_CASE("ChargeCounter: press and release on the same tick is a zero-frame charge")
{
    ChargeCounter c;
    c.onEdge(press(), 5);
    EdgeResult r = c.onEdge(release(), 5);
    REQUIRE(r.completed);
    CHECK(r.completed->frameCount() == 0);
    CHECK(c.completedCount() == 1);
}

TEST_CASE("ChargeCounter: a second press while charging does not restart the charge")
{
    ChargeCounter c;
    c.onEdge(press(), 10);
    EdgeResult again = c.onEdge(press(), 40);
    CHECK(again.ok());
    CHECK(again.ignored);
    REQUIRE(c.activeSession());
    CHECK(c.activeSession()->startTick == 10);

    EdgeResult r = c.onEdge(release(), 70);
    REQUIRE(r.completed);
    CHECK(r.completed->frameCount() == 60);
}

TEST_CASE("ChargeCounter: a release before any press is ignored")
{
    ChargeCounter c;
    EdgeResult r = c.onEdge(release(), 3);
    CHECK(r.ok());
    CHECK(r.ignored);
    CHECK_FALSE(r.completed);
    CHECK(c.state() == ChargeStatus::Idle);
    CHECK(c.errorCount() == 0);
}

TEST_CASE("ChargeCounter: a release while idle after a finished charge is out of order")
{
    ChargeCounter c;
    c.onEdge(press(), 1);
    c.onEdge(release(), 2);

    frosch::test::LogCapture log;
    EdgeResult r = c.onEdge(release(), 3);
    CHECK(r.error == ChargeError::OutOfOrderEdge);
    CHECK_FALSE(r.completed);
    CHECK(c.state() == ChargeStatus::Idle);
    CHECK(c.errorCount() == 1);
    CHECK(c.completedCount() == 1);
    CHECK(log.contains("OutOfOrderEdge"));
}

TEST_CASE("ChargeCounter: tick regression discards the open session and recovers")
{
    ChargeCounter c;
    c.onEdge(press(), 1);
    c.onEdge(release(), 31);
    REQUIRE(c.lastCompleted());

    c.onEdge(press(), 50);
    REQUIRE(c.state() == ChargeStatus::Charging);

    frosch::test::LogCapture log;
    EdgeResult bad = c.onEdge(release(), 40);
    CHECK(bad.error == ChargeError::OutOfOrderEdge);
    CHECK_FALSE(bad.completed);
    CHECK(c.state() == ChargeStatus::Idle);
    CHECK(log.contains("tick regression"));

    // The previous result is untouched; no fabricated completion.
    CHECK(c.lastCompleted()->frameCount() == 30);
    CHECK(c.completedCount() == 1);

    // Normal operation resumes from the new baseline.
    CHECK(c.onEdge(press(), 60).ok());
    EdgeResult r = c.onEdge(release(), 90);
    REQUIRE(r.completed);
    CHECK(r.completed->frameCount() == 30);
    CHECK(c.completedCount() == 2);
}

TEST_CASE("ChargeCounter: the physical release after a regressed press is swallowed")
{
    ChargeCounter c;
    c.onEdge(press(), 20);
    c.onEdge(release(), 30);

    EdgeResult bad = c.onEdge(press(), 25);
    CHECK(bad.error == ChargeError::OutOfOrderEdge);
    CHECK(c.state() == ChargeStatus::Idle);

    EdgeResult stray = c.onEdge(release(), 40);
    CHECK(stray.ok());
    CHECK(stray.ignored);
    CHECK(c.errorCount() == 1);
}

TEST_CASE("ChargeCounter: abandon closes an open charge without reporting it")
{
    ChargeCounter c;
    c.onEdge(press(), 0);
    c.onEdge(release(), 45);

    c.onEdge(press(), 100);
    const auto s = c.abandon(150);
    REQUIRE(s);
    CHECK(s->status == ChargeStatus::Abandoned);
    CHECK(s->startTick == 100);
    CHECK_FALSE(s->endTick);

    CHECK(c.state() == ChargeStatus::Idle);
    CHECK(c.completedCount() == 1);
    REQUIRE(c.lastCompleted());
    CHECK(c.lastCompleted()->frameCount() == 45);

    CHECK_FALSE(c.abandon(151)); // nothing open
}

TEST_CASE("ChargeCounter: reset forgets completed charges and errors")
{
    ChargeCounter c;
    c.onEdge(press(), 5);
    c.onEdge(release(), 9);
    c.onEdge(release(), 10); // error
    REQUIRE(c.errorCount() == 1);

    c.reset();
    CHECK(c.state() == ChargeStatus::Idle);
    CHECK_FALSE(c.lastCompleted());
    CHECK(c.completedCount() == 0);
    CHECK(c.errorCount() == 0);

    // After a reset, ticks may start from zero again.
    CHECK(c.onEdge(press(), 0).ok());
}

TEST_CASE("ChargeCounter: a release below the start tick fails as a tick regression")
{
    ChargeCounter c;
    c.onEdge(press(), 100);

    frosch::test::LogCapture log;
    EdgeResult r = c.onEdge(release(), 99);
    CHECK(r.error == ChargeError::OutOfOrderEdge);
    CHECK_FALSE(r.completed);
    CHECK(c.state() == ChargeStatus::Idle);
    CHECK(c.completedCount() == 0);
    CHECK(log.contains("tick regression"));
}
