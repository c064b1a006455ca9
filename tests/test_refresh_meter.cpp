#include <doctest/doctest.h>

#include <cmath>
#include <limits>

#include "refresh_meter.hpp"

using frosch::RefreshMeter;

TEST_CASE("RefreshMeter: reports zero before the first sample")
{
    RefreshMeter m;
    CHECK(m.currentHz() == 0.0);
    CHECK(m.currentHzInt() == 0);
}

TEST_CASE("RefreshMeter: converges on a steady display rate")
{
    RefreshMeter m;
    for (int i = 0; i < 200; ++i) m.update(1.0 / 144.0);
    CHECK(m.currentHz() == doctest::Approx(144.0).epsilon(0.001));
    CHECK(m.currentHzInt() == 144);
}

TEST_CASE("RefreshMeter: a single hitch is damped")
{
    RefreshMeter m;
    for (int i = 0; i < 100; ++i) m.update(1.0 / 60.0);
    m.update(0.5); // half-second stall
    CHECK(m.currentHz() > 50.0);
}

TEST_CASE("RefreshMeter: invalid intervals are ignored and reset clears state")
{
    RefreshMeter m;
    m.update(1.0 / 75.0);
    const double hz = m.currentHz();

    m.update(std::numeric_limits<double>::quiet_NaN());
    m.update(-0.01);
    m.update(0.0);
    CHECK(m.currentHz() == hz);

    m.reset();
    CHECK(m.currentHzInt() == 0);
}
