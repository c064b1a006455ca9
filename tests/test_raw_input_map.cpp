#include <doctest/doctest.h>

#include "raw_input_map.hpp"

using namespace frosch;

TEST_CASE("RawInputMap: key make and break packets map to the system keyboard channel")
{
    const auto down = RawInputMap::fromKeyboard(0x20 /* space */, 0u, 1.25);
    REQUIRE(down.size() == 1);
    CHECK(down[0].source == InputSource::Keyboard);
    CHECK(down[0].channel == InputChannel::System);
    CHECK(down[0].code == 0x20);
    CHECK(down[0].held);
    CHECK(down[0].timestamp == doctest::Approx(1.25));

    const auto up = RawInputMap::fromKeyboard(0x20, RawInputMap::kKeyBreak, 1.5);
    REQUIRE(up.size() == 1);
    CHECK_FALSE(up[0].held);
}

TEST_CASE("RawInputMap: Escape and fake key codes never charge")
{
    CHECK(RawInputMap::fromKeyboard(RawInputMap::kVirtualKeyEscape, 0u, 0.0).empty());
    CHECK(RawInputMap::fromKeyboard(RawInputMap::kVirtualKeyFake, 0u, 0.0).empty());
    CHECK(RawInputMap::fromKeyboard(0, 0u, 0.0).empty());
}

TEST_CASE("RawInputMap: left button flags, down before up in one packet")
{
    CHECK(RawInputMap::fromMouseButtons(0u, 0.0).empty());
    CHECK(RawInputMap::fromMouseButtons(0x0004u /* right down */, 0.0).empty());

    const auto both = RawInputMap::fromMouseButtons(
        RawInputMap::kMouseLeftDown | RawInputMap::kMouseLeftUp, 2.0);
    REQUIRE(both.size() == 2);
    CHECK(both[0].source == InputSource::Mouse);
    CHECK(both[0].channel == InputChannel::System);
    CHECK(both[0].held);
    CHECK_FALSE(both[1].held);
}

TEST_CASE("RawInputMap: a click in another window becomes one press/release pair")
{
    InputNormalizer n;

    int presses = 0, releases = 0;
    auto feed = [&](const std::vector<RawInputEvent>& evs) {
        for (const auto& ev : evs) {
            if (auto e = n.normalize(ev)) {
                (e->kind == EdgeKind::Press ? presses : releases)++;
            }
        }
    };

    feed(RawInputMap::fromMouseButtons(RawInputMap::kMouseLeftDown, 0.0));
    feed(RawInputMap::fromMouseButtons(RawInputMap::kMouseLeftUp, 0.5));
    CHECK(presses == 1);
    CHECK(releases == 1);
}
