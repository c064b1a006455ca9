#include <doctest/doctest.h>

#include <vector>

#include "input_normalizer.hpp"
#include "log_capture.hpp"

using frosch::EdgeKind;
using frosch::GamepadStateProvider;
using frosch::InputNormalizer;
using frosch::InputSource;
using frosch::NormalizerConfig;
using frosch::RawInputEvent;

namespace {

RawInputEvent key(int code, bool held, double t = 0.0)   { return {InputSource::Keyboard, code, held, t}; }
RawInputEvent mouse(int btn, bool held, double t = 0.0)  { return {InputSource::Mouse, btn, held, t}; }
RawInputEvent pad(int slot, bool held, double t = 0.0)   { return {InputSource::Gamepad, slot, held, t}; }

class FakePads final : public GamepadStateProvider {
public:
    explicit FakePads(int slots) : connected_(slots, false), held_(slots, false) {}

    int  slotCount() const override { return static_cast<int>(connected_.size()); }
    bool connected(int slot) const override { return connected_[static_cast<std::size_t>(slot)]; }
    bool chargeHeld(int slot) const override { return held_[static_cast<std::size_t>(slot)]; }

    void plug(int slot, bool on)  { connected_[static_cast<std::size_t>(slot)] = on; }
    void hold(int slot, bool on)  { held_[static_cast<std::size_t>(slot)] = on; }

private:
    std::vector<bool> connected_;
    std::vector<bool> held_;
};

} // namespace

TEST_CASE("InputNormalizer: single source produces press and release edges")
{
    InputNormalizer n;
    auto p = n.normalize(key(32, true, 1.5));
    REQUIRE(p);
    CHECK(p->kind == EdgeKind::Press);
    CHECK(p->sourceTimestamp == doctest::Approx(1.5));
    CHECK(n.anyHeld());

    auto r = n.normalize(key(32, false, 2.0));
    REQUIRE(r);
    CHECK(r->kind == EdgeKind::Release);
    CHECK(r->sourceTimestamp == doctest::Approx(2.0));
    CHECK_FALSE(n.anyHeld());
}

TEST_CASE("InputNormalizer: overlapping sources merge into one hold")
{
    InputNormalizer n;

    // keyboard down, gamepad down, keyboard up, gamepad up
    auto e1 = n.normalize(key(65, true));
    auto e2 = n.normalize(pad(0, true));
    auto e3 = n.normalize(key(65, false));
    auto e4 = n.normalize(pad(0, false));

    REQUIRE(e1);
    CHECK(e1->kind == EdgeKind::Press);
    CHECK_FALSE(e2);
    CHECK_FALSE(e3);
    REQUIRE(e4);
    CHECK(e4->kind == EdgeKind::Release);
}

TEST_CASE("InputNormalizer: repeated held samples do not produce extra edges")
{
    InputNormalizer n;
    CHECK(n.normalize(key(10, true)));
    CHECK_FALSE(n.normalize(key(10, true)));
    CHECK_FALSE(n.normalize(key(11, true)));   // second key on the same source
    CHECK_FALSE(n.normalize(key(10, false)));  // key 11 still down
    CHECK(n.normalize(key(11, false)));
    CHECK_FALSE(n.normalize(key(11, false)));  // already released
}

TEST_CASE("InputNormalizer: only the bound mouse button charges")
{
    NormalizerConfig cfg;
    cfg.mouseChargeButton = 0;
    InputNormalizer n(cfg);

    CHECK_FALSE(n.normalize(mouse(1, true)));
    CHECK_FALSE(n.anyHeld());

    auto p = n.normalize(mouse(0, true));
    REQUIRE(p);
    CHECK(p->kind == EdgeKind::Press);
    CHECK(n.sourceHeld(InputSource::Mouse));
}

TEST_CASE("InputNormalizer: out-of-range codes are ignored")
{
    InputNormalizer n;
    CHECK_FALSE(n.normalize(key(-1, true)));
    CHECK_FALSE(n.normalize(key(100000, true)));
    CHECK_FALSE(n.normalize(pad(static_cast<int>(InputNormalizer::kGamepadSlots), true)));
    CHECK_FALSE(n.anyHeld());
}

TEST_CASE("InputNormalizer: a gamepad that disconnects while held counts as released")
{
    FakePads pads(4);
    pads.plug(2, true);
    pads.hold(2, true);

    InputNormalizer n;
    auto p = n.pollGamepads(pads, 0.5);
    REQUIRE(p);
    CHECK(p->kind == EdgeKind::Press);
    CHECK(n.sourceHeld(InputSource::Gamepad));

    CHECK_FALSE(n.pollGamepads(pads, 0.6)); // still held, no edge

    frosch::test::LogCapture log;
    pads.plug(2, false);
    auto r = n.pollGamepads(pads, 0.7);
    REQUIRE(r);
    CHECK(r->kind == EdgeKind::Release);
    CHECK(r->sourceTimestamp == doctest::Approx(0.7));
    CHECK_FALSE(n.sourceHeld(InputSource::Gamepad));
    CHECK(log.contains("gone while held"));
}

TEST_CASE("InputNormalizer: gamepad disconnect is no release while the keyboard still holds")
{
    FakePads pads(2);
    pads.plug(0, true);
    pads.hold(0, true);

    InputNormalizer n;
    REQUIRE(n.pollGamepads(pads, 0.0));
    CHECK_FALSE(n.normalize(key(32, true)));

    pads.plug(0, false);
    CHECK_FALSE(n.pollGamepads(pads, 0.1));
    CHECK(n.anyHeld());

    auto r = n.normalize(key(32, false));
    REQUIRE(r);
    CHECK(r->kind == EdgeKind::Release);
}

TEST_CASE("InputNormalizer: releasing a source or everything")
{
    InputNormalizer n;
    n.normalize(key(5, true));
    n.normalize(mouse(0, true));

    CHECK_FALSE(n.releaseSource(InputSource::Keyboard, 1.0)); // mouse still down
    CHECK_FALSE(n.sourceHeld(InputSource::Keyboard));

    auto r = n.releaseSource(InputSource::Mouse, 1.1);
    REQUIRE(r);
    CHECK(r->kind == EdgeKind::Release);

    n.normalize(pad(3, true));
    auto all = n.releaseAll(2.0);
    REQUIRE(all);
    CHECK(all->kind == EdgeKind::Release);
    CHECK_FALSE(n.releaseAll(2.1));
}

TEST_CASE("InputNormalizer: focus loss leaves the system-wide channel held")
{
    InputNormalizer n;

    RawInputEvent sys = key(0x20, true, 1.0);
    sys.channel = frosch::InputChannel::System;
    auto p = n.normalize(sys);
    REQUIRE(p);
    CHECK(p->kind == EdgeKind::Press);

    // Our window loses focus to the game: only window state is dropped.
    CHECK_FALSE(n.releaseChannel(frosch::InputChannel::Window, 1.1));
    CHECK(n.channelHeld(frosch::InputChannel::System));
    CHECK(n.anyHeld());

    sys.held = false;
    sys.timestamp = 2.0;
    auto r = n.normalize(sys);
    REQUIRE(r);
    CHECK(r->kind == EdgeKind::Release);
    CHECK(r->sourceTimestamp == doctest::Approx(2.0));
}

TEST_CASE("InputNormalizer: the same key seen by window and system channels is one hold")
{
    InputNormalizer n;

    RawInputEvent win = key(32, true, 0.0);
    RawInputEvent sys = key(0x20, true, 0.0);
    sys.channel = frosch::InputChannel::System;

    CHECK(n.normalize(win));
    CHECK_FALSE(n.normalize(sys));

    win.held = false;
    sys.held = false;
    CHECK_FALSE(n.normalize(win)); // system copy still down
    auto r = n.normalize(sys);
    REQUIRE(r);
    CHECK(r->kind == EdgeKind::Release);
}

TEST_CASE("InputNormalizer: releasing the system channel ends a background-only hold")
{
    InputNormalizer n;
    RawInputEvent click = mouse(0, true, 0.0);
    click.channel = frosch::InputChannel::System;
    REQUIRE(n.normalize(click));
    CHECK(n.sourceHeld(InputSource::Mouse));
    CHECK_FALSE(n.channelHeld(frosch::InputChannel::Window));

    auto r = n.releaseChannel(frosch::InputChannel::System, 0.3);
    REQUIRE(r);
    CHECK(r->kind == EdgeKind::Release);
    CHECK_FALSE(n.anyHeld());
}
