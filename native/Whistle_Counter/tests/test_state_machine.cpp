#include <catch2/catch.hpp>
#include "wc/whistle_state_machine.hpp"

using wc::WhistleState;

// Times on a 0.25 s grid stay exact in binary floating point.
static wc::DetectorConfig sm_config() {
    wc::DetectorConfig c;
    c.rise = 6.0;
    c.fall = 3.0;
    c.hold_seconds = 0.5;
    c.min_duration = 2.0;
    c.max_duration = 15.0;
    return c;
}

static const double F = 1.0;   // fixed floor

TEST_CASE("opens only strictly above rise x floor", "[state]") {
    wc::WhistleStateMachine sm(sm_config());
    REQUIRE(sm.state() == WhistleState::Idle);

    REQUIRE_FALSE(sm.step(6.0, F, 0.0));
    REQUIRE(sm.state() == WhistleState::Idle);
    REQUIRE_FALSE(sm.session().has_value());

    REQUIRE_FALSE(sm.step(6.5, F, 0.25));
    REQUIRE(sm.state() == WhistleState::InWhistle);
    REQUIRE(sm.session()->start_time == 0.25);
    REQUIRE_FALSE(sm.session()->low_since.has_value());
}

TEST_CASE("closes after energy stays low for the hold time", "[state]") {
    wc::WhistleStateMachine sm(sm_config());
    sm.step(10.0, F, 0.0);
    for (double t = 0.25; t < 3.0; t += 0.25) REQUIRE_FALSE(sm.step(10.0, F, t));

    REQUIRE_FALSE(sm.step(1.0, F, 3.0));
    REQUIRE(*sm.session()->low_since == 3.0);
    REQUIRE_FALSE(sm.step(1.0, F, 3.25));

    auto ev = sm.step(1.0, F, 3.5);
    REQUIRE(ev);
    REQUIRE(ev->start_time == 0.0);
    REQUIRE(ev->end_time == 3.5);
    REQUIRE(ev->duration == 3.5);
    REQUIRE(ev->accepted);
    REQUIRE(ev->count == 1);
    REQUIRE(sm.state() == WhistleState::Idle);
    REQUIRE_FALSE(sm.session().has_value());
    REQUIRE(sm.count() == 1);
}

TEST_CASE("short dip followed by recovery does not close and resets the dwell", "[state]") {
    wc::WhistleStateMachine sm(sm_config());
    sm.step(10.0, F, 0.0);
    sm.step(10.0, F, 1.75);

    REQUIRE_FALSE(sm.step(1.0, F, 2.0));     // dip starts
    REQUIRE_FALSE(sm.step(1.0, F, 2.25));
    REQUIRE_FALSE(sm.step(10.0, F, 2.5));    // back up; a continued dip would close here
    REQUIRE(sm.state() == WhistleState::InWhistle);
    REQUIRE_FALSE(sm.session()->low_since.has_value());

    REQUIRE_FALSE(sm.step(1.0, F, 2.75));
    REQUIRE(*sm.session()->low_since == 2.75);
    REQUIRE_FALSE(sm.step(1.0, F, 3.0));

    auto ev = sm.step(1.0, F, 3.25);
    REQUIRE(ev);
    REQUIRE(ev->start_time == 0.0);
    REQUIRE(ev->duration == 3.25);
    REQUIRE(ev->count == 1);
}

TEST_CASE("energy inside the hysteresis band counts as still whistling", "[state]") {
    wc::WhistleStateMachine sm(sm_config());
    sm.step(10.0, F, 0.0);
    sm.step(1.0, F, 0.25);
    REQUIRE(sm.session()->low_since.has_value());

    // exactly fall x floor is not below it
    sm.step(3.0, F, 0.5);
    REQUIRE_FALSE(sm.session()->low_since.has_value());
    for (double t = 0.75; t < 5.0; t += 0.25) {
        REQUIRE_FALSE(sm.step(4.0, F, t));
    }
    REQUIRE(sm.state() == WhistleState::InWhistle);
}

TEST_CASE("duration window decides acceptance", "[state]") {
    wc::WhistleStateMachine sm(sm_config());

    auto whistle = [&](double start, double quiet_at) {
        sm.step(10.0, F, start);
        sm.step(1.0, F, quiet_at);
        sm.step(1.0, F, quiet_at + 0.25);
        return sm.step(1.0, F, quiet_at + 0.5);
    };

    SECTION("too short is reported but not counted") {
        auto ev = whistle(0.0, 1.0);              // 1.5 s
        REQUIRE(ev);
        REQUIRE_FALSE(ev->accepted);
        REQUIRE(ev->count == 0);
        REQUIRE(sm.count() == 0);
    }
    SECTION("bounds are inclusive") {
        auto a = whistle(0.0, 1.5);               // exactly 2.0 s
        REQUIRE(a->accepted);
        REQUIRE(a->count == 1);
        auto b = whistle(10.0, 24.5);             // exactly 15.0 s
        REQUIRE(b->accepted);
        REQUIRE(b->count == 2);
        auto c = whistle(30.0, 44.75);            // 15.25 s
        REQUIRE_FALSE(c->accepted);
        REQUIRE(c->count == 0);
        REQUIRE(sm.count() == 2);
    }
    SECTION("rejected events do not disturb numbering") {
        REQUIRE_FALSE(whistle(0.0, 0.5)->accepted);
        auto ev = whistle(5.0, 8.0);
        REQUIRE(ev->accepted);
        REQUIRE(ev->count == 1);
    }
}

TEST_CASE("zero hold closes on the first quiet block", "[state]") {
    auto c = sm_config();
    c.hold_seconds = 0.0;
    c.min_duration = 0.0;
    wc::WhistleStateMachine sm(c);

    sm.step(10.0, F, 0.0);
    auto ev = sm.step(1.0, F, 0.25);
    REQUIRE(ev);
    REQUIRE(ev->duration == 0.25);
    REQUIRE(ev->accepted);
}

TEST_CASE("thresholds scale with the floor passed in", "[state]") {
    wc::WhistleStateMachine sm(sm_config());
    REQUIRE_FALSE(sm.step(10.0, 2.0, 0.0));
    REQUIRE(sm.state() == WhistleState::Idle);     // 10 < 6 x 2
    sm.step(12.5, 2.0, 0.25);
    REQUIRE(sm.state() == WhistleState::InWhistle);
    sm.step(5.5, 2.0, 0.5);                        // < 3 x 2
    REQUIRE(sm.session()->low_since.has_value());
}
