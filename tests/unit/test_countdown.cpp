#include "board/countdown.hpp"

#include <catch2/catch.hpp>

using namespace mnemosyne::board;

static BoardInputs inputWith(int seconds) {
    BoardInputs in;
    in.isInputPhase = true;
    in.secondsRemaining = seconds;
    return in;
}

TEST_CASE("Countdown: severity bands", "[countdown]") {
    CountdownThresholds t;
    CHECK(classifyCountdown(15, t) == SEVERITY_CALM);
    CHECK(classifyCountdown(11, t) == SEVERITY_CALM);
    CHECK(classifyCountdown(10, t) == SEVERITY_WARNING);
    CHECK(classifyCountdown(6, t) == SEVERITY_WARNING);
    CHECK(classifyCountdown(5, t) == SEVERITY_CRITICAL);
    CHECK(classifyCountdown(0, t) == SEVERITY_CRITICAL);
}

TEST_CASE("Countdown: severity never drops as time runs out", "[countdown]") {
    const CountdownThresholds tables[] = {
        CountdownThresholds(),
        CountdownThresholds(3, 3),
        CountdownThresholds(2, 8),  // swapped
        CountdownThresholds(0, 0),
    };
    for (const CountdownThresholds& t : tables) {
        INFO("warning=" << t.warningAt << " critical=" << t.criticalAt);
        CountdownSeverity previous = classifyCountdown(60, t);
        for (int s = 59; s >= 0; s--) {
            CountdownSeverity now = classifyCountdown(s, t);
            CHECK(now >= previous);
            previous = now;
        }
    }
}

TEST_CASE("Countdown: presentation", "[countdown]") {
    CountdownThresholds t;

    SECTION("hidden outside the input phase") {
        BoardInputs in = inputWith(12);
        in.isInputPhase = false;
        CHECK_FALSE(presentCountdown(in, t).visible);
    }

    SECTION("hidden once time is up") {
        CHECK_FALSE(presentCountdown(inputWith(0), t).visible);
        CHECK_FALSE(presentCountdown(inputWith(-3), t).visible);
        CHECK(presentCountdown(inputWith(-3), t).secondsRemaining == 0);
    }

    SECTION("calm") {
        CountdownPresentation p = presentCountdown(inputWith(12), t);
        CHECK(p.visible);
        CHECK(p.secondsRemaining == 12);
        CHECK(p.severity == SEVERITY_CALM);
        CHECK_FALSE(p.pulsing);
        CHECK(p.emphasis == Approx(1.f));
    }

    SECTION("warning grows the text") {
        CountdownPresentation p = presentCountdown(inputWith(8), t);
        CHECK(p.severity == SEVERITY_WARNING);
        CHECK_FALSE(p.pulsing);
        CHECK(p.emphasis == Approx(1.2f));
    }

    SECTION("critical pulses") {
        CountdownPresentation p = presentCountdown(inputWith(3), t);
        CHECK(p.severity == SEVERITY_CRITICAL);
        CHECK(p.pulsing);
        CHECK(p.emphasis == Approx(1.5f));
    }

    SECTION("the caller may force pulsing") {
        BoardInputs in = inputWith(14);
        in.isTimerPulsing = true;
        CHECK(presentCountdown(in, t).pulsing);
    }

    SECTION("color is the caller's, not derived") {
        BoardInputs in = inputWith(14);
        in.timerColor = TIMER_RED;
        CHECK(presentCountdown(in, t).color == TIMER_RED);
    }
}

TEST_CASE("Countdown: default color classification", "[countdown]") {
    CHECK(timerColorForSeverity(SEVERITY_CALM) == TIMER_GREEN);
    CHECK(timerColorForSeverity(SEVERITY_WARNING) == TIMER_YELLOW);
    CHECK(timerColorForSeverity(SEVERITY_CRITICAL) == TIMER_RED);
}
