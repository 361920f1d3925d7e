#include "board/coordinator.hpp"

#include <catch2/catch.hpp>

#include <vector>

using namespace mnemosyne::board;

// ============================================================================
// RecordingFeedback: records every trigger request
// ============================================================================

class RecordingFeedback : public FeedbackTrigger {
public:
    std::vector<float> pulses;

    void trigger(float seconds) override {
        pulses.push_back(seconds);
    }
};

// ============================================================================
// Helpers
// ============================================================================

struct Recorder {
    std::vector<Region> clicks;
    int submits = 0;
    std::vector<int> finishedRounds;

    BoardCallbacks callbacks() {
        BoardCallbacks cb;
        cb.onColorClick = [this](Region r) { clicks.push_back(r); };
        cb.onSubmit = [this]() { submits++; };
        cb.onPlaybackFinished = [this](int round) { finishedRounds.push_back(round); };
        return cb;
    }
};

static BoardInputs showing(const std::vector<Region>& sequence, int round = 1) {
    BoardInputs in;
    in.sequence = sequence;
    in.round = round;
    in.isShowingSequence = true;
    return in;
}

static BoardInputs inputPhase(const std::vector<Region>& sequence, size_t entered = 0) {
    BoardInputs in;
    in.sequence = sequence;
    in.isInputPhase = true;
    in.playerSequence.assign(sequence.begin(), sequence.begin() + entered);
    in.canSubmit = entered == sequence.size();
    in.secondsRemaining = 15;
    return in;
}

// Steps the coordinator in small increments, counting rising edges into "lit"
struct Stepper {
    PlaybackCoordinator& coordinator;
    int activations = 0;
    Region last = NO_REGION;

    explicit Stepper(PlaybackCoordinator& c) : coordinator(c), last(c.activeRegion()) {}

    void runTo(double t) {
        const double dt = 0.01;
        while (coordinator.now() + dt <= t + 1e-9) {
            coordinator.process(dt);
            Region now = coordinator.activeRegion();
            if (now != NO_REGION && now != last) activations++;
            last = now;
        }
    }
};

// ============================================================================
// Playback
// ============================================================================

TEST_CASE("Coordinator: reveals [red, blue] with the default timing", "[coordinator]") {
    PlaybackCoordinator coordinator;
    Recorder rec;
    coordinator.setCallbacks(rec.callbacks());

    Stepper stepper(coordinator);
    coordinator.update(showing({COLOR_RED, COLOR_BLUE}));
    REQUIRE(coordinator.isPlaying());
    CHECK(coordinator.activeRegion() == COLOR_RED);

    stepper.runTo(0.35);
    CHECK(coordinator.activeRegion() == COLOR_RED);
    stepper.runTo(0.85);
    CHECK(coordinator.activeRegion() == NO_REGION);
    stepper.runTo(1.35);
    CHECK(coordinator.activeRegion() == COLOR_BLUE);
    CHECK(coordinator.playbackIndex() == 1);
    stepper.runTo(1.75);
    CHECK(coordinator.activeRegion() == NO_REGION);
    CHECK(coordinator.isPlaying());

    stepper.runTo(2.5);
    CHECK(coordinator.activeRegion() == NO_REGION);
    CHECK_FALSE(coordinator.isPlaying());
    CHECK(stepper.activations == 2);

    REQUIRE(rec.finishedRounds.size() == 1);
    CHECK(rec.finishedRounds[0] == 1);
}

TEST_CASE("Coordinator: cancelling mid-gap never shows the next region", "[coordinator]") {
    PlaybackCoordinator coordinator;
    Recorder rec;
    coordinator.setCallbacks(rec.callbacks());

    coordinator.update(showing({COLOR_RED, COLOR_BLUE}));
    Stepper stepper(coordinator);
    stepper.runTo(0.75);
    REQUIRE(coordinator.activeRegion() == NO_REGION);

    BoardInputs stopped = showing({COLOR_RED, COLOR_BLUE});
    stopped.isShowingSequence = false;
    coordinator.update(stopped);
    CHECK_FALSE(coordinator.isPlaying());

    stepper.runTo(3.0);
    CHECK(stepper.activations == 0);
    CHECK(coordinator.activeRegion() == NO_REGION);
    CHECK(rec.finishedRounds.empty());
}

TEST_CASE("Coordinator: identity changes restart playback", "[coordinator]") {
    PlaybackCoordinator coordinator;
    Recorder rec;
    coordinator.setCallbacks(rec.callbacks());

    coordinator.update(showing({COLOR_RED, COLOR_BLUE}, 1));
    uint64_t firstGen = coordinator.generation();
    coordinator.process(0.5);

    SECTION("same round and contents keep the run") {
        coordinator.update(showing({COLOR_RED, COLOR_BLUE}, 1));
        CHECK(coordinator.generation() == firstGen);
        CHECK(coordinator.activeRegion() == COLOR_RED);
    }

    SECTION("new contents start over from index 0") {
        coordinator.update(showing({COLOR_GREEN, COLOR_BLUE, COLOR_YELLOW}, 1));
        CHECK(coordinator.generation() != firstGen);
        CHECK(coordinator.playbackIndex() == 0);
        CHECK(coordinator.activeRegion() == COLOR_GREEN);

        // The old run's timers are stale and must not cut the new reveal short
        coordinator.process(0.3);
        CHECK(coordinator.activeRegion() == COLOR_GREEN);
    }

    SECTION("a new round with the same contents restarts") {
        coordinator.update(showing({COLOR_RED, COLOR_BLUE}, 2));
        CHECK(coordinator.generation() != firstGen);
        CHECK(coordinator.playbackIndex() == 0);
    }

    CHECK(rec.finishedRounds.empty());
}

TEST_CASE("Coordinator: a finished run is not replayed", "[coordinator]") {
    PlaybackCoordinator coordinator;
    Recorder rec;
    coordinator.setCallbacks(rec.callbacks());

    coordinator.update(showing({COLOR_YELLOW}, 3));
    coordinator.process(2.0);
    REQUIRE(rec.finishedRounds.size() == 1);
    CHECK(rec.finishedRounds[0] == 3);

    // Caller re-sends the same snapshot before leaving show mode
    coordinator.update(showing({COLOR_YELLOW}, 3));
    CHECK_FALSE(coordinator.isPlaying());
    coordinator.process(2.0);
    CHECK(rec.finishedRounds.size() == 1);
}

TEST_CASE("Coordinator: timing is configurable", "[coordinator]") {
    PlaybackTiming timing;
    timing.showDuration = 0.2f;
    timing.showGap = 0.1f;
    PlaybackCoordinator coordinator(timing);
    Recorder rec;
    coordinator.setCallbacks(rec.callbacks());

    coordinator.update(showing({COLOR_RED, COLOR_GREEN}));
    coordinator.process(0.25);
    CHECK(coordinator.activeRegion() == NO_REGION);
    coordinator.process(0.1);
    CHECK(coordinator.activeRegion() == COLOR_GREEN);
    coordinator.process(0.3);
    CHECK(rec.finishedRounds.size() == 1);
}

TEST_CASE("Coordinator: a disabled spectator board still plays back", "[coordinator]") {
    PlaybackCoordinator coordinator;
    BoardInputs in = showing({COLOR_BLUE});
    in.disabled = true;
    coordinator.update(in);
    CHECK(coordinator.isPlaying());
    CHECK(coordinator.activeRegion() == COLOR_BLUE);
}

TEST_CASE("Coordinator: empty sequence never plays", "[coordinator]") {
    PlaybackCoordinator coordinator;
    coordinator.update(showing({}));
    CHECK_FALSE(coordinator.isPlaying());
    CHECK(coordinator.activeRegion() == NO_REGION);
}

// ============================================================================
// Clicks
// ============================================================================

TEST_CASE("Coordinator: clicks are gated by phase", "[coordinator]") {
    PlaybackCoordinator coordinator;
    Recorder rec;
    RecordingFeedback feedback;
    coordinator.setCallbacks(rec.callbacks());
    coordinator.setFeedback(&feedback);

    SECTION("while showing") {
        coordinator.update(showing({COLOR_RED}));
        CHECK_FALSE(coordinator.clickRegion(COLOR_RED));
        coordinator.process(5.0);
        // Still in show mode after the run finished
        CHECK_FALSE(coordinator.clickRegion(COLOR_RED));
    }

    SECTION("outside the input phase") {
        BoardInputs idle;
        idle.sequence = {COLOR_RED};
        coordinator.update(idle);
        CHECK_FALSE(coordinator.acceptsClicks());
        CHECK_FALSE(coordinator.clickRegion(COLOR_GREEN));
    }

    SECTION("when disabled") {
        BoardInputs in = inputPhase({COLOR_RED});
        in.disabled = true;
        coordinator.update(in);
        CHECK_FALSE(coordinator.clickRegion(COLOR_RED));
    }

    SECTION("negative region ids") {
        coordinator.update(inputPhase({COLOR_RED}));
        CHECK_FALSE(coordinator.clickRegion(NO_REGION));
        CHECK_FALSE(coordinator.clickRegion(-7));
    }

    CHECK(rec.clicks.empty());
    CHECK(feedback.pulses.empty());
}

TEST_CASE("Coordinator: accepted click flashes and reports", "[coordinator]") {
    PlaybackCoordinator coordinator;
    Recorder rec;
    RecordingFeedback feedback;
    coordinator.setCallbacks(rec.callbacks());
    coordinator.setFeedback(&feedback);
    coordinator.update(inputPhase({COLOR_RED, COLOR_BLUE}));

    REQUIRE(coordinator.clickRegion(COLOR_BLUE));
    CHECK(coordinator.activeRegion() == COLOR_BLUE);
    REQUIRE(rec.clicks.size() == 1);
    CHECK(rec.clicks[0] == COLOR_BLUE);
    REQUIRE(feedback.pulses.size() == 1);
    CHECK(feedback.pulses[0] == Approx(0.05f));

    coordinator.process(0.1);
    CHECK(coordinator.activeRegion() == COLOR_BLUE);
    coordinator.process(0.1);
    CHECK(coordinator.activeRegion() == NO_REGION);
}

TEST_CASE("Coordinator: a newer click owns the highlight", "[coordinator]") {
    PlaybackCoordinator coordinator;
    Recorder rec;
    coordinator.setCallbacks(rec.callbacks());
    coordinator.update(inputPhase({COLOR_RED, COLOR_BLUE}));

    coordinator.clickRegion(COLOR_RED);
    coordinator.process(0.1);
    coordinator.clickRegion(COLOR_GREEN);

    // The first flash would have ended at 0.15
    coordinator.process(0.1);
    CHECK(coordinator.activeRegion() == COLOR_GREEN);
    coordinator.process(0.1);
    CHECK(coordinator.activeRegion() == NO_REGION);
    CHECK(rec.clicks.size() == 2);
}

TEST_CASE("Coordinator: playback start supersedes a click flash", "[coordinator]") {
    PlaybackCoordinator coordinator;
    coordinator.update(inputPhase({COLOR_RED}));
    coordinator.clickRegion(COLOR_RED);

    coordinator.update(showing({COLOR_RED, COLOR_YELLOW}, 2));
    CHECK(coordinator.activeRegion() == COLOR_RED);
    // Past the flash window the reveal is still lit
    coordinator.process(0.3);
    CHECK(coordinator.activeRegion() == COLOR_RED);
    coordinator.process(0.5);
    CHECK(coordinator.activeRegion() == NO_REGION);
    coordinator.process(0.3);
    CHECK(coordinator.activeRegion() == COLOR_YELLOW);
}

TEST_CASE("Coordinator: disabling cancels the click flash", "[coordinator]") {
    PlaybackCoordinator coordinator;
    coordinator.update(inputPhase({COLOR_RED}));
    REQUIRE(coordinator.clickRegion(COLOR_YELLOW));
    REQUIRE(coordinator.activeRegion() == COLOR_YELLOW);

    BoardInputs disabled = inputPhase({COLOR_RED});
    disabled.disabled = true;
    coordinator.update(disabled);
    CHECK(coordinator.activeRegion() == NO_REGION);
}

TEST_CASE("Coordinator: works without a feedback capability", "[coordinator]") {
    PlaybackCoordinator coordinator;
    coordinator.update(inputPhase({COLOR_RED}, 1));
    CHECK(coordinator.clickRegion(COLOR_RED));
    CHECK(coordinator.submit());
}

// ============================================================================
// Submit
// ============================================================================

TEST_CASE("Coordinator: submit fires only while canSubmit", "[coordinator]") {
    PlaybackCoordinator coordinator;
    Recorder rec;
    RecordingFeedback feedback;
    coordinator.setCallbacks(rec.callbacks());
    coordinator.setFeedback(&feedback);

    coordinator.update(inputPhase({COLOR_RED, COLOR_BLUE}, 1));
    for (int i = 0; i < 5; i++) CHECK_FALSE(coordinator.submit());
    CHECK(rec.submits == 0);
    CHECK(feedback.pulses.empty());

    coordinator.update(inputPhase({COLOR_RED, COLOR_BLUE}, 2));
    CHECK(coordinator.submit());
    CHECK(rec.submits == 1);
    REQUIRE(feedback.pulses.size() == 1);
    CHECK(feedback.pulses[0] == Approx(0.1f));
}
