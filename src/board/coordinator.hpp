#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "delay_queue.hpp"
#include "feedback.hpp"
#include "types.hpp"

namespace mnemosyne {
namespace board {

struct PlaybackTiming {
    float showDuration;   // seconds a revealed region stays lit
    float showGap;        // pause after each reveal
    float clickFlash;     // tactile flash on an accepted click
    float clickPulse;     // feedback trigger length on click
    float submitPulse;    // feedback trigger length on submit

    PlaybackTiming()
        : showDuration(0.7f), showGap(0.3f), clickFlash(0.15f),
          clickPulse(0.05f), submitPulse(0.1f) {}
};

struct BoardCallbacks {
    std::function<void(Region)> onColorClick;
    std::function<void()> onSubmit;
    std::function<void(int round)> onPlaybackFinished;
};

/**
 * Drives the lit region of the board.
 *
 * Playback: Idle -> Playing(0) -> ... -> Playing(n-1) -> Idle. Each reveal
 * lights sequence[i] for showDuration, then waits showGap. Every run owns a
 * generation token; callbacks scheduled by an older generation are no-ops,
 * and cancelling a run also drops its pending timers.
 *
 * Clicks and submits are pass-through: the coordinator never stores the
 * player's entries, it gates them and reports them upward.
 */
class PlaybackCoordinator {
public:
    explicit PlaybackCoordinator(const PlaybackTiming& t = PlaybackTiming());

    void setCallbacks(const BoardCallbacks& cb) { callbacks = cb; }
    void setFeedback(FeedbackTrigger* trigger) { feedback = trigger; }
    void setTiming(const PlaybackTiming& t) { timing = t; }

    // Reconcile with the caller's latest snapshot
    void update(const BoardInputs& next);
    void process(double deltaSeconds);

    bool clickRegion(Region region);
    bool submit();

    Region activeRegion() const { return active; }
    bool isPlaying() const { return playing; }
    int playbackIndex() const { return index; }
    uint64_t generation() const { return playbackGeneration; }
    bool acceptsClicks() const;
    double now() const { return queue.now(); }

private:
    PlaybackTiming timing;
    BoardCallbacks callbacks;
    FeedbackTrigger* feedback = nullptr;
    DelayQueue queue;
    BoardInputs current;

    // Playback cursor
    Region active = NO_REGION;
    bool playing = false;
    int index = 0;
    uint64_t playbackGeneration = 0;
    DelayQueue::Handle playbackTimer = DelayQueue::INVALID_HANDLE;

    // Identity of the run that belongs to the current "show" window
    bool runClaimed = false;
    int runRound = 0;
    std::vector<Region> runSequence;

    uint64_t flashGeneration = 0;
    DelayQueue::Handle flashTimer = DelayQueue::INVALID_HANDLE;

    void startPlayback();
    void cancelPlayback();
    void cancelFlash();
    void revealCurrent(uint64_t gen);
    void endReveal(uint64_t gen);
    void advanceReveal(uint64_t gen);
};

} // namespace board
} // namespace mnemosyne
