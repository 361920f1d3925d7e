// Playback sequencing and input gating for the board
#include "coordinator.hpp"

namespace mnemosyne {
namespace board {

PlaybackCoordinator::PlaybackCoordinator(const PlaybackTiming& t) : timing(t) {}

void PlaybackCoordinator::update(const BoardInputs& next) {
    const bool wasDisabled = current.disabled;
    current = next;

    if (current.disabled && !wasDisabled) {
        cancelFlash();
    }

    const bool wantPlayback = current.isShowingSequence && !current.sequence.empty();
    if (!wantPlayback) {
        if (playing) cancelPlayback();
        runClaimed = false;
        return;
    }

    // A finished run is not replayed while the same round stays in show mode
    if (runClaimed && runRound == current.round && runSequence == current.sequence) return;

    cancelPlayback();
    runClaimed = true;
    runRound = current.round;
    runSequence = current.sequence;
    startPlayback();
}

void PlaybackCoordinator::process(double deltaSeconds) {
    queue.advance(deltaSeconds);
}

bool PlaybackCoordinator::acceptsClicks() const {
    return !current.disabled && !current.isShowingSequence && !playing && current.isInputPhase;
}

bool PlaybackCoordinator::clickRegion(Region region) {
    if (region < 0 || !acceptsClicks()) return false;

    if (feedback) feedback->trigger(timing.clickPulse);

    cancelFlash();
    active = region;
    const uint64_t gen = flashGeneration;
    flashTimer = queue.schedule(timing.clickFlash, [this, gen]() {
        if (gen != flashGeneration) return;
        flashTimer = DelayQueue::INVALID_HANDLE;
        if (!playing) active = NO_REGION;
    });

    if (callbacks.onColorClick) callbacks.onColorClick(region);
    return true;
}

bool PlaybackCoordinator::submit() {
    if (!current.canSubmit) return false;
    if (feedback) feedback->trigger(timing.submitPulse);
    if (callbacks.onSubmit) callbacks.onSubmit();
    return true;
}

void PlaybackCoordinator::startPlayback() {
    cancelFlash();
    ++playbackGeneration;
    playing = true;
    index = 0;
    revealCurrent(playbackGeneration);
}

void PlaybackCoordinator::cancelPlayback() {
    ++playbackGeneration;
    queue.cancel(playbackTimer);
    playbackTimer = DelayQueue::INVALID_HANDLE;
    if (playing) {
        playing = false;
        active = NO_REGION;
    }
    index = 0;
}

void PlaybackCoordinator::cancelFlash() {
    ++flashGeneration;
    if (flashTimer != DelayQueue::INVALID_HANDLE) {
        queue.cancel(flashTimer);
        flashTimer = DelayQueue::INVALID_HANDLE;
        if (!playing) active = NO_REGION;
    }
}

void PlaybackCoordinator::revealCurrent(uint64_t gen) {
    if (gen != playbackGeneration) return;
    active = runSequence[index];
    playbackTimer = queue.schedule(timing.showDuration, [this, gen]() { endReveal(gen); });
}

void PlaybackCoordinator::endReveal(uint64_t gen) {
    if (gen != playbackGeneration) return;
    active = NO_REGION;
    playbackTimer = queue.schedule(timing.showGap, [this, gen]() { advanceReveal(gen); });
}

void PlaybackCoordinator::advanceReveal(uint64_t gen) {
    if (gen != playbackGeneration) return;
    ++index;
    if (index < (int)runSequence.size()) {
        revealCurrent(gen);
        return;
    }

    playing = false;
    active = NO_REGION;
    playbackTimer = DelayQueue::INVALID_HANDLE;
    if (callbacks.onPlaybackFinished) callbacks.onPlaybackFinished(runRound);
}

} // namespace board
} // namespace mnemosyne
