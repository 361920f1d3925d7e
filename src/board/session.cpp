#include "session.hpp"

#include <algorithm>
#include <cmath>

namespace mnemosyne {
namespace board {

GameSession::GameSession(const SessionSettings& s, const CountdownThresholds& t, uint32_t seed)
    : settings(s), thresholds(t), rng(seed) {
    syncInputs();
}

void GameSession::setSettings(const SessionSettings& s) {
    settings = s;
}

void GameSession::setThresholds(const CountdownThresholds& t) {
    thresholds = t;
    syncInputs();
    ++rev;
}

void GameSession::setDisabled(bool disabled) {
    if (inputs.disabled == disabled) return;
    inputs.disabled = disabled;
    ++rev;
}

void GameSession::start() {
    inputs.round = 1;
    inputs.sequence.clear();
    inputs.sequence.push_back(randomRegion());
    enterShowing();
}

void GameSession::stop() {
    currentPhase = PHASE_IDLE;
    inputs.sequence.clear();
    inputs.playerSequence.clear();
    remaining = 0.0;
    pause = 0.0;
    syncInputs();
    ++rev;
}

void GameSession::process(double deltaSeconds) {
    if (currentPhase == PHASE_INPUT) {
        remaining -= deltaSeconds;
        if (remaining <= 0.0) {
            remaining = 0.0;
            finishRound(false, RESULT_TIMEOUT);
            return;
        }
        int before = inputs.secondsRemaining;
        syncInputs();
        if (inputs.secondsRemaining != before) ++rev;
    } else if (currentPhase == PHASE_RESULT) {
        pause -= deltaSeconds;
        if (pause <= 0.0) {
            inputs.round += 1;
            inputs.sequence.push_back(randomRegion());
            enterShowing();
        }
    }
}

void GameSession::recordColor(Region region) {
    if (currentPhase != PHASE_INPUT) return;
    // The ceiling on entries belongs to the caller, not the board
    if (inputs.playerSequence.size() >= inputs.sequence.size()) return;
    inputs.playerSequence.push_back(region);
    syncInputs();
    ++rev;
}

void GameSession::submit() {
    if (currentPhase != PHASE_INPUT || !inputs.canSubmit) return;
    bool correct = inputs.playerSequence == inputs.sequence;
    finishRound(correct, correct ? RESULT_CORRECT : RESULT_WRONG);
}

void GameSession::onPlaybackFinished(int finishedRound) {
    if (currentPhase != PHASE_SHOWING || finishedRound != inputs.round) return;
    enterInput();
}

Region GameSession::randomRegion() {
    std::uniform_int_distribution<int> dist(0, std::max(settings.regionCount, 1) - 1);
    return dist(rng);
}

void GameSession::enterShowing() {
    currentPhase = PHASE_SHOWING;
    inputs.playerSequence.clear();
    remaining = 0.0;
    syncInputs();
    ++rev;
}

void GameSession::enterInput() {
    currentPhase = PHASE_INPUT;
    remaining = settings.inputTimeLimit;
    syncInputs();
    ++rev;
}

void GameSession::finishRound(bool correct, ResultReason reason) {
    RoundResult result;
    result.round = inputs.round;
    result.isCorrect = correct;
    result.reason = reason;

    if (correct) {
        best = std::max(best, inputs.round);
        currentPhase = PHASE_RESULT;
        pause = settings.resultPause;
    } else {
        currentPhase = PHASE_GAME_OVER;
    }
    remaining = 0.0;
    syncInputs();
    ++rev;

    if (onResult) onResult(result);
}

void GameSession::syncInputs() {
    const bool input = currentPhase == PHASE_INPUT;
    inputs.isShowingSequence = currentPhase == PHASE_SHOWING;
    inputs.isInputPhase = input;
    inputs.canSubmit = input && !inputs.sequence.empty() &&
                       inputs.playerSequence.size() == inputs.sequence.size();
    inputs.secondsRemaining = input ? (int)std::ceil(remaining) : 0;

    CountdownSeverity severity = classifyCountdown(inputs.secondsRemaining, thresholds);
    inputs.timerColor = timerColorForSeverity(severity);
    inputs.isTimerPulsing = input && severity == SEVERITY_CRITICAL;
}

} // namespace board
} // namespace mnemosyne
