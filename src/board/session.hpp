#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace mnemosyne {
namespace board {

enum SessionPhase {
    PHASE_IDLE,
    PHASE_SHOWING,
    PHASE_INPUT,
    PHASE_RESULT,
    PHASE_GAME_OVER
};

enum ResultReason {
    RESULT_CORRECT,
    RESULT_WRONG,
    RESULT_TIMEOUT
};

struct RoundResult {
    int round;
    bool isCorrect;
    ResultReason reason;

    RoundResult() : round(0), isCorrect(false), reason(RESULT_WRONG) {}
};

/**
 * Local single-player host for the board: owns the secret sequence, the
 * player's entries and the countdown, and feeds BoardInputs to the
 * coordinator. Each round appends one random region to the sequence.
 */
class GameSession {
public:
    GameSession(const SessionSettings& settings, const CountdownThresholds& thresholds, uint32_t seed);

    void setSettings(const SessionSettings& s);
    void setThresholds(const CountdownThresholds& t);
    void setDisabled(bool disabled);

    void start();
    void stop();
    void process(double deltaSeconds);

    // Coordinator callbacks
    void recordColor(Region region);
    void submit();
    void onPlaybackFinished(int round);

    std::function<void(const RoundResult&)> onResult;

    const BoardInputs& boardInputs() const { return inputs; }
    uint64_t revision() const { return rev; }
    SessionPhase phase() const { return currentPhase; }
    int round() const { return inputs.round; }
    int bestRound() const { return best; }
    double timeRemaining() const { return remaining; }

private:
    SessionSettings settings;
    CountdownThresholds thresholds;
    std::mt19937 rng;
    BoardInputs inputs;
    SessionPhase currentPhase = PHASE_IDLE;
    uint64_t rev = 0;
    double remaining = 0.0;
    double pause = 0.0;
    int best = 0;

    Region randomRegion();
    void enterShowing();
    void enterInput();
    void finishRound(bool correct, ResultReason reason);
    void syncInputs();
};

} // namespace board
} // namespace mnemosyne
