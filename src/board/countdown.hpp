#pragma once

#include "types.hpp"

namespace mnemosyne {
namespace board {

enum CountdownSeverity {
    SEVERITY_CALM,
    SEVERITY_WARNING,
    SEVERITY_CRITICAL
};

// Inclusive upper bounds: <= warningAt is WARNING, <= criticalAt is CRITICAL
struct CountdownThresholds {
    int warningAt;
    int criticalAt;

    CountdownThresholds() : warningAt(10), criticalAt(5) {}
    CountdownThresholds(int warning, int critical) : warningAt(warning), criticalAt(critical) {}
};

struct CountdownPresentation {
    bool visible;
    int secondsRemaining;
    CountdownSeverity severity;
    bool pulsing;
    TimerColor color;
    float emphasis;  // text scale relative to the calm size
};

// Monotonic: fewer seconds never yields a lower severity
CountdownSeverity classifyCountdown(int secondsRemaining, const CountdownThresholds& thresholds);

CountdownPresentation presentCountdown(const BoardInputs& inputs, const CountdownThresholds& thresholds);

TimerColor timerColorForSeverity(CountdownSeverity severity);

float emphasisForSeverity(CountdownSeverity severity);

} // namespace board
} // namespace mnemosyne
