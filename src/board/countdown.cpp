#include "countdown.hpp"

#include <algorithm>

namespace mnemosyne {
namespace board {

CountdownSeverity classifyCountdown(int secondsRemaining, const CountdownThresholds& thresholds) {
    // Tolerate swapped thresholds so the ordering stays monotonic
    int critical = std::min(thresholds.criticalAt, thresholds.warningAt);
    int warning = std::max(thresholds.criticalAt, thresholds.warningAt);
    if (secondsRemaining <= critical) return SEVERITY_CRITICAL;
    if (secondsRemaining <= warning) return SEVERITY_WARNING;
    return SEVERITY_CALM;
}

TimerColor timerColorForSeverity(CountdownSeverity severity) {
    switch (severity) {
        case SEVERITY_CRITICAL: return TIMER_RED;
        case SEVERITY_WARNING: return TIMER_YELLOW;
        default: return TIMER_GREEN;
    }
}

float emphasisForSeverity(CountdownSeverity severity) {
    switch (severity) {
        case SEVERITY_CRITICAL: return 1.5f;
        case SEVERITY_WARNING: return 1.2f;
        default: return 1.f;
    }
}

CountdownPresentation presentCountdown(const BoardInputs& inputs, const CountdownThresholds& thresholds) {
    CountdownPresentation p;
    p.secondsRemaining = std::max(inputs.secondsRemaining, 0);
    p.visible = inputs.isInputPhase && p.secondsRemaining > 0;
    p.severity = classifyCountdown(p.secondsRemaining, thresholds);
    p.pulsing = p.severity == SEVERITY_CRITICAL || inputs.isTimerPulsing;
    p.color = inputs.timerColor;
    p.emphasis = emphasisForSeverity(p.severity);
    return p;
}

} // namespace board
} // namespace mnemosyne
