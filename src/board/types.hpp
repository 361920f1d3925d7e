#pragma once

#include <string>
#include <vector>

namespace mnemosyne {
namespace board {

// Region ids are opaque small integers; the Recall module uses the four
// classic colors below but nothing in the core depends on there being four.
typedef int Region;
constexpr Region NO_REGION = -1;

enum Color {
    COLOR_RED,
    COLOR_YELLOW,
    COLOR_GREEN,
    COLOR_BLUE,
    COLOR_COUNT
};

// Caller-supplied timer classification (not derived by the board)
enum TimerColor {
    TIMER_GREEN,
    TIMER_YELLOW,
    TIMER_RED
};

std::string regionName(Region region);

// Angular span of one wedge, degrees, clockwise from +x in y-down space.
struct RegionSpan {
    Region region;
    float startAngle;
    float endAngle;

    RegionSpan() : region(NO_REGION), startAngle(0.f), endAngle(0.f) {}
    RegionSpan(Region r, float start, float end) : region(r), startAngle(start), endAngle(end) {}

    float width() const { return endAngle - startAngle; }
};

// Snapshot of everything the caller feeds the board each update.
struct BoardInputs {
    std::vector<Region> sequence;
    int round;
    bool isShowingSequence;
    bool isInputPhase;
    bool disabled;
    std::vector<Region> playerSequence;
    bool canSubmit;
    int secondsRemaining;
    TimerColor timerColor;
    bool isTimerPulsing;

    BoardInputs()
        : round(1), isShowingSequence(false), isInputPhase(false), disabled(false),
          canSubmit(false), secondsRemaining(0), timerColor(TIMER_GREEN), isTimerPulsing(false) {}
};

} // namespace board
} // namespace mnemosyne
