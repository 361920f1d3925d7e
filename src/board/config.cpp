#include "config.hpp"

#include <algorithm>
#include <cmath>

namespace mnemosyne {
namespace board {

constexpr float ConfigLimits::MIN_SHOW_DURATION;
constexpr float ConfigLimits::MAX_SHOW_DURATION;
constexpr float ConfigLimits::MIN_SHOW_GAP;
constexpr float ConfigLimits::MAX_SHOW_GAP;
constexpr float ConfigLimits::MIN_CLICK_FLASH;
constexpr float ConfigLimits::MAX_CLICK_FLASH;
constexpr float ConfigLimits::MIN_PULSE;
constexpr float ConfigLimits::MAX_PULSE;
constexpr int ConfigLimits::MAX_THRESHOLD;
constexpr float ConfigLimits::MAX_GAP_DEGREES;
constexpr float ConfigLimits::MIN_RADIUS_RATIO;
constexpr float ConfigLimits::MAX_RADIUS_RATIO;
constexpr float ConfigLimits::MIN_INPUT_TIME;
constexpr float ConfigLimits::MAX_INPUT_TIME;
constexpr float ConfigLimits::MIN_RESULT_PAUSE;
constexpr float ConfigLimits::MAX_RESULT_PAUSE;
constexpr int ConfigLimits::MIN_REGIONS;
constexpr int ConfigLimits::MAX_REGIONS;

namespace {

template <typename T>
bool clampField(T& value, T lo, T hi) {
    T clamped = std::min(std::max(value, lo), hi);
    bool changed = !(clamped == value);
    value = clamped;
    return changed;
}

bool clampFloat(float& value, float lo, float hi, float fallback) {
    if (!std::isfinite(value)) {
        value = fallback;
        return true;
    }
    return clampField(value, lo, hi);
}

} // namespace

bool sanitizeConfig(BoardConfig& config) {
    typedef ConfigLimits L;
    const BoardConfig defaults;
    bool changed = false;

    PlaybackTiming& t = config.timing;
    changed |= clampFloat(t.showDuration, L::MIN_SHOW_DURATION, L::MAX_SHOW_DURATION, defaults.timing.showDuration);
    changed |= clampFloat(t.showGap, L::MIN_SHOW_GAP, L::MAX_SHOW_GAP, defaults.timing.showGap);
    changed |= clampFloat(t.clickFlash, L::MIN_CLICK_FLASH, L::MAX_CLICK_FLASH, defaults.timing.clickFlash);
    changed |= clampFloat(t.clickPulse, L::MIN_PULSE, L::MAX_PULSE, defaults.timing.clickPulse);
    changed |= clampFloat(t.submitPulse, L::MIN_PULSE, L::MAX_PULSE, defaults.timing.submitPulse);

    CountdownThresholds& th = config.thresholds;
    changed |= clampField(th.warningAt, 0, L::MAX_THRESHOLD);
    changed |= clampField(th.criticalAt, 0, th.warningAt);

    changed |= clampFloat(config.gapDegrees, 0.f, L::MAX_GAP_DEGREES, defaults.gapDegrees);
    changed |= clampFloat(config.innerRadiusRatio, L::MIN_RADIUS_RATIO, L::MAX_RADIUS_RATIO, defaults.innerRadiusRatio);

    SessionSettings& s = config.session;
    changed |= clampFloat(s.inputTimeLimit, L::MIN_INPUT_TIME, L::MAX_INPUT_TIME, defaults.session.inputTimeLimit);
    changed |= clampFloat(s.resultPause, L::MIN_RESULT_PAUSE, L::MAX_RESULT_PAUSE, defaults.session.resultPause);
    changed |= clampField(s.regionCount, L::MIN_REGIONS, L::MAX_REGIONS);

    return changed;
}

void PendingConfig::replace(const BoardConfig& config) {
    std::lock_guard<std::mutex> lock(mutex);
    pending = config;
    dirty = true;
}

BoardConfig PendingConfig::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending;
}

bool PendingConfig::take(BoardConfig& out) {
    if (!dirty.exchange(false)) return false;
    std::lock_guard<std::mutex> lock(mutex);
    out = pending;
    return true;
}

} // namespace board
} // namespace mnemosyne
