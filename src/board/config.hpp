#pragma once

#include "coordinator.hpp"
#include "countdown.hpp"

#include <atomic>
#include <mutex>

namespace mnemosyne {
namespace board {

struct SessionSettings {
    float inputTimeLimit;  // seconds the player gets per round
    float resultPause;     // pause between a correct submit and the next reveal
    int regionCount;

    SessionSettings() : inputTimeLimit(15.f), resultPause(1.f), regionCount(COLOR_COUNT) {}
};

// Every tunable of the board in one place. Persisted with the patch by the
// module; game progress is never part of it.
struct BoardConfig {
    PlaybackTiming timing;
    CountdownThresholds thresholds;
    SessionSettings session;
    float gapDegrees;
    float innerRadiusRatio;  // hub radius / outer radius

    BoardConfig() : gapDegrees(4.f), innerRadiusRatio(0.386f) {}
};

struct ConfigLimits {
    static constexpr float MIN_SHOW_DURATION = 0.05f;
    static constexpr float MAX_SHOW_DURATION = 5.f;
    static constexpr float MIN_SHOW_GAP = 0.01f;
    static constexpr float MAX_SHOW_GAP = 5.f;
    static constexpr float MIN_CLICK_FLASH = 0.01f;
    static constexpr float MAX_CLICK_FLASH = 1.f;
    static constexpr float MIN_PULSE = 0.001f;
    static constexpr float MAX_PULSE = 1.f;
    static constexpr int MAX_THRESHOLD = 120;
    static constexpr float MAX_GAP_DEGREES = 45.f;
    static constexpr float MIN_RADIUS_RATIO = 0.05f;
    static constexpr float MAX_RADIUS_RATIO = 0.95f;
    static constexpr float MIN_INPUT_TIME = 1.f;
    static constexpr float MAX_INPUT_TIME = 120.f;
    static constexpr float MIN_RESULT_PAUSE = 0.1f;
    static constexpr float MAX_RESULT_PAUSE = 10.f;
    static constexpr int MIN_REGIONS = 1;
    static constexpr int MAX_REGIONS = 8;
};

// Clamps every field into range. Returns true when something was changed.
bool sanitizeConfig(BoardConfig& config);

// Hand-off between the threads that edit settings (menus, patch load) and the
// audio thread that runs the board. Writers edit the pending copy; the audio
// thread takes it only when something changed, so it never locks per sample.
class PendingConfig {
public:
    PendingConfig() : dirty(false) {}

    template <typename Edit>
    void edit(Edit change) {
        std::lock_guard<std::mutex> lock(mutex);
        change(pending);
        dirty = true;
    }

    void replace(const BoardConfig& config);
    BoardConfig snapshot() const;
    bool hasChanges() const { return dirty; }

    // Copies the pending settings into `out` and clears the change flag.
    // Returns false, leaving `out` alone, when nothing changed.
    bool take(BoardConfig& out);

private:
    mutable std::mutex mutex;
    BoardConfig pending;
    std::atomic<bool> dirty;
};

} // namespace board
} // namespace mnemosyne
