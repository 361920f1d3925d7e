#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace mnemosyne {
namespace board {

// Cancellable one-shot timers on a simulated clock advanced by the host
// (the engine's sample time). While a callback runs, now() is that
// callback's due time, so delays chained from inside a callback never drift
// regardless of the host's step size.
class DelayQueue {
public:
    typedef std::function<void()> Callback;
    typedef uint64_t Handle;
    static constexpr Handle INVALID_HANDLE = 0;

    Handle schedule(double delaySeconds, Callback callback);
    bool cancel(Handle handle);

    // Fires every callback due within (now, now + deltaSeconds], earliest first.
    void advance(double deltaSeconds);

    double now() const { return clock; }
    std::size_t pending() const { return entries.size(); }

private:
    struct Entry {
        Handle handle;
        double due;
        Callback callback;
    };

    // Tolerance so that 0.7 + 0.3 lands on 1.0 with float sample steps
    static constexpr double TIME_EPSILON = 1e-9;

    std::vector<Entry> entries;
    double clock = 0.0;
    Handle nextHandle = 1;

    int findEarliestDue(double limit) const;
};

} // namespace board
} // namespace mnemosyne
