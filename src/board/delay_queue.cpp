#include "delay_queue.hpp"

#include <algorithm>
#include <utility>

namespace mnemosyne {
namespace board {

constexpr DelayQueue::Handle DelayQueue::INVALID_HANDLE;
constexpr double DelayQueue::TIME_EPSILON;

DelayQueue::Handle DelayQueue::schedule(double delaySeconds, Callback callback) {
    if (!callback) return INVALID_HANDLE;
    Entry entry;
    entry.handle = nextHandle++;
    entry.due = clock + std::max(delaySeconds, 0.0);
    entry.callback = std::move(callback);
    entries.push_back(std::move(entry));
    return entries.back().handle;
}

bool DelayQueue::cancel(Handle handle) {
    if (handle == INVALID_HANDLE) return false;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].handle == handle) {
            entries.erase(entries.begin() + i);
            return true;
        }
    }
    return false;
}

int DelayQueue::findEarliestDue(double limit) const {
    int best = -1;
    for (size_t i = 0; i < entries.size(); ++i) {
        const Entry& e = entries[i];
        if (e.due > limit + TIME_EPSILON) continue;
        // Handles grow monotonically, so ties resolve in scheduling order
        if (best < 0 || e.due < entries[best].due ||
            (e.due == entries[best].due && e.handle < entries[best].handle)) {
            best = (int)i;
        }
    }
    return best;
}

void DelayQueue::advance(double deltaSeconds) {
    const double target = clock + std::max(deltaSeconds, 0.0);

    int idx;
    while ((idx = findEarliestDue(target)) >= 0) {
        Entry entry = std::move(entries[idx]);
        entries.erase(entries.begin() + idx);
        clock = std::max(clock, entry.due);
        entry.callback();
    }
    clock = target;
}

} // namespace board
} // namespace mnemosyne
