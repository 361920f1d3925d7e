#pragma once

namespace mnemosyne {
namespace board {

// Optional host capability (vibration, a trigger jack, ...). Fire-and-forget:
// implementations must return immediately and never affect control flow.
struct FeedbackTrigger {
    virtual ~FeedbackTrigger() {}
    virtual void trigger(float seconds) = 0;
};

} // namespace board
} // namespace mnemosyne
