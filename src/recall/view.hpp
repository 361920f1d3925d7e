// Minimal read-only interface for Recall state used by UI widgets
#pragma once
#include "../board/countdown.hpp"
#include "../board/status.hpp"
#include "../board/types.hpp"

namespace mnemosyne { namespace recall {

// Widgets run on the UI thread; presses are handed to the engine thread
struct RecallController {
    virtual ~RecallController() {}
    virtual void pressRegion(board::Region region) = 0;
    virtual void pressSubmit() = 0;
};

struct RecallView {
    virtual ~RecallView() {}
    virtual board::Region getActiveRegion() const = 0;   // NO_REGION when dark
    virtual int getRound() const = 0;
    virtual int getSequenceLength() const = 0;
    virtual int getPlayerCount() const = 0;
    virtual board::Region getPlayerEntry(int idx) const = 0;
    virtual board::BoardStatus getStatus() const = 0;
    virtual bool isInteractive() const = 0;              // clicks would be accepted
    virtual bool canSubmit() const = 0;
    virtual board::CountdownPresentation getCountdown() const = 0;
    virtual int getBestRound() const = 0;
    virtual bool isGameOver() const = 0;

    // Geometry
    virtual float getGapDegrees() const = 0;
    virtual float getInnerRadiusRatio() const = 0;
};

}} // namespace mnemosyne::recall
