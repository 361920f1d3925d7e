// Recall UI widgets
#pragma once
#include <rack.hpp>
#include <vector>
#include "view.hpp"
#include "../board/layout.hpp"

using namespace rack;

namespace mnemosyne { namespace recall {

// Circular board: one wedge per region around a hub that shows the round.
// Reads through RecallView, forwards presses through RecallController.
struct RecallBoardWidget : Widget {
    RecallView* view = nullptr;
    RecallController* ctrl = nullptr;
    std::shared_ptr<Font> font;

    RecallBoardWidget(RecallView* v, RecallController* c) : view(v), ctrl(c) {}

    void draw(const DrawArgs& args) override;
    void drawLayer(const DrawArgs& args, int layer) override;
    void onButton(const event::Button& e) override;

private:
    float outerRadius() const;
    float innerRadius() const;
    Vec center() const { return box.size.div(2.f); }
    std::vector<board::RegionSpan> currentSpans() const;
    board::WedgePath wedgeFor(const board::RegionSpan& span) const;
};

// Countdown above the board
struct RecallCountdownWidget : TransparentWidget {
    RecallView* view = nullptr;
    std::shared_ptr<Font> font;
    explicit RecallCountdownWidget(RecallView* v) : view(v) {}
    void drawLayer(const DrawArgs& args, int layer) override;
};

// Status caption, progress dots and the submit hint below the board
struct RecallStatusWidget : TransparentWidget {
    RecallView* view = nullptr;
    std::shared_ptr<Font> font;
    explicit RecallStatusWidget(RecallView* v) : view(v) {}
    void drawLayer(const DrawArgs& args, int layer) override;
};

}} // namespace mnemosyne::recall
