#include "ui.hpp"
#include "../board/config.hpp"
#include "../graphics/drawing.hpp"
#include "../graphics/palette.hpp"
#include <algorithm>
#include <cmath>

using mnemosyne::graphics::BoardPalette;

namespace mnemosyne { namespace recall {

namespace {

std::shared_ptr<Font> loadDisplayFont(std::shared_ptr<Font> font) {
    if (!font)
        font = APP->window->loadFont(asset::system("res/fonts/ShareTechMono-Regular.ttf"));
    if (!font)
        font = APP->window->loadFont(asset::system("res/fonts/DejaVuSans.ttf"));
    return font;
}

// Dots stop fitting under the board past this length; the k/n text takes over
const int MAX_PROGRESS_DOTS = 16;

} // namespace

// ---- RecallBoardWidget ----

float RecallBoardWidget::outerRadius() const {
    return std::min(box.size.x, box.size.y) * 0.5f - 2.f;
}

float RecallBoardWidget::innerRadius() const {
    float ratio = view ? view->getInnerRadiusRatio() : board::BoardConfig().innerRadiusRatio;
    return outerRadius() * ratio;
}

std::vector<board::RegionSpan> RecallBoardWidget::currentSpans() const {
    float gap = view ? view->getGapDegrees() : board::BoardConfig().gapDegrees;
    return board::computeSpans(board::classicQuadrants(), gap);
}

board::WedgePath RecallBoardWidget::wedgeFor(const board::RegionSpan& span) const {
    Vec c = center();
    return board::wedgePath(c.x, c.y, innerRadius(), outerRadius(), span.startAngle, span.endAngle);
}

void RecallBoardWidget::draw(const DrawArgs& args) {
    Vec c = center();
    graphics::drawBoardBackdrop(args, c.x, c.y, outerRadius() + 2.f);

    // Resting wedges; dimmed while the board ignores clicks
    bool interactive = view && view->isInteractive();
    float alpha = interactive ? 1.f : 0.8f;
    std::vector<board::RegionSpan> spans = currentSpans();
    for (size_t i = 0; i < spans.size(); i++) {
        graphics::WedgeShade shade = BoardPalette::regionShade(spans[i].region);
        graphics::drawWedge(args, wedgeFor(spans[i]), (shade.base * 0.8f).toNVG(alpha),
                            BoardPalette::boardBackground());
    }

    font = loadDisplayFont(font);
    int round = view ? view->getRound() : 1;
    std::string caption = std::to_string(round);
    if (view && view->getSequenceLength() == 0) caption = "--";
    graphics::drawHub(args, c.x, c.y, innerRadius(), font ? font->handle : -1, caption,
                      nvgRGB(0xe0, 0xe0, 0xe0));

    Widget::draw(args);
}

void RecallBoardWidget::drawLayer(const DrawArgs& args, int layer) {
    if (layer == 1 && view) {
        board::Region active = view->getActiveRegion();
        if (active != board::NO_REGION) {
            std::vector<board::RegionSpan> spans = currentSpans();
            for (size_t i = 0; i < spans.size(); i++) {
                if (spans[i].region != active) continue;
                graphics::WedgeShade shade = BoardPalette::regionShade(active);
                board::WedgePath path = wedgeFor(spans[i]);
                graphics::drawWedgeGlow(args, path, shade.lit.toNVG(0.9f));
                graphics::drawWedge(args, path, shade.lit.toNVG(), nvgRGB(0xff, 0xff, 0xff), 3.f);
            }
        }
    }
    Widget::drawLayer(args, layer);
}

void RecallBoardWidget::onButton(const event::Button& e) {
    if (e.action == GLFW_PRESS && e.button == GLFW_MOUSE_BUTTON_LEFT && view && ctrl) {
        Vec c = center();
        float inner = innerRadius();
        board::Region hit = board::hitTestRegion(currentSpans(), c.x, c.y, inner, outerRadius(),
                                                 e.pos.x, e.pos.y);
        if (hit != board::NO_REGION) {
            ctrl->pressRegion(hit);
            e.consume(this);
        } else if (e.pos.minus(c).norm() < inner && view->canSubmit()) {
            // The hub doubles as the submit button
            ctrl->pressSubmit();
            e.consume(this);
        }
    }
    Widget::onButton(e);
}

// ---- RecallCountdownWidget ----

void RecallCountdownWidget::drawLayer(const DrawArgs& args, int layer) {
    if (layer == 1 && view) {
        board::CountdownPresentation cd = view->getCountdown();
        font = loadDisplayFont(font);
        if (cd.visible && font) {
            float alpha = 1.f;
            if (cd.pulsing) {
                alpha = 0.6f + 0.4f * std::sin(system::getTime() * 2.f * M_PI * 2.f);
            }
            nvgSave(args.vg);
            nvgFontFaceId(args.vg, font->handle);
            nvgFontSize(args.vg, 14.f * cd.emphasis);
            nvgTextAlign(args.vg, NVG_ALIGN_CENTER | NVG_ALIGN_MIDDLE);
            nvgFillColor(args.vg, BoardPalette::timerColor(cd.color).toNVG(alpha));
            std::string text = std::to_string(cd.secondsRemaining) + "s";
            nvgText(args.vg, box.size.x * 0.5f, box.size.y * 0.5f, text.c_str(), NULL);
            nvgRestore(args.vg);
        }
    }
    TransparentWidget::drawLayer(args, layer);
}

// ---- RecallStatusWidget ----

void RecallStatusWidget::drawLayer(const DrawArgs& args, int layer) {
    if (layer == 1) {
        font = loadDisplayFont(font);
        if (font) {
            board::BoardStatus status = view ? view->getStatus() : board::STATUS_READY;
            int total = view ? view->getSequenceLength() : 0;
            int entered = view ? view->getPlayerCount() : 0;

            std::string caption = board::statusCaption(status, total);
            if (view && view->isGameOver()) {
                caption = "Game over - best " + std::to_string(view->getBestRound());
            }

            nvgSave(args.vg);
            nvgFontFaceId(args.vg, font->handle);
            nvgFontSize(args.vg, 11.f);
            nvgTextAlign(args.vg, NVG_ALIGN_CENTER | NVG_ALIGN_MIDDLE);
            nvgFillColor(args.vg, nvgRGB(0xd0, 0xd0, 0xd0));
            nvgText(args.vg, box.size.x * 0.5f, 7.f, caption.c_str(), NULL);

            if (status == board::STATUS_YOUR_TURN && total > 0) {
                if (total <= MAX_PROGRESS_DOTS) {
                    std::vector<int> entries;
                    for (int i = 0; i < entered; i++) entries.push_back(view->getPlayerEntry(i));
                    graphics::drawProgressDots(args, Vec(box.size.x * 0.5f, 20.f),
                                               entries.empty() ? NULL : entries.data(),
                                               entered, total, 8.f, 2.5f);
                }
                std::string hint = board::submitCaption(view->canSubmit(), entered, total);
                nvgFontSize(args.vg, 10.f);
                nvgFillColor(args.vg, view->canSubmit() ? nvgRGB(0x4a, 0xde, 0x80) : nvgRGB(0x90, 0x90, 0x90));
                nvgText(args.vg, box.size.x * 0.5f, 32.f, hint.c_str(), NULL);
            }
            nvgRestore(args.vg);
        }
    }
    TransparentWidget::drawLayer(args, layer);
}

}} // namespace mnemosyne::recall
