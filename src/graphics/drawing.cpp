// Board drawing utilities implementation
#include "drawing.hpp"
#include "palette.hpp"
#include <algorithm>

namespace mnemosyne {
namespace graphics {

namespace {

void traceWedge(NVGcontext* vg, const board::WedgePath& path) {
    float a0 = board::degToRad(path.startAngle);
    float a1 = board::degToRad(path.endAngle);
    nvgBeginPath(vg);
    nvgMoveTo(vg, path.outerStart.x, path.outerStart.y);
    nvgArc(vg, path.centerX, path.centerY, path.outerRadius, a0, a1, NVG_CW);
    nvgLineTo(vg, path.innerEnd.x, path.innerEnd.y);
    nvgArc(vg, path.centerX, path.centerY, path.innerRadius, a1, a0, NVG_CCW);
    nvgClosePath(vg);
}

} // namespace

void drawWedge(const widget::Widget::DrawArgs& args, const board::WedgePath& path,
               NVGcolor fill, NVGcolor stroke, float strokeWidth) {
    nvgSave(args.vg);
    traceWedge(args.vg, path);
    nvgFillColor(args.vg, fill);
    nvgFill(args.vg);
    if (strokeWidth > 0.f) {
        nvgStrokeColor(args.vg, stroke);
        nvgStrokeWidth(args.vg, strokeWidth);
        nvgLineJoin(args.vg, NVG_ROUND);
        nvgStroke(args.vg);
    }
    nvgRestore(args.vg);
}

void drawWedgeGlow(const widget::Widget::DrawArgs& args, const board::WedgePath& path,
                   NVGcolor glow, float spread) {
    nvgSave(args.vg);
    nvgGlobalCompositeOperation(args.vg, NVG_LIGHTER);
    // Widening translucent strokes approximate a blur
    for (int i = 3; i >= 1; --i) {
        traceWedge(args.vg, path);
        NVGcolor c = glow;
        c.a *= 0.18f * (4 - i);
        nvgStrokeColor(args.vg, c);
        nvgStrokeWidth(args.vg, spread * i);
        nvgLineJoin(args.vg, NVG_ROUND);
        nvgStroke(args.vg);
    }
    nvgRestore(args.vg);
}

void drawBoardBackdrop(const widget::Widget::DrawArgs& args, float cx, float cy, float radius) {
    nvgBeginPath(args.vg);
    nvgCircle(args.vg, cx, cy, radius);
    nvgFillColor(args.vg, BoardPalette::boardBackground());
    nvgFill(args.vg);
}

void drawHub(const widget::Widget::DrawArgs& args, float cx, float cy, float radius,
             int fontHandle, const std::string& caption, NVGcolor textColor) {
    nvgSave(args.vg);
    nvgBeginPath(args.vg);
    nvgCircle(args.vg, cx, cy, std::max(radius - 2.f, 1.f));
    nvgFillColor(args.vg, BoardPalette::boardBackground());
    nvgFill(args.vg);
    nvgStrokeColor(args.vg, BoardPalette::hubStroke());
    nvgStrokeWidth(args.vg, 3.f);
    nvgStroke(args.vg);

    if (fontHandle >= 0 && !caption.empty()) {
        nvgFontFaceId(args.vg, fontHandle);
        nvgFontSize(args.vg, radius * 0.42f);
        nvgTextLetterSpacing(args.vg, 1.f);
        nvgTextAlign(args.vg, NVG_ALIGN_CENTER | NVG_ALIGN_MIDDLE);
        nvgFillColor(args.vg, textColor);
        nvgText(args.vg, cx, cy, caption.c_str(), NULL);
    }
    nvgRestore(args.vg);
}

void drawProgressDots(const widget::Widget::DrawArgs& args, Vec center, const int* entries,
                      int entered, int total, float spacing, float dotRadius) {
    if (total <= 0) return;

    nvgSave(args.vg);
    float x0 = center.x - spacing * (total - 1) * 0.5f;
    for (int i = 0; i < total; i++) {
        float x = x0 + i * spacing;
        nvgBeginPath(args.vg);
        nvgCircle(args.vg, x, center.y, dotRadius);
        if (i < entered && entries) {
            nvgFillColor(args.vg, BoardPalette::regionShade(entries[i]).base.toNVG());
            nvgFill(args.vg);
        } else {
            nvgStrokeColor(args.vg, nvgRGBA(160, 160, 160, 120));
            nvgStrokeWidth(args.vg, 1.f);
            nvgStroke(args.vg);
        }
    }
    nvgRestore(args.vg);
}

}} // namespace mnemosyne::graphics
