#pragma once
#include <rack.hpp>
#include <nanovg.h>
#include <string>
#include "../board/layout.hpp"

using namespace rack;

namespace mnemosyne {
namespace graphics {

// ============================================================================
// DRAWING UTILITIES
// ============================================================================

// Fill and outline one annulus sector traced from a WedgePath
void drawWedge(const widget::Widget::DrawArgs& args, const board::WedgePath& path,
               NVGcolor fill, NVGcolor stroke, float strokeWidth = 2.f);

// Soft halo behind a lit wedge
void drawWedgeGlow(const widget::Widget::DrawArgs& args, const board::WedgePath& path,
                   NVGcolor glow, float spread = 6.f);

// Dark disc behind the ring
void drawBoardBackdrop(const widget::Widget::DrawArgs& args, float cx, float cy, float radius);

// Center hub with a caption (e.g. the round number)
void drawHub(const widget::Widget::DrawArgs& args, float cx, float cy, float radius,
             int fontHandle, const std::string& caption, NVGcolor textColor);

// Row of dots, one per sequence slot; entered slots take their region color
void drawProgressDots(const widget::Widget::DrawArgs& args, Vec center, const int* entries,
                      int entered, int total, float spacing, float dotRadius);

}} // namespace mnemosyne::graphics
