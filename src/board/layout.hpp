#pragma once

#include <string>
#include <vector>
#include "types.hpp"

namespace mnemosyne {
namespace board {

// ============================================================================
// REGION LAYOUT
// ============================================================================
//
// Angles are degrees measured clockwise from the +x axis in y-down screen
// space (the convention shared by SVG and nanovg). A full board is the ring
// between innerRadius and outerRadius split into one wedge per region.

constexpr float MIN_SPAN_DEGREES = 0.01f;
constexpr float MIN_SINGLE_REGION_GAP = 1.0f;
constexpr float MIN_RING_WIDTH = 0.5f;

// Ordered region -> sector mapping. Slot i owns the base sector
// [origin + i * 360/N, origin + (i + 1) * 360/N).
struct SectorTable {
    float originDegrees;
    std::vector<Region> slots;

    SectorTable() : originDegrees(0.f) {}
    SectorTable(float origin, const std::vector<Region>& s) : originDegrees(origin), slots(s) {}
};

// Classic quadrant assignment: blue bottom-right, yellow bottom-left,
// green top-left, red top-right.
SectorTable classicQuadrants();

// One sector per region in input order, starting at origin.
SectorTable sequentialSectors(const std::vector<Region>& regions, float originDegrees = -90.f);

// Spans in slot order, each shrunk by gap/2 on both sides.
std::vector<RegionSpan> computeSpans(const SectorTable& table, float gapDegrees);
std::vector<RegionSpan> computeSpans(const std::vector<Region>& regions, float gapDegrees);

struct PathPoint {
    float x;
    float y;
    PathPoint() : x(0.f), y(0.f) {}
    PathPoint(float px, float py) : x(px), y(py) {}
};

// Annulus sector outline: outer arc start -> end, line in, inner arc back.
struct WedgePath {
    float centerX;
    float centerY;
    float innerRadius;
    float outerRadius;
    float startAngle;
    float endAngle;
    bool largeArc;
    PathPoint outerStart;
    PathPoint outerEnd;
    PathPoint innerEnd;
    PathPoint innerStart;

    WedgePath()
        : centerX(0.f), centerY(0.f), innerRadius(0.f), outerRadius(0.f),
          startAngle(0.f), endAngle(0.f), largeArc(false) {}
};

// Radii are clamped (outer >= MIN_RING_WIDTH, inner in [0, outer - MIN_RING_WIDTH]);
// reversed angles are swapped and sweeps are kept below a full turn.
WedgePath wedgePath(float centerX, float centerY, float innerRadius, float outerRadius,
                    float startAngle, float endAngle);

// SVG path data ("M ... A ... L ... A ... Z"), three decimals.
std::string toSvgPathData(const WedgePath& path);

// Region whose wedge contains (x, y), or NO_REGION for gaps, hub and outside.
Region hitTestRegion(const std::vector<RegionSpan>& spans, float centerX, float centerY,
                     float innerRadius, float outerRadius, float x, float y);

float degToRad(float degrees);

} // namespace board
} // namespace mnemosyne
