// Region layout: sector assignment, annulus-sector outlines and hit testing
#include "layout.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace mnemosyne {
namespace board {

namespace {

const float kPi = 3.14159265358979323846f;

PathPoint polar(float cx, float cy, float radius, float degrees) {
    float rad = degToRad(degrees);
    return PathPoint(cx + radius * std::cos(rad), cy + radius * std::sin(rad));
}

void appendNumber(std::string& out, float value) {
    char buf[32];
    // Avoid "-0.000" so identical geometry always prints identically
    if (std::fabs(value) < 0.0005f) value = 0.f;
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    out += buf;
}

} // namespace

float degToRad(float degrees) {
    return degrees * kPi / 180.f;
}

SectorTable classicQuadrants() {
    std::vector<Region> slots;
    slots.push_back(COLOR_BLUE);    // 0..90   bottom right
    slots.push_back(COLOR_YELLOW);  // 90..180 bottom left
    slots.push_back(COLOR_GREEN);   // 180..270 top left
    slots.push_back(COLOR_RED);     // 270..360 top right
    return SectorTable(0.f, slots);
}

SectorTable sequentialSectors(const std::vector<Region>& regions, float originDegrees) {
    return SectorTable(originDegrees, regions);
}

std::vector<RegionSpan> computeSpans(const SectorTable& table, float gapDegrees) {
    std::vector<RegionSpan> spans;
    if (table.slots.empty()) return spans;

    const int count = (int)table.slots.size();
    const float base = 360.f / count;

    float gap = std::max(gapDegrees, 0.f);
    if (count == 1 && gap <= 0.f) {
        // A lone wedge must stay open, a closed ring is not a valid arc path
        gap = MIN_SINGLE_REGION_GAP;
    }
    if (gap >= base) gap = base - MIN_SPAN_DEGREES;

    spans.reserve(count);
    for (int i = 0; i < count; ++i) {
        float sectorStart = table.originDegrees + i * base;
        float sectorEnd = table.originDegrees + (i + 1) * base;
        spans.push_back(RegionSpan(table.slots[i], sectorStart + gap * 0.5f, sectorEnd - gap * 0.5f));
    }
    return spans;
}

std::vector<RegionSpan> computeSpans(const std::vector<Region>& regions, float gapDegrees) {
    return computeSpans(sequentialSectors(regions), gapDegrees);
}

WedgePath wedgePath(float centerX, float centerY, float innerRadius, float outerRadius,
                    float startAngle, float endAngle) {
    WedgePath path;
    path.centerX = centerX;
    path.centerY = centerY;

    float outer = std::max(outerRadius, MIN_RING_WIDTH);
    float inner = std::min(std::max(innerRadius, 0.f), outer - MIN_RING_WIDTH);
    path.outerRadius = outer;
    path.innerRadius = inner;

    if (endAngle < startAngle) std::swap(startAngle, endAngle);
    if (endAngle - startAngle > 360.f - MIN_SPAN_DEGREES) {
        endAngle = startAngle + 360.f - MIN_SPAN_DEGREES;
    }
    path.startAngle = startAngle;
    path.endAngle = endAngle;
    path.largeArc = (endAngle - startAngle) > 180.f;

    path.outerStart = polar(centerX, centerY, outer, startAngle);
    path.outerEnd = polar(centerX, centerY, outer, endAngle);
    path.innerEnd = polar(centerX, centerY, inner, endAngle);
    path.innerStart = polar(centerX, centerY, inner, startAngle);
    return path;
}

std::string toSvgPathData(const WedgePath& path) {
    const char* large = path.largeArc ? "1" : "0";
    std::string d;
    d.reserve(160);

    d += "M ";
    appendNumber(d, path.outerStart.x); d += " "; appendNumber(d, path.outerStart.y);
    d += " A ";
    appendNumber(d, path.outerRadius); d += " "; appendNumber(d, path.outerRadius);
    d += " 0 "; d += large; d += " 1 ";
    appendNumber(d, path.outerEnd.x); d += " "; appendNumber(d, path.outerEnd.y);
    d += " L ";
    appendNumber(d, path.innerEnd.x); d += " "; appendNumber(d, path.innerEnd.y);
    d += " A ";
    appendNumber(d, path.innerRadius); d += " "; appendNumber(d, path.innerRadius);
    d += " 0 "; d += large; d += " 0 ";
    appendNumber(d, path.innerStart.x); d += " "; appendNumber(d, path.innerStart.y);
    d += " Z";
    return d;
}

Region hitTestRegion(const std::vector<RegionSpan>& spans, float centerX, float centerY,
                     float innerRadius, float outerRadius, float x, float y) {
    float dx = x - centerX;
    float dy = y - centerY;
    float r = std::sqrt(dx * dx + dy * dy);
    if (r < innerRadius || r > outerRadius) return NO_REGION;

    float angle = std::atan2(dy, dx) * 180.f / kPi;
    if (angle < 0.f) angle += 360.f;

    for (const RegionSpan& span : spans) {
        // Spans may start below 0 or end past 360 depending on the table origin
        for (int turn = -1; turn <= 1; ++turn) {
            float a = angle + turn * 360.f;
            if (a >= span.startAngle && a <= span.endAngle) return span.region;
        }
    }
    return NO_REGION;
}

} // namespace board
} // namespace mnemosyne
