#pragma once
#include <rack.hpp>
#include <cmath>
#include "../board/types.hpp"

using namespace rack;

namespace mnemosyne {
namespace graphics {

// ============================================================================
// BOARD PALETTE
// ============================================================================

// RGB color structure for consistent color handling
struct RGBColor {
    float r, g, b;

    RGBColor(float red = 0.f, float green = 0.f, float blue = 0.f) : r(red), g(green), b(blue) {}

    static RGBColor fromHex(unsigned hex) {
        return RGBColor(((hex >> 16) & 0xff) / 255.f, ((hex >> 8) & 0xff) / 255.f, (hex & 0xff) / 255.f);
    }

    NVGcolor toNVG(float alpha = 1.f) const {
        return nvgRGBAf(r, g, b, alpha);
    }

    RGBColor operator*(float brightness) const {
        return RGBColor(r * brightness, g * brightness, b * brightness);
    }
};

// Resting and lit shade of a wedge
struct WedgeShade {
    RGBColor base;
    RGBColor lit;
};

class BoardPalette {
public:
    static WedgeShade regionShade(board::Region region) {
        switch (region) {
            case board::COLOR_RED: return {RGBColor::fromHex(0xff4136), RGBColor::fromHex(0xff8580)};
            case board::COLOR_YELLOW: return {RGBColor::fromHex(0xffdc00), RGBColor::fromHex(0xfff580)};
            case board::COLOR_GREEN: return {RGBColor::fromHex(0x2ecc40), RGBColor::fromHex(0x7dff8a)};
            case board::COLOR_BLUE: return {RGBColor::fromHex(0x0074d9), RGBColor::fromHex(0x7abfff)};
            default: {
                // Extra regions on larger boards walk the hue wheel
                float hue = std::fmod(region * 137.5f, 360.f);
                return {hsvToRGB(hue, 0.85f, 0.8f), hsvToRGB(hue, 0.45f, 1.f)};
            }
        }
    }

    static RGBColor timerColor(board::TimerColor color) {
        switch (color) {
            case board::TIMER_RED: return RGBColor::fromHex(0xf87171);
            case board::TIMER_YELLOW: return RGBColor::fromHex(0xfacc15);
            default: return RGBColor::fromHex(0x4ade80);
        }
    }

    static NVGcolor boardBackground() { return nvgRGB(0x1a, 0x1a, 0x1a); }
    static NVGcolor hubStroke() { return nvgRGB(0x33, 0x33, 0x33); }

    // Set RGB lights on a module
    static void setRGBLight(Module* module, int lightId, const RGBColor& color) {
        if (module) {
            module->lights[lightId].setBrightness(color.r);
            module->lights[lightId + 1].setBrightness(color.g);
            module->lights[lightId + 2].setBrightness(color.b);
        }
    }

    // HSV to RGB conversion
    static RGBColor hsvToRGB(float h, float s, float v) {
        h = std::fmod(h, 360.f) / 60.f;
        s = clamp(s, 0.f, 1.f);
        v = clamp(v, 0.f, 1.f);

        int i = (int)std::floor(h);
        float f = h - i;
        float p = v * (1.f - s);
        float q = v * (1.f - s * f);
        float t = v * (1.f - s * (1.f - f));

        switch (i % 6) {
            case 0: return RGBColor(v, t, p);
            case 1: return RGBColor(q, v, p);
            case 2: return RGBColor(p, v, t);
            case 3: return RGBColor(p, q, v);
            case 4: return RGBColor(t, p, v);
            case 5: return RGBColor(v, p, q);
            default: return RGBColor();
        }
    }
};

}} // namespace mnemosyne::graphics
