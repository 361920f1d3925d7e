#pragma once

#include <rack.hpp>
#include <string>
#include <fstream>
#include <sstream>
#include <cstdlib>

using namespace rack;

namespace mnemosyne {
namespace ui {

/**
 * Panel positioning helpers: read control positions from the panel SVG by
 * element id, with millimeter fallbacks when the id or file is missing.
 */
class LayoutHelper {
public:
    class PanelSVGParser {
    private:
        std::string svg;

        static std::string readFile(const std::string& path) {
            std::ifstream f(path);
            if (!f) return {};
            std::stringstream ss; ss << f.rdbuf();
            return ss.str();
        }

        // Full tag string that contains id="..."
        std::string findTag(const std::string& id) const {
            if (svg.empty()) return {};
            std::string needle = std::string("id=\"") + id + "\"";
            size_t pos = svg.find(needle);
            if (pos == std::string::npos) return {};
            size_t start = svg.rfind('<', pos);
            size_t end = svg.find('>', pos);
            if (start == std::string::npos || end == std::string::npos || end <= start) return {};
            return svg.substr(start, end - start + 1);
        }

        static float getAttr(const std::string& tag, const std::string& key, float defVal) {
            if (tag.empty()) return defVal;
            std::string k = " " + key + "=\"";
            size_t p = tag.find(k);
            if (p == std::string::npos) return defVal;
            p += k.size();
            const char* begin = tag.c_str() + p;
            char* end = nullptr;
            float v = std::strtof(begin, &end);
            return (end == begin) ? defVal : v;
        }

    public:
        explicit PanelSVGParser(const std::string& svgPath) : svg(readFile(svgPath)) {}

        // Element center in millimeters (circle cx/cy or rect center)
        Vec centerMm(const std::string& id, float defx, float defy) const {
            std::string tag = findTag(id);
            if (tag.find("<rect") != std::string::npos) {
                float rx = getAttr(tag, "x", defx);
                float ry = getAttr(tag, "y", defy);
                float rw = getAttr(tag, "width", 0.0f);
                float rh = getAttr(tag, "height", 0.0f);
                return Vec(rx + rw * 0.5f, ry + rh * 0.5f);
            }
            return Vec(getAttr(tag, "cx", defx), getAttr(tag, "cy", defy));
        }

        Vec centerPx(const std::string& id, float defx, float defy) const {
            return rack::mm2px(centerMm(id, defx, defy));
        }

        Rect rectMm(const std::string& id, float defx, float defy, float defw, float defh) const {
            std::string tag = findTag(id);
            return Rect(Vec(getAttr(tag, "x", defx), getAttr(tag, "y", defy)),
                        Vec(getAttr(tag, "width", defw), getAttr(tag, "height", defh)));
        }
    };

    class ScrewPositions {
    public:
        static Vec topLeft() { return Vec(RACK_GRID_WIDTH, 0); }
        static Vec topRight(float moduleWidth) { return Vec(moduleWidth - 2 * RACK_GRID_WIDTH, 0); }
        static Vec bottomLeft() { return Vec(RACK_GRID_WIDTH, RACK_GRID_HEIGHT - RACK_GRID_WIDTH); }
        static Vec bottomRight(float moduleWidth) {
            return Vec(moduleWidth - 2 * RACK_GRID_WIDTH, RACK_GRID_HEIGHT - RACK_GRID_WIDTH);
        }

        template <typename ScrewWidget = ScrewBlack>
        static void addStandardScrews(ModuleWidget* widget, float moduleWidth) {
            widget->addChild(createWidget<ScrewWidget>(topLeft()));
            widget->addChild(createWidget<ScrewWidget>(topRight(moduleWidth)));
            widget->addChild(createWidget<ScrewWidget>(bottomLeft()));
            widget->addChild(createWidget<ScrewWidget>(bottomRight(moduleWidth)));
        }
    };
};

}} // namespace mnemosyne::ui
