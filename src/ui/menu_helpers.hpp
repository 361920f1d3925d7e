#pragma once
#include <rack.hpp>
#include <functional>
#include <string>

using namespace rack;

namespace mnemosyne {
namespace ui {

// ============================================================================
// CONTEXT MENU SLIDER HELPERS
// ============================================================================

// Quantity backed by setter/getter lambdas on the module
template<typename TModule, typename SetterFunc, typename GetterFunc>
class LambdaQuantity : public Quantity {
private:
    TModule* module;
    SetterFunc setter;
    GetterFunc getter;
    float minValue;
    float maxValue;
    float defaultValue;
    float displayScale;
    int precision;
    std::string label;
    std::string unit;

public:
    LambdaQuantity(TModule* mod, SetterFunc setterFunc, GetterFunc getterFunc,
                   float minVal, float maxVal, float defVal, float dispScale, int prec,
                   const std::string& lbl, const std::string& unt)
        : module(mod), setter(setterFunc), getter(getterFunc),
          minValue(minVal), maxValue(maxVal), defaultValue(defVal),
          displayScale(dispScale), precision(prec), label(lbl), unit(unt) {}

    void setValue(float v) override {
        if (module) {
            setter(module, clamp(v, minValue, maxValue));
        }
    }

    float getValue() override {
        return module ? getter(module) : defaultValue;
    }

    float getMinValue() override { return minValue; }
    float getMaxValue() override { return maxValue; }
    float getDefaultValue() override { return defaultValue; }
    float getDisplayValue() override { return getValue() * displayScale; }
    void setDisplayValue(float v) override { setValue(v / displayScale); }
    int getDisplayPrecision() override { return precision; }
    std::string getLabel() override { return label; }
    std::string getUnit() override { return unit; }
};

template<typename TModule, typename SetterFunc, typename GetterFunc>
struct LambdaSlider : rack::ui::Slider {
    LambdaSlider(TModule* module, SetterFunc setter, GetterFunc getter,
                 float minVal, float maxVal, float defVal, float displayScale, int precision,
                 const std::string& label, const std::string& unit, float width = 200.f) {
        quantity = new LambdaQuantity<TModule, SetterFunc, GetterFunc>(
            module, setter, getter, minVal, maxVal, defVal, displayScale, precision, label, unit
        );
        box.size.x = width;
    }

    ~LambdaSlider() {
        delete quantity;
    }
};

// Seconds stored, milliseconds displayed
template<typename TModule, typename SetterFunc, typename GetterFunc>
rack::ui::Slider* createMillisecondSlider(TModule* module, SetterFunc setter, GetterFunc getter,
                                          float minSeconds, float maxSeconds, float defaultSeconds,
                                          const std::string& label, float width = 200.f) {
    return new LambdaSlider<TModule, SetterFunc, GetterFunc>(
        module, setter, getter, minSeconds, maxSeconds, defaultSeconds, 1000.f, 3, label, " ms", width
    );
}

template<typename TModule, typename SetterFunc, typename GetterFunc>
rack::ui::Slider* createFloatSlider(TModule* module, SetterFunc setter, GetterFunc getter,
                                    float minVal, float maxVal, float defaultVal,
                                    const std::string& label, const std::string& unit = "",
                                    float width = 200.f) {
    return new LambdaSlider<TModule, SetterFunc, GetterFunc>(
        module, setter, getter, minVal, maxVal, defaultVal, 1.f, 3, label, unit, width
    );
}

// Whole-number setting; the setter receives the slider value unrounded
template<typename TModule, typename SetterFunc, typename GetterFunc>
rack::ui::Slider* createIntSlider(TModule* module, SetterFunc setter, GetterFunc getter,
                                  int minVal, int maxVal, int defaultVal,
                                  const std::string& label, const std::string& unit = "",
                                  float width = 200.f) {
    return new LambdaSlider<TModule, SetterFunc, GetterFunc>(
        module, setter, getter, (float)minVal, (float)maxVal, (float)defaultVal, 1.f, 0, label, unit, width
    );
}

}} // namespace mnemosyne::ui
