#pragma once
#include <rack.hpp>
#include "../board/feedback.hpp"

using namespace rack;

namespace mnemosyne {
namespace dsp {

// ============================================================================
// TRIGGER UTILITIES
// ============================================================================

class TriggerHelper {
public:
    // Momentary param pressed by a widget; released here so each press fires once
    static bool processButton(Param& param) {
        if (param.getValue() > 0.5f) {
            param.setValue(0.f);
            return true;
        }
        return false;
    }

    // Panel button OR'd with its trigger jack
    static bool processTrigger(rack::dsp::SchmittTrigger& trigger, float paramValue, Input& input, float threshold = 1.f) {
        float combinedValue = paramValue;
        if (input.isConnected()) {
            combinedValue += input.getVoltage();
        }
        return trigger.process(combinedValue, 0.1f, threshold);
    }

    // CV trigger detection with hysteresis
    static bool processCVTrigger(rack::dsp::SchmittTrigger& trigger, Input& input, float threshold = 1.f) {
        if (!input.isConnected()) return false;
        return trigger.process(input.getVoltage(), 0.1f, threshold);
    }
};

// Feedback capability backed by a trigger jack: each request restarts the pulse
class PulseFeedback : public board::FeedbackTrigger {
public:
    void trigger(float seconds) override {
        pulse.trigger(seconds);
    }

    // Returns true while the pulse is high
    bool process(float sampleTime) {
        return pulse.process(sampleTime);
    }

private:
    rack::dsp::PulseGenerator pulse;
};

}} // namespace mnemosyne::dsp
