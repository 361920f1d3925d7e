#include "plugin.hpp"
#include "board/config.hpp"
#include "board/coordinator.hpp"
#include "board/session.hpp"
#include "board/status.hpp"
#include "dsp/triggers.hpp"
#include "graphics/palette.hpp"
#include "recall/ui.hpp"
#include "recall/view.hpp"
#include "ui/layout.hpp"
#include "ui/menu_helpers.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>

using namespace mnemosyne;
using mnemosyne::dsp::TriggerHelper;

struct Recall : Module,
    public recall::RecallView,
    public recall::RecallController {
    enum ParamId {
        START_PARAM,
        SUBMIT_PARAM,
        SPECTATE_PARAM,
        // Pressed by the board widget, released in process()
        ENUMS(REGION_PARAM, board::COLOR_COUNT),
        HUB_SUBMIT_PARAM,
        PARAMS_LEN
    };
    enum InputId {
        START_INPUT,
        SUBMIT_INPUT,
        ENUMS(REGION_INPUT, board::COLOR_COUNT),
        INPUTS_LEN
    };
    enum OutputId {
        ENUMS(REGION_OUTPUT, board::COLOR_COUNT),
        GATE_OUTPUT,
        PITCH_OUTPUT,
        FEEDBACK_OUTPUT,
        SUCCESS_OUTPUT,
        FAIL_OUTPUT,
        ROUND_OUTPUT,
        OUTPUTS_LEN
    };
    enum LightId {
        ENUMS(REGION_LIGHT, board::COLOR_COUNT),
        ENUMS(TIMER_LIGHT, 3),
        LIGHTS_LEN
    };

    // Classic Simon tones, V/oct with 0 V = C4, indexed by board::Color
    static constexpr float REGION_PITCH[board::COLOR_COUNT] = {
        1.f + 9.f / 12.f,   // red    A5
        1.f + 1.f / 12.f,   // yellow C#5
        4.f / 12.f,         // green  E4
        1.f + 4.f / 12.f    // blue   E5
    };
    static constexpr float RESULT_PULSE_SECONDS = 0.01f;
    static constexpr int MAX_UI_ENTRIES = 64;

    // boardConfig belongs to the engine thread. Menu and patch edits land in
    // pendingConfig and are copied across in process().
    board::BoardConfig boardConfig;
    board::PendingConfig pendingConfig;
    std::atomic<bool> restartRequested = {false};

    board::GameSession session;
    board::PlaybackCoordinator coordinator;
    mnemosyne::dsp::PulseFeedback feedback;
    rack::dsp::PulseGenerator successPulse;
    rack::dsp::PulseGenerator failPulse;
    uint64_t syncedRevision = UINT64_MAX;

    rack::dsp::SchmittTrigger startTrigger;
    rack::dsp::SchmittTrigger submitTrigger;
    rack::dsp::SchmittTrigger regionTriggers[board::COLOR_COUNT];

    float heldPitch = 0.f;
    float timerPhase = 0.f;

    // Engine thread writes, UI thread reads
    std::atomic<int> uiActive = {board::NO_REGION};
    std::atomic<int> uiRound = {1};
    std::atomic<int> uiSequenceLength = {0};
    std::atomic<int> uiPlayerCount = {0};
    std::atomic<int> uiEntries[MAX_UI_ENTRIES];
    std::atomic<int> uiStatus = {board::STATUS_READY};
    std::atomic<bool> uiInteractive = {false};
    std::atomic<bool> uiCanSubmit = {false};
    std::atomic<bool> uiCountdownVisible = {false};
    std::atomic<int> uiSeconds = {0};
    std::atomic<int> uiSeverity = {board::SEVERITY_CALM};
    std::atomic<int> uiTimerColor = {board::TIMER_GREEN};
    std::atomic<bool> uiPulsing = {false};
    std::atomic<int> uiBest = {0};
    std::atomic<bool> uiGameOver = {false};
    std::atomic<float> uiGap = {4.f};
    std::atomic<float> uiInnerRatio = {0.386f};

    Recall()
        : session(board::SessionSettings(), board::CountdownThresholds(), rack::random::u32()) {
        config(PARAMS_LEN, INPUTS_LEN, OUTPUTS_LEN, LIGHTS_LEN);

        configButton(START_PARAM, "New game");
        configButton(SUBMIT_PARAM, "Submit");
        configSwitch(SPECTATE_PARAM, 0.f, 1.f, 0.f, "Mode", {"Play", "Spectate"});
        for (int i = 0; i < board::COLOR_COUNT; i++) {
            configButton(REGION_PARAM + i, "Press " + board::regionName(i));
        }
        configButton(HUB_SUBMIT_PARAM, "Submit (hub)");

        configInput(START_INPUT, "New game trigger");
        configInput(SUBMIT_INPUT, "Submit trigger");
        for (int i = 0; i < board::COLOR_COUNT; i++) {
            configInput(REGION_INPUT + i, board::regionName(i) + " press trigger");
            configOutput(REGION_OUTPUT + i, board::regionName(i) + " gate");
        }
        configOutput(GATE_OUTPUT, "Any region lit gate");
        configOutput(PITCH_OUTPUT, "Pitch (V/oct)");
        configOutput(FEEDBACK_OUTPUT, "Press feedback trigger");
        configOutput(SUCCESS_OUTPUT, "Round passed trigger");
        configOutput(FAIL_OUTPUT, "Game over trigger");
        configOutput(ROUND_OUTPUT, "Round (0.1 V per round)");

        for (int i = 0; i < MAX_UI_ENTRIES; i++) uiEntries[i].store(board::NO_REGION);

        board::BoardCallbacks callbacks;
        callbacks.onColorClick = [this](board::Region region) { session.recordColor(region); };
        callbacks.onSubmit = [this]() { session.submit(); };
        callbacks.onPlaybackFinished = [this](int round) { session.onPlaybackFinished(round); };
        coordinator.setCallbacks(callbacks);
        coordinator.setFeedback(&feedback);

        session.onResult = [this](const board::RoundResult& result) { onRoundResult(result); };

        applyConfig();
    }

    // ---- RecallController (UI thread) ----

    void pressRegion(board::Region region) override {
        if (region < 0 || region >= board::COLOR_COUNT) return;
        params[REGION_PARAM + region].setValue(1.f);
    }

    void pressSubmit() override {
        params[HUB_SUBMIT_PARAM].setValue(1.f);
    }

    // ---- RecallView (UI thread) ----

    board::Region getActiveRegion() const override { return uiActive.load(std::memory_order_relaxed); }
    int getRound() const override { return uiRound.load(std::memory_order_relaxed); }
    int getSequenceLength() const override { return uiSequenceLength.load(std::memory_order_relaxed); }
    int getPlayerCount() const override { return uiPlayerCount.load(std::memory_order_relaxed); }
    board::Region getPlayerEntry(int idx) const override {
        if (idx < 0 || idx >= MAX_UI_ENTRIES) return board::NO_REGION;
        return uiEntries[idx].load(std::memory_order_relaxed);
    }
    board::BoardStatus getStatus() const override {
        return (board::BoardStatus)uiStatus.load(std::memory_order_relaxed);
    }
    bool isInteractive() const override { return uiInteractive.load(std::memory_order_relaxed); }
    bool canSubmit() const override { return uiCanSubmit.load(std::memory_order_relaxed); }
    board::CountdownPresentation getCountdown() const override {
        board::CountdownPresentation cd;
        cd.visible = uiCountdownVisible.load(std::memory_order_relaxed);
        cd.secondsRemaining = uiSeconds.load(std::memory_order_relaxed);
        cd.severity = (board::CountdownSeverity)uiSeverity.load(std::memory_order_relaxed);
        cd.pulsing = uiPulsing.load(std::memory_order_relaxed);
        cd.color = (board::TimerColor)uiTimerColor.load(std::memory_order_relaxed);
        cd.emphasis = board::emphasisForSeverity(cd.severity);
        return cd;
    }
    int getBestRound() const override { return uiBest.load(std::memory_order_relaxed); }
    bool isGameOver() const override { return uiGameOver.load(std::memory_order_relaxed); }
    float getGapDegrees() const override { return uiGap.load(std::memory_order_relaxed); }
    float getInnerRadiusRatio() const override { return uiInnerRatio.load(std::memory_order_relaxed); }

    // ---- Engine thread ----

    void applyConfig() {
        board::sanitizeConfig(boardConfig);
        // Outputs and lights exist for the four classic colors only
        boardConfig.session.regionCount = std::min(boardConfig.session.regionCount, (int)board::COLOR_COUNT);
        coordinator.setTiming(boardConfig.timing);
        session.setSettings(boardConfig.session);
        session.setThresholds(boardConfig.thresholds);
        uiGap.store(boardConfig.gapDegrees, std::memory_order_relaxed);
        uiInnerRatio.store(boardConfig.innerRadiusRatio, std::memory_order_relaxed);
    }

    void syncBoard() {
        if (session.revision() == syncedRevision) return;
        syncedRevision = session.revision();
        coordinator.update(session.boardInputs());
    }

    void startGame() {
        // Pass through idle so a new game never matches the previous run's identity
        session.stop();
        syncBoard();
        session.start();
        syncBoard();
        INFO("Recall: new game started at round %d", session.round());
    }

    void onRoundResult(const board::RoundResult& result) {
        if (result.isCorrect) {
            successPulse.trigger(RESULT_PULSE_SECONDS);
        } else {
            failPulse.trigger(RESULT_PULSE_SECONDS);
            INFO("Recall: game over at round %d (%s), best round %d", result.round,
                 result.reason == board::RESULT_TIMEOUT ? "timeout" : "wrong sequence",
                 session.bestRound());
        }
    }

    void onReset() override {
        pendingConfig.replace(board::BoardConfig());
        boardConfig = board::BoardConfig();
        applyConfig();
        session.stop();
        syncBoard();
    }

    void process(const ProcessArgs& args) override {
        if (pendingConfig.take(boardConfig)) {
            applyConfig();
        }

        session.setDisabled(params[SPECTATE_PARAM].getValue() > 0.5f);

        bool startPressed = TriggerHelper::processTrigger(startTrigger, params[START_PARAM].getValue(), inputs[START_INPUT]);
        if (startPressed || restartRequested.exchange(false)) {
            startGame();
        }
        syncBoard();

        // Board presses and per-color trigger jacks
        for (int i = 0; i < board::COLOR_COUNT; i++) {
            bool pressed = TriggerHelper::processButton(params[REGION_PARAM + i]);
            if (TriggerHelper::processCVTrigger(regionTriggers[i], inputs[REGION_INPUT + i])) pressed = true;
            if (pressed) {
                coordinator.clickRegion(i);
                syncBoard();
            }
        }

        bool submitPressed = TriggerHelper::processButton(params[HUB_SUBMIT_PARAM]);
        if (TriggerHelper::processTrigger(submitTrigger, params[SUBMIT_PARAM].getValue(), inputs[SUBMIT_INPUT]))
            submitPressed = true;
        if (submitPressed) {
            coordinator.submit();
            syncBoard();
        }

        session.process(args.sampleTime);
        syncBoard();
        coordinator.process(args.sampleTime);
        syncBoard();

        updateOutputs(args);
        publishState();
    }

    void updateOutputs(const ProcessArgs& args) {
        board::Region active = coordinator.activeRegion();
        bool lit = active >= 0 && active < board::COLOR_COUNT;
        if (lit) heldPitch = REGION_PITCH[active];

        for (int i = 0; i < board::COLOR_COUNT; i++) {
            bool on = lit && active == i;
            outputs[REGION_OUTPUT + i].setVoltage(on ? 10.f : 0.f);
            float idle = coordinator.acceptsClicks() ? 0.15f : 0.f;
            lights[REGION_LIGHT + i].setBrightness(on ? 1.f : idle);
        }
        outputs[GATE_OUTPUT].setVoltage(lit ? 10.f : 0.f);
        outputs[PITCH_OUTPUT].setVoltage(heldPitch);
        outputs[FEEDBACK_OUTPUT].setVoltage(feedback.process(args.sampleTime) ? 10.f : 0.f);
        outputs[SUCCESS_OUTPUT].setVoltage(successPulse.process(args.sampleTime) ? 10.f : 0.f);
        outputs[FAIL_OUTPUT].setVoltage(failPulse.process(args.sampleTime) ? 10.f : 0.f);
        bool playing = session.phase() != board::PHASE_IDLE;
        outputs[ROUND_OUTPUT].setVoltage(playing ? 0.1f * session.round() : 0.f);

        board::CountdownPresentation cd = board::presentCountdown(session.boardInputs(), boardConfig.thresholds);
        float level = 0.f;
        if (cd.visible) {
            level = 1.f;
            if (cd.pulsing) {
                timerPhase += args.sampleTime * 2.f;
                if (timerPhase >= 1.f) timerPhase -= 1.f;
                level = 0.5f + 0.5f * std::cos(2.f * M_PI * timerPhase);
            }
        } else {
            timerPhase = 0.f;
        }
        graphics::BoardPalette::setRGBLight(this, TIMER_LIGHT, graphics::BoardPalette::timerColor(cd.color) * level);
    }

    void publishState() {
        const board::BoardInputs& in = session.boardInputs();
        uiActive.store(coordinator.activeRegion(), std::memory_order_relaxed);
        uiRound.store(in.round, std::memory_order_relaxed);
        uiSequenceLength.store((int)in.sequence.size(), std::memory_order_relaxed);
        int entered = (int)in.playerSequence.size();
        uiPlayerCount.store(entered, std::memory_order_relaxed);
        for (int i = 0; i < entered && i < MAX_UI_ENTRIES; i++) {
            uiEntries[i].store(in.playerSequence[i], std::memory_order_relaxed);
        }
        uiStatus.store(board::describeStatus(in), std::memory_order_relaxed);
        uiInteractive.store(coordinator.acceptsClicks(), std::memory_order_relaxed);
        uiCanSubmit.store(in.canSubmit, std::memory_order_relaxed);

        board::CountdownPresentation cd = board::presentCountdown(in, boardConfig.thresholds);
        uiCountdownVisible.store(cd.visible, std::memory_order_relaxed);
        uiSeconds.store(cd.secondsRemaining, std::memory_order_relaxed);
        uiSeverity.store(cd.severity, std::memory_order_relaxed);
        uiTimerColor.store(cd.color, std::memory_order_relaxed);
        uiPulsing.store(cd.pulsing, std::memory_order_relaxed);
        uiBest.store(session.bestRound(), std::memory_order_relaxed);
        uiGameOver.store(session.phase() == board::PHASE_GAME_OVER, std::memory_order_relaxed);
    }

    json_t* dataToJson() override {
        const board::BoardConfig saved = pendingConfig.snapshot();
        json_t* rootJ = json_object();
        json_object_set_new(rootJ, "showDuration", json_real(saved.timing.showDuration));
        json_object_set_new(rootJ, "showGap", json_real(saved.timing.showGap));
        json_object_set_new(rootJ, "clickFlash", json_real(saved.timing.clickFlash));
        json_object_set_new(rootJ, "clickPulse", json_real(saved.timing.clickPulse));
        json_object_set_new(rootJ, "submitPulse", json_real(saved.timing.submitPulse));
        json_object_set_new(rootJ, "warningAt", json_integer(saved.thresholds.warningAt));
        json_object_set_new(rootJ, "criticalAt", json_integer(saved.thresholds.criticalAt));
        json_object_set_new(rootJ, "inputTimeLimit", json_real(saved.session.inputTimeLimit));
        json_object_set_new(rootJ, "resultPause", json_real(saved.session.resultPause));
        json_object_set_new(rootJ, "gapDegrees", json_real(saved.gapDegrees));
        json_object_set_new(rootJ, "innerRadiusRatio", json_real(saved.innerRadiusRatio));
        return rootJ;
    }

    void dataFromJson(json_t* rootJ) override {
        board::BoardConfig loaded;
        readReal(rootJ, "showDuration", loaded.timing.showDuration);
        readReal(rootJ, "showGap", loaded.timing.showGap);
        readReal(rootJ, "clickFlash", loaded.timing.clickFlash);
        readReal(rootJ, "clickPulse", loaded.timing.clickPulse);
        readReal(rootJ, "submitPulse", loaded.timing.submitPulse);
        readInt(rootJ, "warningAt", loaded.thresholds.warningAt);
        readInt(rootJ, "criticalAt", loaded.thresholds.criticalAt);
        readReal(rootJ, "inputTimeLimit", loaded.session.inputTimeLimit);
        readReal(rootJ, "resultPause", loaded.session.resultPause);
        readReal(rootJ, "gapDegrees", loaded.gapDegrees);
        readReal(rootJ, "innerRadiusRatio", loaded.innerRadiusRatio);

        if (board::sanitizeConfig(loaded)) {
            WARN("Recall: patch settings out of range, clamped to legal values");
        }
        pendingConfig.replace(loaded);
        INFO("Recall: settings restored (show %.2fs, gap %.2fs, time limit %.0fs)",
             loaded.timing.showDuration, loaded.timing.showGap, loaded.session.inputTimeLimit);
    }

    static void readReal(json_t* rootJ, const char* key, float& value) {
        json_t* j = json_object_get(rootJ, key);
        if (j && json_is_number(j)) value = (float)json_number_value(j);
    }

    static void readInt(json_t* rootJ, const char* key, int& value) {
        json_t* j = json_object_get(rootJ, key);
        if (j && json_is_integer(j)) value = (int)json_integer_value(j);
    }
};

constexpr float Recall::REGION_PITCH[board::COLOR_COUNT];
constexpr float Recall::RESULT_PULSE_SECONDS;
constexpr int Recall::MAX_UI_ENTRIES;

struct RecallWidget : ModuleWidget {
    RecallWidget(Recall* module) {
        setModule(module);
        setPanel(createPanel(asset::plugin(pluginInstance, "res/panels/Recall.svg")));

        using LayoutHelper = mnemosyne::ui::LayoutHelper;
        LayoutHelper::ScrewPositions::addStandardScrews<ScrewBlack>(this, box.size.x);
        LayoutHelper::PanelSVGParser parser(asset::plugin(pluginInstance, "res/panels/Recall.svg"));

        recall::RecallView* view = module;
        recall::RecallController* ctrl = module;

        Rect countdownMm = parser.rectMm("countdown", 30.8f, 11.f, 40.f, 7.f);
        recall::RecallCountdownWidget* countdown = new recall::RecallCountdownWidget(view);
        countdown->box.pos = mm2px(countdownMm.pos);
        countdown->box.size = mm2px(countdownMm.size);
        addChild(countdown);

        Rect boardMm = parser.rectMm("board", 18.8f, 19.f, 64.f, 64.f);
        recall::RecallBoardWidget* boardWidget = new recall::RecallBoardWidget(view, ctrl);
        boardWidget->box.pos = mm2px(boardMm.pos);
        boardWidget->box.size = mm2px(boardMm.size);
        addChild(boardWidget);

        Rect statusMm = parser.rectMm("status", 10.8f, 84.f, 80.f, 11.f);
        recall::RecallStatusWidget* status = new recall::RecallStatusWidget(view);
        status->box.pos = mm2px(statusMm.pos);
        status->box.size = mm2px(statusMm.size);
        addChild(status);

        // Row 1: game controls
        addParam(createParamCentered<VCVButton>(parser.centerPx("start-btn", 10.f, 99.f), module, Recall::START_PARAM));
        addInput(createInputCentered<PJ301MPort>(parser.centerPx("start-in", 21.f, 99.f), module, Recall::START_INPUT));
        addParam(createParamCentered<VCVButton>(parser.centerPx("submit-btn", 33.f, 99.f), module, Recall::SUBMIT_PARAM));
        addInput(createInputCentered<PJ301MPort>(parser.centerPx("submit-in", 44.f, 99.f), module, Recall::SUBMIT_INPUT));
        addParam(createParamCentered<CKSS>(parser.centerPx("spectate", 56.f, 99.f), module, Recall::SPECTATE_PARAM));
        addChild(createLightCentered<MediumLight<RedGreenBlueLight>>(parser.centerPx("timer-light", 67.f, 99.f), module, Recall::TIMER_LIGHT));
        addOutput(createOutputCentered<PJ301MPort>(parser.centerPx("round-out", 79.f, 99.f), module, Recall::ROUND_OUTPUT));
        addOutput(createOutputCentered<PJ301MPort>(parser.centerPx("feedback-out", 91.f, 99.f), module, Recall::FEEDBACK_OUTPUT));

        // Row 2: per-color press triggers, row 3: per-color gates
        const char* names[board::COLOR_COUNT] = {"red", "yellow", "green", "blue"};
        for (int i = 0; i < board::COLOR_COUNT; i++) {
            float x = 10.f + 11.f * i;
            addInput(createInputCentered<PJ301MPort>(parser.centerPx(std::string(names[i]) + "-in", x, 109.f), module, Recall::REGION_INPUT + i));
            addOutput(createOutputCentered<PJ301MPort>(parser.centerPx(std::string(names[i]) + "-out", x, 119.f), module, Recall::REGION_OUTPUT + i));
        }
        addChild(createLightCentered<SmallLight<RedLight>>(parser.centerPx("red-light", 14.5f, 114.f), module, Recall::REGION_LIGHT + board::COLOR_RED));
        addChild(createLightCentered<SmallLight<YellowLight>>(parser.centerPx("yellow-light", 25.5f, 114.f), module, Recall::REGION_LIGHT + board::COLOR_YELLOW));
        addChild(createLightCentered<SmallLight<GreenLight>>(parser.centerPx("green-light", 36.5f, 114.f), module, Recall::REGION_LIGHT + board::COLOR_GREEN));
        addChild(createLightCentered<SmallLight<BlueLight>>(parser.centerPx("blue-light", 47.5f, 114.f), module, Recall::REGION_LIGHT + board::COLOR_BLUE));

        addOutput(createOutputCentered<PJ301MPort>(parser.centerPx("gate-out", 67.f, 109.f), module, Recall::GATE_OUTPUT));
        addOutput(createOutputCentered<PJ301MPort>(parser.centerPx("pitch-out", 79.f, 109.f), module, Recall::PITCH_OUTPUT));
        addOutput(createOutputCentered<PJ301MPort>(parser.centerPx("success-out", 67.f, 119.f), module, Recall::SUCCESS_OUTPUT));
        addOutput(createOutputCentered<PJ301MPort>(parser.centerPx("fail-out", 79.f, 119.f), module, Recall::FAIL_OUTPUT));
    }

    void appendContextMenu(Menu* menu) override {
        Recall* module = dynamic_cast<Recall*>(this->module);
        if (!module) return;

        using namespace mnemosyne::ui;
        typedef board::ConfigLimits Limits;
        const board::BoardConfig defaults;

        menu->addChild(new MenuSeparator);
        menu->addChild(createMenuItem("New game", "", [module]() {
            module->restartRequested = true;
        }));

        menu->addChild(createSubmenuItem("Playback", "", [module, defaults](Menu* sub) {
            sub->addChild(createMillisecondSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.timing.showDuration = v; }); },
                [](Recall* m) { return m->pendingConfig.snapshot().timing.showDuration; },
                Limits::MIN_SHOW_DURATION, Limits::MAX_SHOW_DURATION, defaults.timing.showDuration, "Reveal"));
            sub->addChild(createMillisecondSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.timing.showGap = v; }); },
                [](Recall* m) { return m->pendingConfig.snapshot().timing.showGap; },
                Limits::MIN_SHOW_GAP, Limits::MAX_SHOW_GAP, defaults.timing.showGap, "Pause between"));
            sub->addChild(createMillisecondSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.timing.clickFlash = v; }); },
                [](Recall* m) { return m->pendingConfig.snapshot().timing.clickFlash; },
                Limits::MIN_CLICK_FLASH, Limits::MAX_CLICK_FLASH, defaults.timing.clickFlash, "Press flash"));
        }));

        menu->addChild(createSubmenuItem("Round Limits", "", [module, defaults](Menu* sub) {
            sub->addChild(createFloatSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.session.inputTimeLimit = v; }); },
                [](Recall* m) { return m->pendingConfig.snapshot().session.inputTimeLimit; },
                Limits::MIN_INPUT_TIME, Limits::MAX_INPUT_TIME, defaults.session.inputTimeLimit, "Time limit", " s"));
            sub->addChild(createFloatSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.session.resultPause = v; }); },
                [](Recall* m) { return m->pendingConfig.snapshot().session.resultPause; },
                Limits::MIN_RESULT_PAUSE, Limits::MAX_RESULT_PAUSE, defaults.session.resultPause, "Result pause", " s"));
            sub->addChild(new MenuSeparator);
            sub->addChild(createMenuLabel("Countdown"));
            sub->addChild(createIntSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.thresholds.warningAt = (int)std::round(v); }); },
                [](Recall* m) { return (float)m->pendingConfig.snapshot().thresholds.warningAt; },
                0, Limits::MAX_THRESHOLD, defaults.thresholds.warningAt, "Warning at", " s"));
            sub->addChild(createIntSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.thresholds.criticalAt = (int)std::round(v); }); },
                [](Recall* m) { return (float)m->pendingConfig.snapshot().thresholds.criticalAt; },
                0, Limits::MAX_THRESHOLD, defaults.thresholds.criticalAt, "Critical at", " s"));
        }));

        menu->addChild(createSubmenuItem("Board", "", [module, defaults](Menu* sub) {
            sub->addChild(createFloatSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.gapDegrees = v; }); },
                [](Recall* m) { return m->pendingConfig.snapshot().gapDegrees; },
                0.f, Limits::MAX_GAP_DEGREES, defaults.gapDegrees, "Wedge gap", "°"));
            sub->addChild(createFloatSlider(module,
                [](Recall* m, float v) { m->pendingConfig.edit([v](board::BoardConfig& c) { c.innerRadiusRatio = v; }); },
                [](Recall* m) { return m->pendingConfig.snapshot().innerRadiusRatio; },
                Limits::MIN_RADIUS_RATIO, Limits::MAX_RADIUS_RATIO, defaults.innerRadiusRatio, "Hub size"));
        }));
    }
};

Model* modelRecall = createModel<Recall, RecallWidget>("Recall");
