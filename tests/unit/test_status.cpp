#include "board/status.hpp"

#include <catch2/catch.hpp>

using namespace mnemosyne::board;

TEST_CASE("Status: precedence", "[status]") {
    CHECK(describeStatus(true, true, true) == STATUS_SPECTATING);
    CHECK(describeStatus(false, true, true) == STATUS_WATCHING);
    CHECK(describeStatus(false, false, true) == STATUS_YOUR_TURN);
    CHECK(describeStatus(false, false, false) == STATUS_READY);
}

TEST_CASE("Status: captions", "[status]") {
    CHECK(statusCaption(STATUS_SPECTATING, 3) == "Spectating...");
    CHECK(statusCaption(STATUS_WATCHING, 1) == "WATCH! (1 color)");
    CHECK(statusCaption(STATUS_WATCHING, 3) == "WATCH! (3 colors)");
    CHECK(statusCaption(STATUS_YOUR_TURN, 3) == "Your turn!");
    CHECK(statusCaption(STATUS_READY, 0) == "Ready");
    CHECK(roundCaption(7) == "Round 7");
}

TEST_CASE("Status: captions from a board snapshot", "[status]") {
    BoardInputs in;
    in.sequence = {COLOR_RED, COLOR_GREEN, COLOR_BLUE};
    in.isShowingSequence = true;
    CHECK(statusCaption(in) == "WATCH! (3 colors)");

    in.isShowingSequence = false;
    in.isInputPhase = true;
    in.playerSequence = {COLOR_RED};
    CHECK(statusCaption(in) == "Your turn!");
    CHECK(progressText(in) == "1/3");
    CHECK(submitCaption(in) == "1/3");

    in.playerSequence = {COLOR_RED, COLOR_GREEN, COLOR_BLUE};
    in.canSubmit = true;
    CHECK(submitCaption(in) == "SUBMIT");

    in.disabled = true;
    CHECK(describeStatus(in) == STATUS_SPECTATING);
}
