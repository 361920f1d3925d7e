#pragma once

#include <string>
#include "types.hpp"

namespace mnemosyne {
namespace board {

enum BoardStatus {
    STATUS_SPECTATING,
    STATUS_WATCHING,
    STATUS_YOUR_TURN,
    STATUS_READY
};

// Disabled wins over showing, showing wins over input
BoardStatus describeStatus(bool disabled, bool isShowingSequence, bool isInputPhase);
BoardStatus describeStatus(const BoardInputs& inputs);

std::string statusCaption(BoardStatus status, size_t sequenceLength);
std::string statusCaption(const BoardInputs& inputs);

std::string roundCaption(int round);

// "entered/total"
std::string progressText(size_t entered, size_t total);
std::string progressText(const BoardInputs& inputs);

std::string submitCaption(bool canSubmit, size_t entered, size_t total);
std::string submitCaption(const BoardInputs& inputs);

} // namespace board
} // namespace mnemosyne
