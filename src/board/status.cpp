#include "status.hpp"

namespace mnemosyne {
namespace board {

BoardStatus describeStatus(bool disabled, bool isShowingSequence, bool isInputPhase) {
    if (disabled) return STATUS_SPECTATING;
    if (isShowingSequence) return STATUS_WATCHING;
    if (isInputPhase) return STATUS_YOUR_TURN;
    return STATUS_READY;
}

BoardStatus describeStatus(const BoardInputs& inputs) {
    return describeStatus(inputs.disabled, inputs.isShowingSequence, inputs.isInputPhase);
}

std::string statusCaption(BoardStatus status, size_t sequenceLength) {
    switch (status) {
        case STATUS_SPECTATING:
            return "Spectating...";
        case STATUS_WATCHING:
            return "WATCH! (" + std::to_string(sequenceLength) +
                   (sequenceLength == 1 ? " color)" : " colors)");
        case STATUS_YOUR_TURN:
            return "Your turn!";
        default:
            return "Ready";
    }
}

std::string statusCaption(const BoardInputs& inputs) {
    return statusCaption(describeStatus(inputs), inputs.sequence.size());
}

std::string roundCaption(int round) {
    return "Round " + std::to_string(round);
}

std::string progressText(size_t entered, size_t total) {
    return std::to_string(entered) + "/" + std::to_string(total);
}

std::string progressText(const BoardInputs& inputs) {
    return progressText(inputs.playerSequence.size(), inputs.sequence.size());
}

std::string submitCaption(bool canSubmit, size_t entered, size_t total) {
    return canSubmit ? "SUBMIT" : progressText(entered, total);
}

std::string submitCaption(const BoardInputs& inputs) {
    return submitCaption(inputs.canSubmit, inputs.playerSequence.size(), inputs.sequence.size());
}

} // namespace board
} // namespace mnemosyne
