#pragma once

#include "cards/card.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Stage {

// betting round inferred from the community card count
enum class Street : uint8_t {
    PreFlop = 0,
    Flop = 1,
    Turn = 2,
    River = 3,
    Unknown = 4   // card count matches no street (1, 2 or noise)
};

std::string streetName(Street s);

// 0/3/4/5, Unknown expects 0
int expectedCardCount(Street s);

// PreFlop=0 ... River=3, -1 for Unknown
int streetRank(Street s);

struct StageInfo {
    Street street;
    int cardCount;
    int expectedCount;
    std::vector<Cards::Card> cards;   // recognized community cards in board order
    double confidence;                // 1.0 on an exact match, decays 0.2 per card off
};

StageInfo classify(const std::vector<Cards::Card>& communityCards);

Street streetForCount(int communityCount);

double stageConfidence(Street street, int observedCount);

enum class TransitionKind : uint8_t {
    None,               // same street as last pass
    NewHand,            // Unknown -> PreFlop
    HandFinished,       // Flop/Turn/River -> PreFlop
    Progression,        // PreFlop -> Flop -> Turn -> River
    AnomalousBackward,  // eg. River -> Flop, logged but not counted
    Other               // skipped streets or a drop into Unknown
};

struct Transition {
    TransitionKind kind;
    Street from;
    Street to;
    int handCount;          // counter after this transition
    std::string reason;     // finish reason on HandFinished, empty otherwise
};

std::string transitionName(TransitionKind kind);

/*
 Hand-lifecycle tracker, the only cross-pass state of this module.
 Starts at Unknown so the very first PreFlop read counts as a new hand.
 Transitions are only evaluated when the street actually changes, repeated
 reads of the same street are no-ops.
*/
class HandTracker {
public:
    Transition observe(Street street);

    int handCount() const { return handCount_; }
    const std::string& finishReason() const { return finishReason_; }
    Street current() const { return current_; }
    Street previous() const { return previous_; }

private:
    Street previous_ = Street::Unknown;
    Street current_ = Street::Unknown;
    int handCount_ = 0;
    std::string finishReason_ = "Unknown";
};

}
