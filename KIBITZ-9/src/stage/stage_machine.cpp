#include "stage_machine.hpp"
#include <algorithm>
#include <cstdlib>

namespace Stage {

std::string streetName(Street s) {
    switch (s) {
        case Street::PreFlop: return "Pre-Flop";
        case Street::Flop: return "Flop";
        case Street::Turn: return "Turn";
        case Street::River: return "River";
        case Street::Unknown: return "Unknown";
    }
    return "?";
}

int expectedCardCount(Street s) {
    switch (s) {
        case Street::Flop: return 3;
        case Street::Turn: return 4;
        case Street::River: return 5;
        default: return 0;
    }
}

int streetRank(Street s) {
    if (s == Street::Unknown) return -1;
    return static_cast<int>(s);
}

Street streetForCount(int communityCount) {
    switch (communityCount) {
        case 0: return Street::PreFlop;
        case 3: return Street::Flop;
        case 4: return Street::Turn;
        case 5: return Street::River;
        default: return Street::Unknown;
    }
}

double stageConfidence(Street street, int observedCount) {
    int expected = expectedCardCount(street);
    if (observedCount == expected) return 1.0;
    // linear decay over the 5 board slots, floored at 0
    double mismatch = std::abs(observedCount - expected);
    return std::max(0.0, 1.0 - mismatch / 5.0);
}

StageInfo classify(const std::vector<Cards::Card>& communityCards) {
    StageInfo info;
    info.cardCount = static_cast<int>(communityCards.size());
    info.street = streetForCount(info.cardCount);
    info.expectedCount = expectedCardCount(info.street);
    info.cards = communityCards;
    info.confidence = stageConfidence(info.street, info.cardCount);
    return info;
}

std::string transitionName(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::None: return "None";
        case TransitionKind::NewHand: return "NewHand";
        case TransitionKind::HandFinished: return "HandFinished";
        case TransitionKind::Progression: return "Progression";
        case TransitionKind::AnomalousBackward: return "AnomalousBackward";
        case TransitionKind::Other: return "Other";
    }
    return "?";
}

Transition HandTracker::observe(Street street) {
    if (street == current_) {
        return { TransitionKind::None, current_, street, handCount_, "" };
    }

    previous_ = current_;
    current_ = street;

    Transition t{ TransitionKind::Other, previous_, current_, handCount_, "" };

    bool fromPostflop = previous_ == Street::Flop || previous_ == Street::Turn ||
                        previous_ == Street::River;

    // any postflop street dropping back to Pre-Flop closes the hand
    if (fromPostflop && current_ == Street::PreFlop) {
        ++handCount_;
        if (previous_ == Street::River) {
            finishReason_ = "Completed (River)";
        } else {
            finishReason_ = "Early Finish (" + streetName(previous_) + ")";
        }
        t.kind = TransitionKind::HandFinished;
        t.reason = finishReason_;
    }
    else if (previous_ == Street::Unknown && current_ == Street::PreFlop) {
        ++handCount_;
        t.kind = TransitionKind::NewHand;
    }
    else if (streetRank(previous_) >= 0 && streetRank(current_) == streetRank(previous_) + 1) {
        t.kind = TransitionKind::Progression;
    }
    else if (streetRank(previous_) > streetRank(current_) && streetRank(current_) >= 0 &&
             current_ != Street::PreFlop) {
        t.kind = TransitionKind::AnomalousBackward;
    }

    t.handCount = handCount_;
    return t;
}

}
