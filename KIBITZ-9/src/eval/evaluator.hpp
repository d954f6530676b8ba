#pragma once

#include "cards/card.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Eval {

// closed, totally ordered set of hand categories - the numeric value is the category index
enum class HandCategory : uint8_t {
    HighCard = 1,
    OnePair = 2,
    TwoPair = 3,
    ThreeOfAKind = 4,
    Straight = 5,
    Flush = 6,
    FullHouse = 7,
    FourOfAKind = 8,
    StraightFlush = 9,
    RoyalFlush = 10
};

// ranks run 2..14, so every significant rank fits in one base-15 digit
constexpr int RANK_BASE = 15;
// 15^5: one category outweighs any five significant ranks
constexpr int CATEGORY_WEIGHT = RANK_BASE * RANK_BASE * RANK_BASE * RANK_BASE * RANK_BASE;

struct HandEvaluation {
    HandCategory category;
    // comparable with plain '>' across any two evaluations
    int score;
    // (categoryIndex, rank1, rank2, ...) - significant ranks in comparison order
    std::vector<int> tiebreak;
    std::string name;
    std::string description;
    // winning subset, grouped cards first then kickers high to low
    std::vector<Cards::Card> bestFive;
};

inline int categoryIndex(HandCategory c) { return static_cast<int>(c); }
std::string categoryName(HandCategory c);

// best 5-card hand out of 5, 6 or 7 cards (any larger set works too)
// throws Core::InsufficientCards (< 5 cards) and Core::DuplicateCard
HandEvaluation evaluate(const std::vector<Cards::Card>& cards);

// exactly five distinct cards, no validation
HandEvaluation evaluateFive(const std::array<Cards::Card, 5>& cards);

// pure function of the category and its significant ranks
int computeScore(HandCategory category, const std::vector<int>& significantRanks);

// -1, 0, 1
int compare(const HandEvaluation& a, const HandEvaluation& b);

// top rank bit of a 5-long run in the 13-bit rank mask (bit 0 = deuce),
// 3 for the wheel, -1 if there is no straight
int findStraightHigh(int rankMask);

}
