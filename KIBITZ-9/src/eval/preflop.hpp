#pragma once

#include "cards/card.hpp"
#include <cstdint>
#include <string>
#include <vector>

// created namespace so the 2-card logic never mixes with the 5-card scores
namespace Preflop {

// two hole cards before the flop - the score only ranks starting hands
// against each other and is NOT comparable with Eval::HandEvaluation::score
struct PreflopEvaluation {
    uint8_t hiRank;   // bigger card value (A = 14)
    uint8_t loRank;   // smaller one
    bool suited;      // true if both cards got the same suit
    int score;
    int gridIndex;    // 0..168 position in the starting hand grid
    std::string handClass;    // "AKs", "QQ", "T9o"
    std::string description;  // "Pocket Queens", "AK suited"
    std::vector<Cards::Card> holeCards;

    // checks if the 2 cards are the same rank (like 'JJ' or '77')
    bool isPair() const { return hiRank == loRank; }

    // checks if the ranks are right next to each other (like '98' or 'QJ')
    bool isConnector() const { return (hiRank - loRank) == 1; }
};

// throws Core::InsufficientCards unless given exactly 2 cards, Core::DuplicateCard on a repeat
PreflopEvaluation evaluatePreflop(const std::vector<Cards::Card>& holeCards);

// pairs 0..12, suited 13..90, offsuit 91..168 (A high first in every block)
int handToIndex(int hiRank, int loRank, bool suited);

}
