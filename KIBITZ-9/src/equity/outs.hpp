#pragma once

#include "cards/card.hpp"
#include <vector>

namespace Equity {

struct DrawInfo {
    int flushOuts = 0;
    int straightOuts = 0;
    int totalOuts = 0;      // each card counted once even if it fills both draws
    int cardsToCome = 0;    // 5 - board size
    double improvePercentage = 0.0;   // rule of 2 and 4, capped at 100
    std::vector<Cards::Card> outs;
};

/*
 Outs from everything hero can see (hole + board):
 - a suit with exactly 4 known cards adds its unseen cards of that suit
 - a run of 4 consecutive ranks (Ace also low) adds the unseen cards
   of the rank on either end of the run
*/
DrawInfo computeOuts(const std::vector<Cards::Card>& hole, const std::vector<Cards::Card>& board);

}
