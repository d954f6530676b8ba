#pragma once

#include "cards/card.hpp"
#include <string>
#include <vector>

namespace Equity {

enum class Wetness { Dry, ModeratelyWet, Wet, VeryWet };

std::string wetnessName(Wetness w);

struct BoardTexture {
    bool flushDrawPossible = false;     // some suit shows 3+ times
    bool straightDrawPossible = false;  // 4 ranks inside a 4-rank window
    bool pairedBoard = false;
    int dangerCount = 0;
    double playerMultiplier = 1.0;
    double effectiveDanger = 0.0;
    Wetness wetness = Wetness::Dry;
    std::string dangerLevel = "Low";
    std::vector<std::string> warnings;
};

// more opponents make the same draws more dangerous
double opponentMultiplier(int activeOpponents);

// board only, fewer than 3 cards is always Dry
BoardTexture analyzeBoardTexture(const std::vector<Cards::Card>& board, int activeOpponents);

// any 4 distinct ranks spanning at most 4 values, A-2-3-4 counts
bool hasStraightDraw(const std::vector<Cards::Card>& cards);

}
