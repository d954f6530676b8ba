#include "board_texture.hpp"
#include <array>

namespace Equity {

std::string wetnessName(Wetness w) {
    switch (w) {
        case Wetness::Dry: return "Dry";
        case Wetness::ModeratelyWet: return "Moderately Wet";
        case Wetness::Wet: return "Wet";
        case Wetness::VeryWet: return "Very Wet";
    }
    return "?";
}

double opponentMultiplier(int activeOpponents) {
    if (activeOpponents >= 7) return 2.0;   // 8+ way pot
    if (activeOpponents >= 4) return 1.5;   // 5+ way pot
    if (activeOpponents >= 2) return 1.2;   // 3+ way pot
    return 1.0;
}

bool hasStraightDraw(const std::vector<Cards::Card>& cards) {
    int mask = 0;
    for (const auto& c : cards) {
        mask |= 1 << (Cards::rankValue(c.rank) - 2);
    }

    // 4 consecutive rank bits set inside a 4 wide window: hi - lo == 3
    if (mask & (mask << 1) & (mask << 2) & (mask << 3)) return true;

    // wheel partial A-2-3-4
    return (mask & 0x1007) == 0x1007;
}

BoardTexture analyzeBoardTexture(const std::vector<Cards::Card>& board, int activeOpponents) {
    BoardTexture texture;
    if (board.size() < 3) return texture;

    std::array<int, Cards::NUM_SUITS> suitCounts = {0};
    std::array<int, 15> rankCounts = {0};
    for (const auto& c : board) {
        suitCounts[static_cast<int>(c.suit)]++;
        rankCounts[Cards::rankValue(c.rank)]++;
    }

    for (int count : suitCounts) {
        if (count >= 3) texture.flushDrawPossible = true;
    }
    for (int count : rankCounts) {
        if (count >= 2) texture.pairedBoard = true;
    }
    texture.straightDrawPossible = hasStraightDraw(board);

    texture.dangerCount = int(texture.flushDrawPossible) + int(texture.straightDrawPossible) +
                          int(texture.pairedBoard);
    texture.playerMultiplier = opponentMultiplier(activeOpponents);
    texture.effectiveDanger = texture.dangerCount * texture.playerMultiplier;

    if (texture.effectiveDanger >= 3.0) {
        texture.wetness = Wetness::VeryWet;
        texture.dangerLevel = "Very High";
    } else if (texture.effectiveDanger >= 2.0) {
        texture.wetness = Wetness::Wet;
        texture.dangerLevel = "High";
    } else if (texture.effectiveDanger >= 1.0) {
        texture.wetness = Wetness::ModeratelyWet;
        texture.dangerLevel = "Medium";
    }

    // multi-way specific warnings
    if (texture.flushDrawPossible && activeOpponents >= 4) {
        texture.warnings.push_back("High flush completion risk with many opponents");
    }
    if (texture.straightDrawPossible && activeOpponents >= 5) {
        texture.warnings.push_back("Multiple straight possibilities with many players");
    }
    if (texture.pairedBoard && activeOpponents >= 3) {
        texture.warnings.push_back("Full house/trips risk in multi-way pot");
    }

    return texture;
}

}
