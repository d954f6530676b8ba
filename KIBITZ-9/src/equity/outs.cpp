#include "outs.hpp"
#include <algorithm>
#include <array>
#include <cstdint>

namespace Equity {

namespace {

// rank value 1..14 in the run window, 1 is the Ace playing low
int rankBitForWindow(int value) {
    return value == 1 ? 14 : value;
}

uint64_t cardsOfRank(int value, uint64_t seen) {
    uint64_t mask = 0;
    int rank = rankBitForWindow(value);
    for (int s = 0; s < Cards::NUM_SUITS; ++s) {
        int idx = (rank - 2) * Cards::NUM_SUITS + s;
        mask |= 1ULL << idx;
    }
    return mask & ~seen;
}

}

DrawInfo computeOuts(const std::vector<Cards::Card>& hole, const std::vector<Cards::Card>& board) {
    DrawInfo info;

    std::vector<Cards::Card> all = hole;
    all.insert(all.end(), board.begin(), board.end());

    uint64_t seen = 0;
    std::array<int, Cards::NUM_SUITS> suitCounts = {0};
    // index 1..14, with the Ace mirrored to 1 for the wheel
    std::array<bool, 15> hasRank = {false};

    for (const auto& c : all) {
        seen |= 1ULL << c.index();
        suitCounts[static_cast<int>(c.suit)]++;
        int v = Cards::rankValue(c.rank);
        hasRank[v] = true;
        if (v == 14) hasRank[1] = true;
    }

    uint64_t flushMask = 0;
    for (int s = 0; s < Cards::NUM_SUITS; ++s) {
        if (suitCounts[s] != 4) continue;
        for (int r = 0; r < Cards::NUM_RANKS; ++r) {
            int idx = r * Cards::NUM_SUITS + s;
            flushMask |= 1ULL << idx;
        }
    }
    flushMask &= ~seen;

    // every window low..low+3 fully present extends at low-1 and low+4 (ranks not held yet)
    uint64_t straightMask = 0;
    for (int low = 1; low + 3 <= 14; ++low) {
        bool run = hasRank[low] && hasRank[low + 1] && hasRank[low + 2] && hasRank[low + 3];
        if (!run) continue;
        if (low - 1 >= 1 && !hasRank[low - 1]) straightMask |= cardsOfRank(low - 1, seen);
        if (low + 4 <= 14 && !hasRank[low + 4]) straightMask |= cardsOfRank(low + 4, seen);
    }

    info.flushOuts = __builtin_popcountll(flushMask);
    info.straightOuts = __builtin_popcountll(straightMask);

    uint64_t outsMask = flushMask | straightMask;
    info.totalOuts = __builtin_popcountll(outsMask);
    while (outsMask) {
        int idx = __builtin_ctzll(outsMask);
        outsMask &= (outsMask - 1);
        info.outs.push_back(Cards::Card::fromIndex(idx));
    }

    info.cardsToCome = std::max(0, 5 - static_cast<int>(board.size()));

    // rule of 2 and 4: roughly 2% per out per card to come
    if (info.cardsToCome > 0) {
        info.improvePercentage = std::min(100.0, info.totalOuts * 2.0 * info.cardsToCome);
    }

    return info;
}

}
