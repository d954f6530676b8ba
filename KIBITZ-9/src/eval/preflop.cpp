#include "preflop.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace Preflop {

namespace {

// pocket pairs sit above every unpaired hand: 2000 + 2*100 > 1000 + 14*15 + 13 + 50
constexpr int PAIR_BASE = 2000;
constexpr int UNPAIRED_BASE = 1000;
constexpr int SUITED_BONUS = 50;

}

int handToIndex(int hiRank, int loRank, bool suited) {

    // if it's a pocket pair (like '33' or 'AA'), just return the index of the specific rank
    if (hiRank == loRank) {
        return 14 - hiRank;
    }

    // suited and offsuit blocks walk the same (hi, lo) order, offsuit starts after all suited
    int offset = suited ? 13 : 91;
    int index = 0;

    for (int i = 14; i >= 3; --i) {
        for (int j = i - 1; j >= 2; --j) {
            if (i == hiRank && j == loRank) {
                return offset + index;
            }
            ++index;
        }
    }

    // hopefully nothing breaks, but if it does, this notifies us
    return -1;
}

PreflopEvaluation evaluatePreflop(const std::vector<Cards::Card>& holeCards) {
    if (holeCards.size() != 2) {
        throw Core::InsufficientCards(holeCards.size(), 2);
    }
    const auto& c1 = holeCards[0];
    const auto& c2 = holeCards[1];

    // two exactly matching cards cannot occur inside one deck of cards
    if (c1 == c2) {
        throw Core::DuplicateCard(Cards::toText(c1));
    }

    int hi = Cards::rankValue(c1.rank);
    int lo = Cards::rankValue(c2.rank);

    // put the bigger rank first
    if (lo > hi) {
        std::swap(hi, lo);
    }

    PreflopEvaluation e;
    e.hiRank = static_cast<uint8_t>(hi);
    e.loRank = static_cast<uint8_t>(lo);
    e.suited = (c1.suit == c2.suit);
    e.holeCards = holeCards;
    e.gridIndex = handToIndex(hi, lo, e.suited);

    auto hiRank = static_cast<Cards::Rank>(hi);
    auto loRank = static_cast<Cards::Rank>(lo);
    std::string hiSym = hi == 10 ? "T" : Cards::rankSymbol(hiRank);
    std::string loSym = lo == 10 ? "T" : Cards::rankSymbol(loRank);

    if (e.isPair()) {
        e.score = PAIR_BASE + hi * 100;
        e.handClass = hiSym + loSym;
        e.description = "Pocket " + Cards::rankPlural(hiRank);
        return e;
    }

    e.score = UNPAIRED_BASE + hi * 15 + lo + (e.suited ? SUITED_BONUS : 0);
    e.handClass = hiSym + loSym + (e.suited ? "s" : "o");
    e.description = hiSym + loSym + (e.suited ? " suited" : " offsuit");
    return e;
}

}
