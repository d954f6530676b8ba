#include "evaluator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <utility>

namespace Eval {

using Cards::Card;
using Cards::Rank;

namespace {

// rank with how many times it shows up in the hand
struct RankGroup {
    int count;
    int rank;
};

std::string plural(int rank) {
    return Cards::rankPlural(static_cast<Rank>(rank));
}

std::string single(int rank) {
    return Cards::rankName(static_cast<Rank>(rank));
}

// 1. count every rank, then order the groups by size first and rank second
// eg. 'K K 9 9 9' -> (3, 9), (2, 13)
std::vector<RankGroup> groupRanks(const std::array<Card, 5>& cards) {
    int counts[RANK_BASE] = {0};
    for (const auto& c : cards) {
        counts[Cards::rankValue(c.rank)]++;
    }

    std::vector<RankGroup> groups;
    for (int r = 14; r >= 2; --r) {
        if (counts[r]) groups.push_back({counts[r], r});
    }
    std::stable_sort(groups.begin(), groups.end(), [](const RankGroup& a, const RankGroup& b) {
        return a.count > b.count;
    });
    return groups;
}

// order the winning five the way they read: grouped cards first, then kickers
// a wheel reads 5-4-3-2-A
std::vector<Card> orderBestFive(const std::array<Card, 5>& cards,
                                const std::vector<RankGroup>& groups,
                                bool wheel) {
    std::vector<Card> ordered;
    ordered.reserve(5);

    if (wheel) {
        std::vector<Card> sorted(cards.begin(), cards.end());
        std::sort(sorted.begin(), sorted.end(), [](const Card& a, const Card& b) {
            int ra = a.rank == Rank::Ace ? 1 : Cards::rankValue(a.rank);
            int rb = b.rank == Rank::Ace ? 1 : Cards::rankValue(b.rank);
            return ra > rb;
        });
        return sorted;
    }

    for (const auto& g : groups) {
        for (const auto& c : cards) {
            if (Cards::rankValue(c.rank) == g.rank) ordered.push_back(c);
        }
    }
    return ordered;
}

HandEvaluation makeEvaluation(HandCategory category,
                              std::vector<int> ranks,
                              std::string description,
                              std::vector<Card> bestFive) {
    HandEvaluation e;
    e.category = category;
    e.score = computeScore(category, ranks);
    e.tiebreak.reserve(ranks.size() + 1);
    e.tiebreak.push_back(categoryIndex(category));
    e.tiebreak.insert(e.tiebreak.end(), ranks.begin(), ranks.end());
    e.name = categoryName(category);
    e.description = std::move(description);
    e.bestFive = std::move(bestFive);
    return e;
}

}

std::string categoryName(HandCategory c) {
    switch (c) {
        case HandCategory::HighCard: return "High Card";
        case HandCategory::OnePair: return "One Pair";
        case HandCategory::TwoPair: return "Two Pair";
        case HandCategory::ThreeOfAKind: return "Three of a Kind";
        case HandCategory::Straight: return "Straight";
        case HandCategory::Flush: return "Flush";
        case HandCategory::FullHouse: return "Full House";
        case HandCategory::FourOfAKind: return "Four of a Kind";
        case HandCategory::StraightFlush: return "Straight Flush";
        case HandCategory::RoyalFlush: return "Royal Flush";
    }
    return "?";
}

int computeScore(HandCategory category, const std::vector<int>& significantRanks) {
    // category digit on top, significant ranks as base-15 digits below it
    int score = categoryIndex(category) * CATEGORY_WEIGHT;
    int weight = CATEGORY_WEIGHT / RANK_BASE;
    for (size_t i = 0; i < significantRanks.size() && i < 5; ++i) {
        score += significantRanks[i] * weight;
        weight /= RANK_BASE;
    }
    return score;
}

int findStraightHigh(int mask) {
    // finds any sequence of 5 consecutive ranks
    int tmp = mask & (mask << 1) & (mask << 2) & (mask << 3) & (mask << 4);

    if (tmp != 0) {
        // index of the highest set bit is the top rank of the straight
        // eg. case 'A-K-Q-J-T': returns 12
        return 31 - __builtin_clz(tmp);
    }

    // special case A-2-3-4-5 ("wheel"): returns 3 (rank of 5)
    if ((mask & 0x100F) == 0x100F) return 3;

    return -1;
}

HandEvaluation evaluateFive(const std::array<Card, 5>& cards) {
    int rankMask = 0;
    bool flush = true;
    for (size_t i = 0; i < cards.size(); ++i) {
        rankMask |= 1 << (Cards::rankValue(cards[i].rank) - 2);
        if (cards[i].suit != cards[0].suit) flush = false;
    }

    auto groups = groupRanks(cards);

    // a straight needs five distinct ranks
    int straightTop = groups.size() == 5 ? findStraightHigh(rankMask) : -1;
    bool straight = straightTop != -1;
    bool wheel = straightTop == 3;
    int straightHigh = straight ? straightTop + 2 : 0;

    auto bestFive = orderBestFive(cards, groups, wheel);

    std::vector<int> ranks;
    for (const auto& g : groups) ranks.push_back(g.rank);

    if (straight && flush) {
        // royal iff the run tops out at Ace with King next
        if (straightHigh == 14) {
            return makeEvaluation(HandCategory::RoyalFlush, {14},
                                  "Royal Flush in " + Cards::suitSymbol(cards[0].suit),
                                  bestFive);
        }
        return makeEvaluation(HandCategory::StraightFlush, {straightHigh},
                              "Straight Flush, " + single(straightHigh) + " high",
                              bestFive);
    }

    if (groups[0].count == 4) {
        return makeEvaluation(HandCategory::FourOfAKind, ranks,
                              "Four " + plural(groups[0].rank), bestFive);
    }

    if (groups[0].count == 3 && groups[1].count == 2) {
        return makeEvaluation(HandCategory::FullHouse, ranks,
                              "Full House, " + plural(groups[0].rank) + " over " + plural(groups[1].rank),
                              bestFive);
    }

    if (flush) {
        return makeEvaluation(HandCategory::Flush, ranks,
                              "Flush, " + single(ranks[0]) + " high", bestFive);
    }

    if (straight) {
        return makeEvaluation(HandCategory::Straight, {straightHigh},
                              "Straight, " + single(straightHigh) + " high", bestFive);
    }

    if (groups[0].count == 3) {
        return makeEvaluation(HandCategory::ThreeOfAKind, ranks,
                              "Three " + plural(groups[0].rank), bestFive);
    }

    if (groups[0].count == 2 && groups[1].count == 2) {
        return makeEvaluation(HandCategory::TwoPair, ranks,
                              "Two Pair, " + plural(groups[0].rank) + " and " + plural(groups[1].rank),
                              bestFive);
    }

    if (groups[0].count == 2) {
        return makeEvaluation(HandCategory::OnePair, ranks,
                              "Pair of " + plural(groups[0].rank), bestFive);
    }

    return makeEvaluation(HandCategory::HighCard, ranks,
                          single(ranks[0]) + " high", bestFive);
}

HandEvaluation evaluate(const std::vector<Card>& cards) {
    if (cards.size() < 5) {
        throw Core::InsufficientCards(cards.size(), 5);
    }

    uint64_t seen = 0;
    for (const auto& c : cards) {
        uint64_t bit = 1ULL << c.index();
        if (seen & bit) throw Core::DuplicateCard(Cards::toText(c));
        seen |= bit;
    }

    std::array<Card, 5> hand = { cards[0], cards[1], cards[2], cards[3], cards[4] };
    if (cards.size() == 5) {
        return evaluateFive(hand);
    }

    // walk every 5-card subset with a selector mask, keep the strongest
    std::vector<int> selector(cards.size(), 0);
    std::fill(selector.begin(), selector.begin() + 5, 1);

    bool first = true;
    HandEvaluation best;
    do {
        size_t k = 0;
        for (size_t i = 0; i < cards.size(); ++i) {
            if (selector[i]) hand[k++] = cards[i];
        }
        HandEvaluation e = evaluateFive(hand);
        if (first || e.score > best.score) {
            best = std::move(e);
            first = false;
        }
    } while (std::prev_permutation(selector.begin(), selector.end()));

    return best;
}

int compare(const HandEvaluation& a, const HandEvaluation& b) {
    if (a.score > b.score) return 1;
    if (a.score < b.score) return -1;
    return 0;
}

}
