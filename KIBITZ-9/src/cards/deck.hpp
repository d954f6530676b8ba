#pragma once

#include "card.hpp"
#include <cstdint>
#include <vector>

namespace Cards {

/*
 Known/unknown partition of the 52-card universe for one observer.
 Known cards are hero hole cards, community cards and anything revealed.
 Both sets are kept as 52-bit masks so the counts stay O(1):
 known | unknown == full deck, known & unknown == 0
*/
class Deck {
public:
    static constexpr uint64_t FULL_MASK = (1ULL << DECK_SIZE) - 1;

    Deck();

    // back to all 52 unknown, called at the start of every pass
    void reset();

    // moves the card into the known set, already known cards are ignored
    void markKnown(const Card& card);
    void markKnown(const std::vector<Card>& cards);

    bool isKnown(const Card& card) const;

    int knownCount() const { return knownCount_; }
    int unknownCount() const { return DECK_SIZE - knownCount_; }

    uint64_t knownMask() const { return knownMask_; }
    uint64_t unknownMask() const { return (~knownMask_) & FULL_MASK; }

    // unknown cards in index order
    std::vector<Card> unknownCards() const;
    std::vector<Card> knownCards() const;

private:
    uint64_t knownMask_ = 0;
    int knownCount_ = 0;
};

}
