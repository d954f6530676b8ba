#include "deck.hpp"

namespace Cards {

namespace {

std::vector<Card> cardsFromMask(uint64_t mask) {
    std::vector<Card> cards;
    cards.reserve(__builtin_popcountll(mask));
    // walk set bits low to high, same trick the evaluator uses for villain combos
    while (mask) {
        int idx = __builtin_ctzll(mask);
        mask &= (mask - 1);
        cards.push_back(Card::fromIndex(idx));
    }
    return cards;
}

}

Deck::Deck() {
    reset();
}

void Deck::reset() {
    knownMask_ = 0;
    knownCount_ = 0;
}

void Deck::markKnown(const Card& card) {
    uint64_t bit = 1ULL << card.index();
    if (knownMask_ & bit) return;
    knownMask_ |= bit;
    ++knownCount_;
}

void Deck::markKnown(const std::vector<Card>& cards) {
    for (const auto& c : cards) {
        markKnown(c);
    }
}

bool Deck::isKnown(const Card& card) const {
    return (knownMask_ >> card.index()) & 1ULL;
}

std::vector<Card> Deck::unknownCards() const {
    return cardsFromMask(unknownMask());
}

std::vector<Card> Deck::knownCards() const {
    return cardsFromMask(knownMask_);
}

}
