#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Cards {

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;
constexpr int DECK_SIZE = 52;

// numeric values match the usual poker point values, Ace high
enum class Rank : uint8_t {
    Two = 2, Three, Four, Five, Six, Seven, Eight, Nine, Ten,
    Jack, Queen, King, Ace
};

// order only matters for indexing, suits never outrank each other
enum class Suit : uint8_t {
    Clubs = 0,
    Diamonds = 1,
    Hearts = 2,
    Spades = 3
};

inline int rankValue(Rank r) { return static_cast<int>(r); }

struct Card {
    Rank rank;
    Suit suit;

    // dense index 0..51: rank-major, same layout as the evaluator tables use
    int index() const {
        return (rankValue(rank) - 2) * NUM_SUITS + static_cast<int>(suit);
    }

    static Card fromIndex(int idx) {
        return Card{ static_cast<Rank>(idx / NUM_SUITS + 2), static_cast<Suit>(idx % NUM_SUITS) };
    }

    bool operator==(const Card& other) const {
        return rank == other.rank && suit == other.suit;
    }
    bool operator!=(const Card& other) const { return !(*this == other); }

    // only for containers, not a poker ordering
    bool operator<(const Card& other) const { return index() < other.index(); }
};

// "A", "K", ..., "10", ..., "2"
std::string rankSymbol(Rank r);
// "♠", "♥", "♦", "♣"
std::string suitSymbol(Suit s);
// "Ace", "Six", ...
std::string rankName(Rank r);
// "Aces", "Sixes", ...
std::string rankPlural(Rank r);

// accepts "A♠", "10♦", "Kh", "td", " 9S " - throws Core::InvalidCardFormat on garbage
Card parseCard(const std::string& text);

// same as parseCard but returns nullopt instead of throwing
std::optional<Card> tryParseCard(const std::string& text);

// canonical text, exact inverse of parseCard ("10♦")
std::string toText(const Card& card);

// plain ASCII form ("Td")
std::string toAscii(const Card& card);

std::string toText(const std::vector<Card>& cards);

// the 52 cards in index order
std::vector<Card> fullDeck();

}

namespace std {
template <>
struct hash<Cards::Card> {
    size_t operator()(const Cards::Card& c) const noexcept {
        return static_cast<size_t>(c.index());
    }
};
}
