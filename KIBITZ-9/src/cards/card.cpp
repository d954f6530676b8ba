#include "card.hpp"
#include "card_utils.hpp"
#include "core/errors.hpp"
#include <array>
#include <cctype>

namespace Cards {

namespace {

const std::array<const char*, NUM_RANKS> RANK_NAMES = {
    "Two", "Three", "Four", "Five", "Six", "Seven", "Eight",
    "Nine", "Ten", "Jack", "Queen", "King", "Ace"
};

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// split the text into rank token + suit, glyph suits first since they are multi-byte
bool splitSuit(const std::string& text, std::string& rankToken, int& suitIndex) {
    const char* const* glyphSets[NUM_SUITS] = {
        CardUtils::CLUB_GLYPHS, CardUtils::DIAMOND_GLYPHS,
        CardUtils::HEART_GLYPHS, CardUtils::SPADE_GLYPHS
    };
    for (int s = 0; s < NUM_SUITS; ++s) {
        for (int variant = 0; variant < 2; ++variant) {
            std::string glyph = glyphSets[s][variant];
            if (endsWith(text, glyph)) {
                rankToken = text.substr(0, text.size() - glyph.size());
                suitIndex = s;
                return true;
            }
        }
    }

    if (text.size() < 2) return false;

    suitIndex = CardUtils::getSuitIndex(text.back());
    if (suitIndex == -1) return false;
    rankToken = text.substr(0, text.size() - 1);
    return true;
}

}

std::string rankSymbol(Rank r) {
    switch (r) {
        case Rank::Ace: return "A";
        case Rank::King: return "K";
        case Rank::Queen: return "Q";
        case Rank::Jack: return "J";
        default: return std::to_string(rankValue(r));
    }
}

std::string suitSymbol(Suit s) {
    switch (s) {
        case Suit::Clubs: return CardUtils::CLUB_GLYPHS[0];
        case Suit::Diamonds: return CardUtils::DIAMOND_GLYPHS[0];
        case Suit::Hearts: return CardUtils::HEART_GLYPHS[0];
        case Suit::Spades: return CardUtils::SPADE_GLYPHS[0];
    }
    return "?";
}

std::string rankName(Rank r) {
    return RANK_NAMES[rankValue(r) - 2];
}

std::string rankPlural(Rank r) {
    if (r == Rank::Six) return "Sixes";
    return rankName(r) + "s";
}

std::optional<Card> tryParseCard(const std::string& text) {
    std::string cleaned = trim(text);
    if (cleaned.empty()) return std::nullopt;

    std::string rankToken;
    int suitIndex = -1;
    if (!splitSuit(cleaned, rankToken, suitIndex)) return std::nullopt;

    int value = CardUtils::getRankValue(rankToken);
    if (value == 0) return std::nullopt;

    return Card{ static_cast<Rank>(value), static_cast<Suit>(suitIndex) };
}

Card parseCard(const std::string& text) {
    auto card = tryParseCard(text);
    if (!card) {
        throw Core::InvalidCardFormat(text);
    }
    return *card;
}

std::string toText(const Card& card) {
    return rankSymbol(card.rank) + suitSymbol(card.suit);
}

std::string toAscii(const Card& card) {
    static const char* ranks = "23456789TJQKA";
    static const char* suits = "cdhs";
    std::string out;
    out += ranks[rankValue(card.rank) - 2];
    out += suits[static_cast<int>(card.suit)];
    return out;
}

std::string toText(const std::vector<Card>& cards) {
    std::string out;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i) out += ' ';
        out += toText(cards[i]);
    }
    return out;
}

std::vector<Card> fullDeck() {
    std::vector<Card> deck;
    deck.reserve(DECK_SIZE);
    for (int i = 0; i < DECK_SIZE; ++i) {
        deck.push_back(Card::fromIndex(i));
    }
    return deck;
}

}
