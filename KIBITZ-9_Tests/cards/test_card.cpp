#include <gtest/gtest.h>
#include "cards/card.hpp"
#include "core/errors.hpp"
#include <unordered_set>

using namespace Cards;

class CardTest : public ::testing::Test {};

TEST_F(CardTest, ParsesLetterAndGlyphSuits) {
    EXPECT_EQ(parseCard("Kh"), (Card{Rank::King, Suit::Hearts}));
    EXPECT_EQ(parseCard("Td"), (Card{Rank::Ten, Suit::Diamonds}));
    EXPECT_EQ(parseCard("10♦"), (Card{Rank::Ten, Suit::Diamonds}));
    EXPECT_EQ(parseCard("A♠"), (Card{Rank::Ace, Suit::Spades}));
    EXPECT_EQ(parseCard("2♣"), (Card{Rank::Two, Suit::Clubs}));
    EXPECT_EQ(parseCard("q♥"), (Card{Rank::Queen, Suit::Hearts}));
}

TEST_F(CardTest, ParseIsCaseInsensitiveAndTrims) {
    EXPECT_EQ(parseCard(" 9S "), (Card{Rank::Nine, Suit::Spades}));
    EXPECT_EQ(parseCard("td"), (Card{Rank::Ten, Suit::Diamonds}));
    EXPECT_EQ(parseCard("aC"), (Card{Rank::Ace, Suit::Clubs}));
}

TEST_F(CardTest, RejectsGarbage) {
    EXPECT_THROW(parseCard(""), Core::InvalidCardFormat);
    EXPECT_THROW(parseCard("1s"), Core::InvalidCardFormat);
    EXPECT_THROW(parseCard("Kx"), Core::InvalidCardFormat);
    EXPECT_THROW(parseCard("11h"), Core::InvalidCardFormat);
    EXPECT_THROW(parseCard("♠"), Core::InvalidCardFormat);

    EXPECT_FALSE(tryParseCard("Unknown").has_value());
    EXPECT_FALSE(tryParseCard("   ").has_value());
}

TEST_F(CardTest, InvalidCardFormatKeepsText) {
    try {
        parseCard("Zz");
        FAIL() << "expected InvalidCardFormat";
    } catch (const Core::InvalidCardFormat& e) {
        EXPECT_EQ(e.text(), "Zz");
    }
}

TEST_F(CardTest, AllCardsRoundTripThroughText) {
    std::vector<Card> deck = fullDeck();
    ASSERT_EQ(deck.size(), 52u);
    for (const auto& c : deck) {
        EXPECT_EQ(parseCard(toText(c)), c) << toText(c);
        EXPECT_EQ(parseCard(toAscii(c)), c) << toAscii(c);
    }
}

TEST_F(CardTest, CanonicalText) {
    EXPECT_EQ(toText(Card{Rank::Ten, Suit::Diamonds}), "10♦");
    EXPECT_EQ(toText(Card{Rank::Ace, Suit::Spades}), "A♠");
    EXPECT_EQ(toAscii(Card{Rank::Ten, Suit::Diamonds}), "Td");
    EXPECT_EQ(toAscii(Card{Rank::Seven, Suit::Clubs}), "7c");
}

TEST_F(CardTest, IndexIsDenseAndUnique) {
    std::unordered_set<Card> seen;
    for (int i = 0; i < DECK_SIZE; ++i) {
        Card c = Card::fromIndex(i);
        EXPECT_EQ(c.index(), i);
        seen.insert(c);
    }
    EXPECT_EQ(seen.size(), 52u);

    EXPECT_EQ((Card{Rank::Two, Suit::Clubs}).index(), 0);
    EXPECT_EQ((Card{Rank::Ace, Suit::Spades}).index(), 51);
}

TEST_F(CardTest, RankNames) {
    EXPECT_EQ(rankName(Rank::Ace), "Ace");
    EXPECT_EQ(rankPlural(Rank::Six), "Sixes");
    EXPECT_EQ(rankPlural(Rank::King), "Kings");
    EXPECT_EQ(rankSymbol(Rank::Ten), "10");
}
