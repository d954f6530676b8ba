#include <gtest/gtest.h>
#include "equity/equity_engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <random>

using namespace Equity;
using Cards::parseCard;

class EquityEngineTest : public ::testing::Test {
protected:
    static constexpr uint32_t SEED = 1234;

    static std::vector<Cards::Card> cards(std::initializer_list<const char*> texts) {
        std::vector<Cards::Card> out;
        for (const char* t : texts) out.push_back(parseCard(t));
        return out;
    }

    static void expectBounds(const EquityResult& r) {
        EXPECT_GE(r.winPercentage, 0.0);
        EXPECT_LE(r.winPercentage, 100.0);
        EXPECT_GE(r.tiePercentage, 0.0);
        EXPECT_LE(r.tiePercentage, 100.0);
        EXPECT_GE(r.losePercentage, 0.0);
        EXPECT_LE(r.losePercentage, 100.0);
        EXPECT_NEAR(r.winPercentage + r.tiePercentage + r.losePercentage, 100.0, 1e-6);
    }
};

TEST_F(EquityEngineTest, RemainingDeckSize) {
    EXPECT_EQ(remainingDeckSize(0, 9), 34);
    EXPECT_EQ(remainingDeckSize(5, 3), 41);
    EXPECT_EQ(remainingDeckSize(5, 30), 0);
}

TEST_F(EquityEngineTest, PreRiverEstimate) {
    EquityResult headsUp = estimatePreRiver(0, 1);
    EXPECT_FALSE(headsUp.simulated);
    EXPECT_DOUBLE_EQ(headsUp.winPercentage, 45.0);
    EXPECT_DOUBLE_EQ(headsUp.tiePercentage, 3.0);
    EXPECT_DOUBLE_EQ(headsUp.losePercentage, 52.0);

    EXPECT_NEAR(estimatePreRiver(3, 1).winPercentage, 49.5, 1e-9);
    EXPECT_DOUBLE_EQ(estimatePreRiver(0, 2).winPercentage, 30.0);
    EXPECT_DOUBLE_EQ(estimatePreRiver(0, 4).winPercentage, 20.0);
    EXPECT_DOUBLE_EQ(estimatePreRiver(0, 6).winPercentage, 15.0);
    EXPECT_DOUBLE_EQ(estimatePreRiver(0, 8).winPercentage, 10.0);

    // zero opponents is treated as heads-up
    EXPECT_EQ(estimatePreRiver(0, 0).opponents, 1);

    for (int n = 1; n <= 8; ++n) {
        expectBounds(estimatePreRiver(4, n));
    }
}

TEST_F(EquityEngineTest, CombineTallyAppliesIndependence) {
    SampleTally tally;
    tally.wins = 150;
    tally.ties = 10;
    tally.losses = 40;

    EquityResult one = combineTally(tally, 1);
    EXPECT_TRUE(one.simulated);
    EXPECT_NEAR(one.winPercentage, 75.0, 1e-9);
    EXPECT_NEAR(one.tiePercentage, 5.0, 1e-9);
    EXPECT_NEAR(one.losePercentage, 20.0, 1e-9);
    EXPECT_NEAR(one.singleOpponentWinRate, 75.0, 1e-9);

    EquityResult three = combineTally(tally, 3);
    EXPECT_NEAR(three.winPercentage, 0.75 * 0.75 * 0.75 * 100.0, 1e-9);
    EXPECT_NEAR(three.tiePercentage, 2.5, 1e-9);
    expectBounds(three);
}

TEST_F(EquityEngineTest, WinNeverGrowsWithMoreOpponents) {
    SampleTally tally;
    tally.wins = 120;
    tally.ties = 30;
    tally.losses = 50;

    double previous = 101.0;
    for (int n = 1; n <= 8; ++n) {
        EquityResult r = combineTally(tally, n);
        EXPECT_LE(r.winPercentage, previous);
        previous = r.winPercentage;
        expectBounds(r);
    }
}

TEST_F(EquityEngineTest, EmptyTallyFallsBack) {
    EquityResult r = combineTally(SampleTally{}, 3);
    EXPECT_FALSE(r.simulated);
    EXPECT_DOUBLE_EQ(r.winPercentage, 25.0);
    EXPECT_DOUBLE_EQ(r.tiePercentage, 5.0);
    expectBounds(r);
}

TEST_F(EquityEngineTest, SkippedSamplesNotCounted) {
    SampleTally tally;
    tally.wins = 30;
    tally.ties = 0;
    tally.losses = 10;
    tally.skipped = 5;

    EquityResult r = combineTally(tally, 1);
    EXPECT_TRUE(r.simulated);
    EXPECT_EQ(r.samples, 40);
    EXPECT_EQ(r.skippedSamples, 5);
    EXPECT_NEAR(r.winPercentage, 75.0, 1e-9);

    // everything skipped is the same as nothing sampled
    SampleTally allSkipped;
    allSkipped.skipped = 12;
    EquityResult none = combineTally(allSkipped, 2);
    EXPECT_FALSE(none.simulated);
    EXPECT_EQ(none.skippedSamples, 12);
    expectBounds(none);
}

TEST_F(EquityEngineTest, NormalizeClamps) {
    EquityResult r;
    r.winPercentage = 120.0;
    r.tiePercentage = 10.0;
    normalize(r);
    EXPECT_DOUBLE_EQ(r.winPercentage, 100.0);
    EXPECT_DOUBLE_EQ(r.tiePercentage, 0.0);
    EXPECT_DOUBLE_EQ(r.losePercentage, 0.0);

    EquityResult neg;
    neg.winPercentage = -5.0;
    neg.tiePercentage = 3.0;
    normalize(neg);
    EXPECT_DOUBLE_EQ(neg.winPercentage, 0.0);
    EXPECT_DOUBLE_EQ(neg.losePercentage, 97.0);
}

TEST_F(EquityEngineTest, RiverSamplesCapped) {
    EquityEngine engine(EquitySettings{}, SEED);
    SampleTally tally = engine.tallyRiver(cards({"Ah", "Kd"}), cards({"Qs", "Jc", "7h", "4d", "2s"}));
    EXPECT_EQ(tally.total(), 200);
    EXPECT_EQ(tally.skipped, 0);

    EquitySettings small;
    small.maxRiverSamples = 25;
    EquityEngine smallEngine(small, SEED);
    EXPECT_EQ(smallEngine.settings().maxRiverSamples, 25);
    EXPECT_EQ(smallEngine.tallyRiver(cards({"Ah", "Kd"}), cards({"Qs", "Jc", "7h", "4d", "2s"})).total(), 25);
}

TEST_F(EquityEngineTest, NutsNeverLose) {
    EquityEngine engine(EquitySettings{}, SEED);
    auto hole = cards({"Ah", "Kh"});
    auto board = cards({"Qh", "Jh", "Th", "2c", "3d"});
    for (int n = 1; n <= 8; ++n) {
        EquityResult r = engine.riverEquity(hole, board, n);
        EXPECT_DOUBLE_EQ(r.winPercentage, 100.0);
        EXPECT_DOUBLE_EQ(r.losePercentage, 0.0);
    }
}

TEST_F(EquityEngineTest, BoardPlaysIsAllTies) {
    // royal flush on the board, everybody chops
    EquityEngine engine(EquitySettings{}, SEED);
    EquityResult r = engine.riverEquity(cards({"2c", "3d"}), cards({"Ah", "Kh", "Qh", "Jh", "Th"}), 1);
    EXPECT_DOUBLE_EQ(r.winPercentage, 0.0);
    EXPECT_DOUBLE_EQ(r.tiePercentage, 100.0);

    EquityResult multi = engine.riverEquity(cards({"2c", "3d"}), cards({"Ah", "Kh", "Qh", "Jh", "Th"}), 3);
    EXPECT_DOUBLE_EQ(multi.tiePercentage, 50.0);
    expectBounds(multi);
}

TEST_F(EquityEngineTest, SameSeedSameSamples) {
    auto hole = cards({"9s", "9d"});
    auto board = cards({"Ks", "Td", "6c", "4h", "2h"});

    EquityEngine a(EquitySettings{}, SEED);
    EquityEngine b(EquitySettings{}, SEED);
    SampleTally ta = a.tallyRiver(hole, board);
    SampleTally tb = b.tallyRiver(hole, board);
    EXPECT_EQ(ta.wins, tb.wins);
    EXPECT_EQ(ta.ties, tb.ties);
    EXPECT_EQ(ta.losses, tb.losses);
}

TEST_F(EquityEngineTest, RiverEquityMonotoneInOpponents) {
    auto hole = cards({"9s", "9d"});
    auto board = cards({"Ks", "Td", "6c", "4h", "2h"});

    double previous = 101.0;
    for (int n = 1; n <= 8; ++n) {
        // fresh engine per count so every n sees the same sample set
        EquityEngine engine(EquitySettings{}, SEED);
        EquityResult r = engine.riverEquity(hole, board, n);
        EXPECT_TRUE(r.simulated);
        EXPECT_LE(r.winPercentage, previous);
        previous = r.winPercentage;
        expectBounds(r);
    }
}

TEST_F(EquityEngineTest, BoundsOnRandomRivers) {
    std::mt19937 rng(99);
    std::vector<Cards::Card> deck = Cards::fullDeck();
    EquitySettings settings;
    settings.maxRiverSamples = 40;
    EquityEngine engine(settings, SEED);

    for (int i = 0; i < 30; ++i) {
        std::shuffle(deck.begin(), deck.end(), rng);
        std::vector<Cards::Card> hole(deck.begin(), deck.begin() + 2);
        std::vector<Cards::Card> board(deck.begin() + 2, deck.begin() + 7);
        expectBounds(engine.riverEquity(hole, board, 1 + i % 8));
    }
}

TEST_F(EquityEngineTest, BadHeroHandThrows) {
    EquityEngine engine(EquitySettings{}, SEED);
    EXPECT_THROW(engine.tallyRiver(cards({"Ah", "Ah"}), cards({"Qs", "Jc", "7h", "4d", "2s"})),
                 Core::DuplicateCard);
}

TEST_F(EquityEngineTest, EquityDispatchesOnBoardSize) {
    EquityEngine engine(EquitySettings{}, SEED);
    auto hole = cards({"Ah", "Kd"});
    EXPECT_FALSE(engine.equity(hole, cards({"Qs", "Jc", "7h"}), 2).simulated);
    EXPECT_TRUE(engine.equity(hole, cards({"Qs", "Jc", "7h", "4d", "2s"}), 2).simulated);
}

TEST_F(EquityEngineTest, OpponentRange) {
    EquityEngine engine(EquitySettings{}, SEED);
    OpponentRange range = engine.sampleOpponentRange(cards({"Ah", "Kd"}), cards({"Qs", "Jc", "7h"}));
    EXPECT_EQ(range.sampleSize, 100);

    int total = 0;
    for (const auto& [category, count] : range.categoryCounts) total += count;
    EXPECT_EQ(total, 100);
    EXPECT_GT(range.averageScore, 0.0);

    EXPECT_EQ(engine.sampleOpponentRange(cards({"Ah", "Kd"}), {}).sampleSize, 0);
}

TEST_F(EquityEngineTest, AnalyzeBundlesEverything) {
    EquityEngine engine(EquitySettings{}, SEED);
    ProbabilityAnalysis flop = engine.analyze(cards({"Ah", "Kh"}), cards({"7h", "2h", "9c"}), 3, 6);
    EXPECT_EQ(flop.activeOpponents, 3);
    EXPECT_EQ(flop.remainingDeckSize, 52 - 3 - 12);
    EXPECT_EQ(flop.draws.flushOuts, 9);
    // two hearts on board: hero's draw, not a board flush draw
    EXPECT_FALSE(flop.texture.flushDrawPossible);
    EXPECT_TRUE(flop.opponentRange.has_value());
    expectBounds(flop.equity);

    ProbabilityAnalysis pre = engine.analyze(cards({"Ah", "Kh"}), {}, 0, 9);
    EXPECT_EQ(pre.activeOpponents, 1);
    EXPECT_FALSE(pre.opponentRange.has_value());
}

TEST_F(EquityEngineTest, AnalyzeMonotoneFlop) {
    EquityEngine engine(EquitySettings{}, SEED);
    ProbabilityAnalysis flop = engine.analyze(cards({"As", "Kd"}), cards({"7h", "2h", "9h"}), 2, 6);
    EXPECT_TRUE(flop.texture.flushDrawPossible);
    EXPECT_EQ(flop.draws.flushOuts, 0);
    expectBounds(flop.equity);
}
