#include <gtest/gtest.h>
#include "ledger/tournament_ledger.hpp"

using namespace Ledger;

class TournamentLedgerTest : public ::testing::Test {
protected:
    TournamentState state;
    Timestamp t0 = Clock::now();

    static SeatText seat(const std::string& name, const std::string& stack) {
        SeatText text;
        text.name = name;
        text.stack = stack;
        return text;
    }
};

TEST_F(TournamentLedgerTest, SeatNames) {
    EXPECT_EQ(seatName(SeatId::Hero), "Hero");
    EXPECT_EQ(seatName(SeatId::Position3), "Position_3");
    EXPECT_EQ(parseSeatName("Position_8"), SeatId::Position8);
    EXPECT_FALSE(parseSeatName("Position_9").has_value());
    EXPECT_EQ(allSeats().size(), 9u);
}

TEST_F(TournamentLedgerTest, StartsEmpty) {
    for (const auto& r : state.seats) {
        EXPECT_EQ(r.name, EMPTY_SEAT);
        EXPECT_FALSE(r.isActive());
    }
    EXPECT_EQ(activePlayerCount(state), 0);
}

TEST_F(TournamentLedgerTest, CandidateConfidence) {
    SeatRecord full = buildCandidate(SeatId::Position1, std::string("Bob"), std::string("1,500"), 0.0, t0);
    EXPECT_DOUBLE_EQ(full.confidence, 1.0);
    EXPECT_EQ(full.name, "Bob");
    EXPECT_EQ(full.chips, 1500);

    SeatRecord nameOnly = buildCandidate(SeatId::Position1, std::string("Bob"), std::nullopt, 0.0, t0);
    EXPECT_DOUBLE_EQ(nameOnly.confidence, 0.3);
    EXPECT_FALSE(nameOnly.chips.has_value());

    SeatRecord stackOnly = buildCandidate(SeatId::Position1, std::nullopt, std::string("900"), 0.0, t0);
    EXPECT_EQ(stackOnly.name, UNKNOWN_NAME);
    EXPECT_DOUBLE_EQ(stackOnly.confidence, 0.7);
}

TEST_F(TournamentLedgerTest, BigBlindSizeDerivedFromBlinds) {
    SeatRecord r = buildCandidate(SeatId::Hero, std::string("Hero"), std::string("3,000"), 200.0, t0);
    ASSERT_TRUE(r.bbSize.has_value());
    EXPECT_DOUBLE_EQ(*r.bbSize, 15.0);

    SeatRecord shown = buildCandidate(SeatId::Hero, std::string("Hero"), std::string("3,000 (12 BB)"), 200.0, t0);
    EXPECT_DOUBLE_EQ(shown.bbSize.value_or(0.0), 12.0);
}

TEST_F(TournamentLedgerTest, ConfidentCandidatesApplied) {
    SeatReadings readings;
    readings[SeatId::Hero] = seat("HeroPlayer", "2,000");
    readings[SeatId::Position1] = seat("Bob", "1,500");
    readings[SeatId::Position2] = seat("Al", "");   // name too short, no stack

    LedgerUpdate u = update(state, readings, t0);
    EXPECT_EQ(u.applied.size(), 2u);
    EXPECT_TRUE(u.eliminations.empty());
    EXPECT_EQ(state.totalChips, 3500);
    EXPECT_EQ(state.seat(SeatId::Position1).name, "Bob");
    EXPECT_EQ(state.seat(SeatId::Position2).name, EMPTY_SEAT);
    EXPECT_TRUE(state.startTime.has_value());
}

TEST_F(TournamentLedgerTest, BobEliminatedWhenSeatEmpties) {
    SeatReadings first;
    first[SeatId::Hero] = seat("HeroPlayer", "2,000");
    first[SeatId::Position1] = seat("Bob", "1,500");
    update(state, first, t0);

    SeatReadings second;
    second[SeatId::Hero] = seat("HeroPlayer", "3,500");
    second[SeatId::Position1] = seat("", "");

    LedgerUpdate u = update(state, second, t0 + std::chrono::seconds(30));
    ASSERT_EQ(u.eliminations.size(), 1u);
    EXPECT_EQ(u.eliminations[0].seat, SeatId::Position1);
    EXPECT_EQ(u.eliminations[0].playerName, "Bob");
    EXPECT_EQ(u.eliminations[0].lastStack, 1500);

    EXPECT_EQ(state.seat(SeatId::Position1).name, EMPTY_SEAT);
    EXPECT_EQ(state.eliminations.size(), 1u);
    EXPECT_EQ(state.totalChips, 3500);
    EXPECT_EQ(activePlayerCount(state), 1);
}

TEST_F(TournamentLedgerTest, ZeroStackEliminates) {
    SeatReadings first;
    first[SeatId::Position4] = seat("Carol", "800");
    update(state, first, t0);

    SeatReadings second;
    second[SeatId::Position4] = seat("Carol", "0");
    LedgerUpdate u = update(state, second, t0);
    ASSERT_EQ(u.eliminations.size(), 1u);
    EXPECT_EQ(u.eliminations[0].lastStack, 800);
    // zero stack earns no confidence, the seat stays empty
    EXPECT_EQ(state.seat(SeatId::Position4).name, EMPTY_SEAT);
}

TEST_F(TournamentLedgerTest, UnreadableStackDoesNotEliminate) {
    SeatReadings first;
    first[SeatId::Position2] = seat("Dave", "1,200");
    update(state, first, t0);

    SeatReadings second;
    second[SeatId::Position2] = seat("Dave", "All In");
    LedgerUpdate u = update(state, second, t0);
    EXPECT_TRUE(u.eliminations.empty());
    ASSERT_EQ(u.stackParseFailures.size(), 1u);
    EXPECT_EQ(u.stackParseFailures[0], SeatId::Position2);

    // low confidence candidate leaves the stored record alone
    EXPECT_EQ(state.seat(SeatId::Position2).chips, 1200);
}

TEST_F(TournamentLedgerTest, EmptySeatSignature) {
    LedgerThresholds th;
    EXPECT_TRUE(isEmptySeat(std::nullopt, th));

    SeatRecord unknown = buildCandidate(SeatId::Position1, std::nullopt, std::string("500"), 0.0, t0);
    EXPECT_TRUE(isEmptySeat(unknown, th));

    SeatRecord named = buildCandidate(SeatId::Position1, std::string("Erin"), std::nullopt, 0.0, t0);
    EXPECT_FALSE(isEmptySeat(named, th));
}

TEST_F(TournamentLedgerTest, Metrics) {
    SeatReadings readings;
    readings[SeatId::Hero] = seat("HeroPlayer", "2,000");
    readings[SeatId::Position1] = seat("Bob", "1,500");
    readings[SeatId::Position2] = seat("Carol", "4,500");
    readings[SeatId::Position3] = seat("Dave", "1,500");
    update(state, readings, t0);

    TournamentMetrics m = computeMetrics(state);
    EXPECT_EQ(m.activePlayers, 4);
    EXPECT_EQ(m.totalChips, 9500);
    EXPECT_DOUBLE_EQ(m.averageStack, 2375.0);
    ASSERT_TRUE(m.chipLeader.has_value());
    EXPECT_EQ(m.chipLeader->name, "Carol");
    // tie on 1,500: first in table order
    ASSERT_TRUE(m.shortStack.has_value());
    EXPECT_EQ(m.shortStack->name, "Bob");
    EXPECT_EQ(m.heroRank, 2);
    EXPECT_NEAR(m.heroChipShare, 2000.0 / 9500.0 * 100.0, 1e-9);
    ASSERT_EQ(m.standings.size(), 4u);
    EXPECT_EQ(m.standings[2].name, "Bob");
    EXPECT_EQ(m.standings[3].name, "Dave");
}

TEST_F(TournamentLedgerTest, MetricsOnEmptyTable) {
    TournamentMetrics m = computeMetrics(state);
    EXPECT_EQ(m.activePlayers, 0);
    EXPECT_FALSE(m.chipLeader.has_value());
    EXPECT_FALSE(m.heroRank.has_value());
    EXPECT_DOUBLE_EQ(m.heroChipShare, 0.0);
}

TEST_F(TournamentLedgerTest, SeatingSummary) {
    SeatingSummary none = summarizeSeating({});
    EXPECT_EQ(none.seated, 8);
    EXPECT_EQ(none.activeSeated, 9);

    SeatReadings readings;
    readings[SeatId::Hero] = seat("HeroPlayer", "2,000");
    readings[SeatId::Position1] = seat("Bob", "1,500");
    readings[SeatId::Position2] = seat("Carol", "Sitting Out");
    readings[SeatId::Position3] = seat("Dave", "");
    readings[SeatId::Position4] = seat("", "");

    SeatingSummary s = summarizeSeating(readings);
    EXPECT_EQ(s.seated, 3);
    EXPECT_EQ(s.sittingOut, 2);
    EXPECT_EQ(s.activeSeated, 2);
}

TEST_F(TournamentLedgerTest, ApplyBlinds) {
    applyBlinds(state, Blinds{100.0, 200.0});
    EXPECT_DOUBLE_EQ(state.smallBlind, 100.0);
    EXPECT_DOUBLE_EQ(state.bigBlind, 200.0);
}
