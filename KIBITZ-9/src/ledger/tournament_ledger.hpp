#pragma once

#include "stack_parser.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Ledger {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// fixed 9-max seat table, Hero first, then clockwise from hero's left
enum class SeatId : uint8_t {
    Hero = 0,
    Position1, Position2, Position3, Position4,
    Position5, Position6, Position7, Position8
};

constexpr int NUM_SEATS = 9;
constexpr const char* EMPTY_SEAT = "Empty";
constexpr const char* UNKNOWN_NAME = "Unknown";

// "Hero", "Position_1", ...
std::string seatName(SeatId seat);
std::optional<SeatId> parseSeatName(const std::string& text);
// table order
const std::array<SeatId, NUM_SEATS>& allSeats();

struct SeatRecord {
    SeatId seat = SeatId::Hero;
    std::string name = EMPTY_SEAT;
    std::optional<long long> chips;   // absent is not zero
    std::optional<double> bbSize;
    std::optional<Timestamp> lastUpdated;
    double confidence = 0.0;

    // still in the tournament: a real name and a positive stack
    bool isActive() const {
        return name != EMPTY_SEAT && chips.has_value() && *chips > 0;
    }
};

struct EliminationEvent {
    SeatId seat;
    std::string playerName;
    long long lastStack;
    Timestamp time;
};

struct TournamentState {
    TournamentState();

    std::array<SeatRecord, NUM_SEATS> seats;   // indexed by SeatId
    long long totalChips = 0;
    double smallBlind = 0.0;
    double bigBlind = 0.0;
    std::optional<Timestamp> startTime;
    std::optional<Timestamp> lastUpdate;
    std::vector<EliminationEvent> eliminations;   // whole session, oldest first

    SeatRecord& seat(SeatId id) { return seats[static_cast<size_t>(id)]; }
    const SeatRecord& seat(SeatId id) const { return seats[static_cast<size_t>(id)]; }
};

// raw recognizer output for one seat, either field may be missing
struct SeatText {
    std::optional<std::string> name;
    std::optional<std::string> stack;
};

using SeatReadings = std::map<SeatId, SeatText>;

struct LedgerThresholds {
    double applyConfidence = 0.5;       // candidate must beat this to overwrite a record
    double emptySeatConfidence = 0.3;   // below this a candidate reads as an empty seat
};

struct LedgerUpdate {
    std::vector<EliminationEvent> eliminations;
    std::vector<SeatId> applied;             // seats overwritten this pass
    std::vector<SeatId> stackParseFailures;  // stack text present but no chip count in it
};

struct TournamentMetrics {
    int activePlayers = 0;
    long long totalChips = 0;
    double averageStack = 0.0;
    std::optional<SeatRecord> chipLeader;
    std::optional<SeatRecord> shortStack;
    std::optional<int> heroRank;     // 1-based, by descending chips
    double heroChipShare = 0.0;      // percent of all active chips
    std::vector<SeatRecord> standings;
};

struct SeatingSummary {
    int seated = 0;         // opponents with a name on screen
    int sittingOut = 0;
    int activeSeated = 0;   // dealt in, hero included
};

/*
 Builds the candidate record for one seat.
 confidence: +0.3 for a clean name, +0.7 for a positive chip count.
 bigBlind > 0 lets us derive the BB size when the text did not carry one.
*/
SeatRecord buildCandidate(SeatId seat,
                          const std::optional<std::string>& nameText,
                          const std::optional<std::string>& stackText,
                          double bigBlind,
                          Timestamp now);

// matches the "nobody sits here" signature
bool isEmptySeat(const std::optional<SeatRecord>& candidate, const LedgerThresholds& thresholds);

/*
 One ledger pass over the snapshot's seat readings:
 1. eliminations are detected against the stored state first
 2. candidates above the confidence threshold overwrite their seat
 3. the chip total is recomputed
*/
LedgerUpdate update(TournamentState& state,
                    const SeatReadings& readings,
                    Timestamp now,
                    const LedgerThresholds& thresholds = LedgerThresholds{});

void applyBlinds(TournamentState& state, const Blinds& blinds);

TournamentMetrics computeMetrics(const TournamentState& state);

// seats without readings at all are assumed to be a full 9-max table
SeatingSummary summarizeSeating(const SeatReadings& readings);

int activePlayerCount(const TournamentState& state);

}
