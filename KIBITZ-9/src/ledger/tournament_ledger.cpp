#include "tournament_ledger.hpp"
#include <algorithm>

namespace Ledger {

namespace {

constexpr double NAME_CONFIDENCE = 0.3;
constexpr double STACK_CONFIDENCE = 0.7;
constexpr int DEFAULT_SEATED_OPPONENTS = NUM_SEATS - 1;

const std::array<SeatId, NUM_SEATS> SEAT_ORDER = {
    SeatId::Hero,
    SeatId::Position1, SeatId::Position2, SeatId::Position3, SeatId::Position4,
    SeatId::Position5, SeatId::Position6, SeatId::Position7, SeatId::Position8
};

bool hasText(const std::optional<std::string>& s) {
    return s.has_value() && !s->empty();
}

SeatRecord emptyRecord(SeatId seat, std::optional<Timestamp> when) {
    SeatRecord r;
    r.seat = seat;
    r.name = EMPTY_SEAT;
    r.lastUpdated = when;
    return r;
}

}

std::string seatName(SeatId seat) {
    if (seat == SeatId::Hero) return "Hero";
    return "Position_" + std::to_string(static_cast<int>(seat));
}

std::optional<SeatId> parseSeatName(const std::string& text) {
    for (SeatId s : SEAT_ORDER) {
        if (seatName(s) == text) return s;
    }
    return std::nullopt;
}

const std::array<SeatId, NUM_SEATS>& allSeats() {
    return SEAT_ORDER;
}

TournamentState::TournamentState() {
    for (SeatId s : SEAT_ORDER) {
        seat(s) = emptyRecord(s, std::nullopt);
    }
}

SeatRecord buildCandidate(SeatId seat,
                          const std::optional<std::string>& nameText,
                          const std::optional<std::string>& stackText,
                          double bigBlind,
                          Timestamp now) {
    SeatRecord player;
    player.seat = seat;
    player.name = UNKNOWN_NAME;
    player.lastUpdated = now;

    if (hasText(nameText)) {
        if (auto cleaned = cleanName(*nameText)) {
            player.name = *cleaned;
            player.confidence += NAME_CONFIDENCE;
        }
    }

    if (hasText(stackText)) {
        StackReading reading = parseStack(*stackText);
        player.chips = reading.chips;
        player.bbSize = reading.bbSize;

        // a zero stack is kept for elimination checks but earns no confidence
        if (reading.chips && *reading.chips > 0) {
            player.confidence += STACK_CONFIDENCE;
            if (!player.bbSize && bigBlind > 0.0) {
                player.bbSize = static_cast<double>(*reading.chips) / bigBlind;
            }
        }
    }

    return player;
}

bool isEmptySeat(const std::optional<SeatRecord>& candidate, const LedgerThresholds& thresholds) {
    if (!candidate) return true;
    const auto& name = candidate->name;
    return name.empty() || name == UNKNOWN_NAME || name == EMPTY_SEAT ||
           candidate->confidence < thresholds.emptySeatConfidence;
}

LedgerUpdate update(TournamentState& state,
                    const SeatReadings& readings,
                    Timestamp now,
                    const LedgerThresholds& thresholds) {
    LedgerUpdate result;

    // candidates only for seats where the recognizer produced any text
    std::map<SeatId, SeatRecord> candidates;
    for (const auto& [seat, text] : readings) {
        if (!hasText(text.name) && !hasText(text.stack)) continue;
        SeatRecord candidate = buildCandidate(seat, text.name, text.stack, state.bigBlind, now);
        if (hasText(text.stack) && !candidate.chips) {
            result.stackParseFailures.push_back(seat);
        }
        candidates.emplace(seat, std::move(candidate));
    }

    // 1. eliminations before anything gets overwritten
    for (SeatId seat : SEAT_ORDER) {
        SeatRecord& current = state.seat(seat);
        if (!current.isActive()) continue;

        std::optional<SeatRecord> next;
        auto it = candidates.find(seat);
        if (it != candidates.end()) next = it->second;

        bool busted = next && next->chips && *next->chips <= 0;
        if (!next || busted || isEmptySeat(next, thresholds)) {
            EliminationEvent event{ seat, current.name, *current.chips, now };
            result.eliminations.push_back(event);
            state.eliminations.push_back(event);
            current = emptyRecord(seat, now);
        }
    }

    // 2. confident candidates replace the stored record
    for (auto& [seat, candidate] : candidates) {
        if (candidate.confidence > thresholds.applyConfidence) {
            state.seat(seat) = candidate;
            result.applied.push_back(seat);
        }
    }

    // 3. derived totals
    state.totalChips = 0;
    for (const auto& record : state.seats) {
        if (record.isActive()) state.totalChips += *record.chips;
    }
    if (!state.startTime) state.startTime = now;
    state.lastUpdate = now;

    return result;
}

void applyBlinds(TournamentState& state, const Blinds& blinds) {
    state.smallBlind = blinds.smallBlind;
    state.bigBlind = blinds.bigBlind;
}

int activePlayerCount(const TournamentState& state) {
    return static_cast<int>(std::count_if(state.seats.begin(), state.seats.end(),
                                          [](const SeatRecord& r) { return r.isActive(); }));
}

TournamentMetrics computeMetrics(const TournamentState& state) {
    TournamentMetrics metrics;

    // table order, so the stable sort below breaks chip ties by seat
    for (SeatId seat : SEAT_ORDER) {
        const SeatRecord& record = state.seat(seat);
        if (record.isActive()) metrics.standings.push_back(record);
    }

    if (metrics.standings.empty()) return metrics;

    for (const auto& r : metrics.standings) {
        metrics.totalChips += *r.chips;
        if (!metrics.chipLeader || *r.chips > *metrics.chipLeader->chips) metrics.chipLeader = r;
        if (!metrics.shortStack || *r.chips < *metrics.shortStack->chips) metrics.shortStack = r;
    }

    std::stable_sort(metrics.standings.begin(), metrics.standings.end(),
                     [](const SeatRecord& a, const SeatRecord& b) { return *a.chips > *b.chips; });

    metrics.activePlayers = static_cast<int>(metrics.standings.size());
    metrics.averageStack = static_cast<double>(metrics.totalChips) / metrics.activePlayers;

    for (size_t i = 0; i < metrics.standings.size(); ++i) {
        if (metrics.standings[i].seat == SeatId::Hero) {
            metrics.heroRank = static_cast<int>(i) + 1;
            metrics.heroChipShare = metrics.totalChips > 0
                ? static_cast<double>(*metrics.standings[i].chips) / metrics.totalChips * 100.0
                : 0.0;
            break;
        }
    }

    return metrics;
}

SeatingSummary summarizeSeating(const SeatReadings& readings) {
    SeatingSummary summary;

    if (readings.empty()) {
        summary.seated = DEFAULT_SEATED_OPPONENTS;
        summary.activeSeated = DEFAULT_SEATED_OPPONENTS + 1;
        return summary;
    }

    for (const auto& [seat, text] : readings) {
        if (seat == SeatId::Hero) continue;
        std::string name = text.name.value_or("");
        std::string stack = text.stack.value_or("");

        // seated if a name shows, the stack can be blank while sitting out
        if (name.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        summary.seated++;
        if (isSittingOut(name, stack)) summary.sittingOut++;
    }

    // hero is always dealt in
    summary.activeSeated = summary.seated - summary.sittingOut + 1;
    return summary;
}

}
