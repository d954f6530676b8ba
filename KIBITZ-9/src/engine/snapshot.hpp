#pragma once

#include "cards/card.hpp"
#include "core/errors.hpp"
#include "equity/equity_engine.hpp"
#include "eval/evaluator.hpp"
#include "eval/preflop.hpp"
#include "ledger/tournament_ledger.hpp"
#include "stage/stage_machine.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Engine {

// one frame of recognizer output, every field may be missing or wrong
struct Snapshot {
    std::vector<std::string> heroCards;        // 0-2 texts, "" = not recognized
    std::vector<std::string> communityCards;   // 0-5 texts, board order
    std::optional<std::string> pot;
    Ledger::SeatReadings seats;
    std::optional<int> activeOpponentCardCount;   // opponents seen holding cards
    std::optional<std::string> blinds;            // "100/200"
};

enum class ReadStatus : uint8_t {
    NotRecognized,   // empty slot
    Parsed,
    ParseError       // text present but not a card, or a card already read
};

struct CardRead {
    std::string text;
    ReadStatus status = ReadStatus::NotRecognized;
    std::optional<Cards::Card> card;
};

struct DeckAnalysis {
    int knownCards = 0;
    int unknownCards = Cards::DECK_SIZE;
    int heroCards = 0;
    int communityCards = 0;
    int seatedPlayers = 0;          // hero included
    int sittingOutPlayers = 0;
    int activeSeatedPlayers = 0;    // dealt in, hero included
    int eliminatedPlayers = 0;      // whole session
    int estimatedActivePlayers = 0; // still in the hand, hero included
    int activeOpponents = 1;
    int remainingDeckSize = 0;
};

struct PassResult {
    int pass = 0;

    Stage::Street stage = Stage::Street::Unknown;
    int handCount = 0;
    double stageConfidence = 0.0;
    std::string handFinishReason;
    Stage::Transition transition{Stage::TransitionKind::None, Stage::Street::Unknown,
                                 Stage::Street::Unknown, 0, ""};

    std::vector<CardRead> heroReads;
    std::vector<CardRead> communityReads;
    std::vector<Cards::Card> heroCards;        // parsed, read order
    std::vector<Cards::Card> communityCards;   // parsed, board order

    std::optional<double> pot;
    std::optional<Eval::HandEvaluation> handEvaluation;
    std::optional<Preflop::PreflopEvaluation> preflopEvaluation;

    DeckAnalysis deckAnalysis;
    Ledger::TournamentMetrics tournamentMetrics;
    std::vector<Ledger::EliminationEvent> eliminations;   // this pass only

    std::optional<Equity::ProbabilityAnalysis> probabilityAnalysis;

    std::vector<Core::Diagnostic> diagnostics;

    bool hasDiagnostic(Core::ErrorKind kind) const {
        for (const auto& d : diagnostics) {
            if (d.kind == kind) return true;
        }
        return false;
    }
};

}
