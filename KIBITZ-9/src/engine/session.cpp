#include "session.hpp"
#include "ledger/stack_parser.hpp"
#include <algorithm>
#include <chrono>
#include <utility>

namespace Engine {

using Cards::Card;

namespace {

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::vector<Card> concat(const std::vector<Card>& a, const std::vector<Card>& b) {
    std::vector<Card> out = a;
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

}

int estimateActivePlayers(const Snapshot& snapshot, int communityCount) {
    if (snapshot.activeOpponentCardCount && *snapshot.activeOpponentCardCount > 0) {
        return *snapshot.activeOpponentCardCount + 1;
    }

    if (!snapshot.seats.empty()) {
        int present = 0;
        int sittingOut = 0;
        for (const auto& [seat, text] : snapshot.seats) {
            if (seat == Ledger::SeatId::Hero) continue;
            std::string name = text.name.value_or("");
            std::string stack = text.stack.value_or("");
            if (isBlank(name) || stack.empty()) continue;
            present++;
            if (Ledger::isSittingOut(name, stack)) sittingOut++;
        }
        int n = present - sittingOut;

        // typical field size per street
        if (communityCount == 5) return std::clamp(n, 2, 3);
        if (communityCount >= 3) return std::clamp(n, 3, 4);
        return std::max(4, n);
    }

    switch (communityCount) {
        case 0: return Config::DEFAULT_ACTIVE_PREFLOP;
        case 3: return Config::DEFAULT_ACTIVE_FLOP;
        case 4: return Config::DEFAULT_ACTIVE_TURN;
        case 5: return Config::DEFAULT_ACTIVE_RIVER;
        default: return Config::DEFAULT_ACTIVE_PREFLOP;
    }
}

Session::Session(Config::EngineConfig config, std::ostream* echo)
    : config_(std::move(config)),
      logger_(config_.logFile, config_.verbose ? echo : nullptr) {
    if (config_.probabilityEnabled) {
        if (config_.seed) {
            equity_.emplace(config_.equitySettings(), *config_.seed);
        } else {
            equity_.emplace(config_.equitySettings());
        }
    }
}

void Session::diagnose(PassResult& result, Core::ErrorKind kind, const std::string& message) {
    Core::Diagnostic d{kind, message};
    logger_.logDiagnostic(d);
    result.diagnostics.push_back(std::move(d));
}

void Session::readCards(const std::vector<std::string>& texts,
                        std::vector<CardRead>& reads,
                        std::vector<Card>& parsed,
                        std::vector<Core::Diagnostic>& diagnostics) {
    for (const auto& text : texts) {
        CardRead read;
        read.text = text;

        if (isBlank(text)) {
            read.status = ReadStatus::NotRecognized;
            reads.push_back(read);
            continue;
        }

        std::optional<Card> card = Cards::tryParseCard(text);
        if (!card) {
            read.status = ReadStatus::ParseError;
            diagnostics.push_back({Core::ErrorKind::InvalidCardFormat, "cannot read card '" + text + "'"});
        } else if (deck_.isKnown(*card)) {
            // the same card twice in one frame, keep the first read
            read.status = ReadStatus::ParseError;
            diagnostics.push_back({Core::ErrorKind::DuplicateCard, Cards::toText(*card) + " read twice"});
        } else {
            read.status = ReadStatus::Parsed;
            read.card = card;
            deck_.markKnown(*card);
            parsed.push_back(*card);
        }
        reads.push_back(read);
    }
}

void Session::runEvaluator(PassResult& result) {
    const auto& hole = result.heroCards;
    const auto& board = result.communityCards;
    if (hole.empty()) return;

    if (hole.size() != 2) {
        diagnose(result, Core::ErrorKind::InsufficientCards,
                 std::to_string(hole.size()) + " hole cards recognized, hand not evaluated");
        return;
    }

    try {
        if (board.size() >= 3) {
            result.handEvaluation = Eval::evaluate(concat(hole, board));
        } else {
            result.preflopEvaluation = Preflop::evaluatePreflop(hole);
        }
    } catch (const Core::InsufficientCards& e) {
        diagnose(result, Core::ErrorKind::InsufficientCards, e.what());
    } catch (const Core::DuplicateCard& e) {
        diagnose(result, Core::ErrorKind::DuplicateCard, e.what());
    }
}

void Session::runLedger(const Snapshot& snapshot, PassResult& result) {
    const auto now = Ledger::Clock::now();

    if (snapshot.blinds && !isBlank(*snapshot.blinds)) {
        if (auto blinds = Ledger::parseBlinds(*snapshot.blinds)) {
            Ledger::applyBlinds(state_, *blinds);
        } else {
            diagnose(result, Core::ErrorKind::StackParseFailure, "cannot read blinds '" + *snapshot.blinds + "'");
        }
    }

    // no seat readings at all: nothing to compare against, keep the stored table
    if (!snapshot.seats.empty()) {
        Ledger::LedgerUpdate update = Ledger::update(state_, snapshot.seats, now, config_.ledgerThresholds());
        for (const auto& e : update.eliminations) {
            logger_.logElimination(e);
        }
        for (Ledger::SeatId seat : update.stackParseFailures) {
            const auto& text = snapshot.seats.at(seat);
            diagnose(result, Core::ErrorKind::StackParseFailure,
                     Ledger::seatName(seat) + ": no chip count in '" + text.stack.value_or("") + "'");
        }
        result.eliminations = std::move(update.eliminations);
    }

    result.tournamentMetrics = Ledger::computeMetrics(state_);
}

void Session::runProbability(PassResult& result) {
    if (result.heroCards.size() != 2) return;

    if (!equity_) {
        diagnose(result, Core::ErrorKind::ProbabilityEngineUnavailable, "probability engine disabled");
        return;
    }

    try {
        result.probabilityAnalysis = equity_->analyze(result.heroCards, result.communityCards,
                                                      result.deckAnalysis.activeOpponents,
                                                      result.deckAnalysis.activeSeatedPlayers);
    } catch (const Core::InsufficientCards& e) {
        diagnose(result, Core::ErrorKind::InsufficientCards, e.what());
    } catch (const Core::DuplicateCard& e) {
        diagnose(result, Core::ErrorKind::DuplicateCard, e.what());
    }
}

PassResult Session::analyze(const Snapshot& snapshot) {
    PassResult result;
    result.pass = ++passCount_;

    // 1. deck
    deck_.reset();
    std::vector<Core::Diagnostic> readDiagnostics;
    readCards(snapshot.heroCards, result.heroReads, result.heroCards, readDiagnostics);
    readCards(snapshot.communityCards, result.communityReads, result.communityCards, readDiagnostics);
    for (const auto& d : readDiagnostics) {
        diagnose(result, d.kind, d.message);
    }

    if (snapshot.pot) {
        result.pot = Ledger::parseAmount(*snapshot.pot);
    }

    // 2. stage
    Stage::StageInfo info = Stage::classify(result.communityCards);
    result.stage = info.street;
    result.stageConfidence = info.confidence;
    result.transition = tracker_.observe(info.street);
    logger_.logTransition(result.transition);
    result.handCount = tracker_.handCount();
    result.handFinishReason = tracker_.finishReason();

    // 3. evaluator
    runEvaluator(result);

    // 4. ledger
    runLedger(snapshot, result);

    const int community = static_cast<int>(result.communityCards.size());
    Ledger::SeatingSummary seating = Ledger::summarizeSeating(snapshot.seats);

    DeckAnalysis& deck = result.deckAnalysis;
    deck.knownCards = deck_.knownCount();
    deck.unknownCards = deck_.unknownCount();
    deck.heroCards = static_cast<int>(result.heroCards.size());
    deck.communityCards = community;
    deck.seatedPlayers = seating.seated + 1;
    deck.sittingOutPlayers = seating.sittingOut;
    deck.activeSeatedPlayers = seating.activeSeated;
    deck.eliminatedPlayers = static_cast<int>(state_.eliminations.size());
    deck.estimatedActivePlayers = estimateActivePlayers(snapshot, community);
    deck.activeOpponents = std::max(1, deck.estimatedActivePlayers - 1);
    deck.remainingDeckSize = Equity::remainingDeckSize(community, seating.activeSeated);

    // 5. probability
    runProbability(result);

    logger_.logPassSummary(result.pass, result.stage, result.handCount,
                           result.tournamentMetrics.activePlayers,
                           static_cast<int>(result.diagnostics.size()));
    return result;
}

}
