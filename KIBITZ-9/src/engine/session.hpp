#pragma once

#include "snapshot.hpp"
#include "cards/deck.hpp"
#include "config/engine_config.hpp"
#include "equity/equity_engine.hpp"
#include "ledger/tournament_ledger.hpp"
#include "logging/pass_logger.hpp"
#include "stage/stage_machine.hpp"
#include <iostream>
#include <optional>

namespace Engine {

/*
 Players still in the hand, hero included:
 - opponents seen holding cards, when the recognizer reports them
 - else named seats with a stack, minus sitting out, clamped per street
   (river 2-3, flop/turn 3-4, pre-flop at least 4)
 - else a fixed guess per street
*/
int estimateActivePlayers(const Snapshot& snapshot, int communityCount);

/*
 Owns everything that lives across passes: the hand tracker, the tournament
 ledger, the equity engine's random source and the log. One pass per
 snapshot, strictly in order Deck -> Stage -> Evaluator -> Ledger -> Probability.
 Not thread-safe, drive one session from one thread.
*/
class Session {
public:
    explicit Session(Config::EngineConfig config = Config::EngineConfig{}, std::ostream* echo = &std::cout);

    // never throws on bad input, failures end up in PassResult::diagnostics
    PassResult analyze(const Snapshot& snapshot);

    const Stage::HandTracker& tracker() const { return tracker_; }
    const Ledger::TournamentState& tournament() const { return state_; }
    const Cards::Deck& deck() const { return deck_; }
    const Config::EngineConfig& config() const { return config_; }
    int passCount() const { return passCount_; }

private:
    void readCards(const std::vector<std::string>& texts,
                   std::vector<CardRead>& reads,
                   std::vector<Cards::Card>& parsed,
                   std::vector<Core::Diagnostic>& diagnostics);
    void runEvaluator(PassResult& result);
    void runLedger(const Snapshot& snapshot, PassResult& result);
    void runProbability(PassResult& result);

    void diagnose(PassResult& result, Core::ErrorKind kind, const std::string& message);

    Config::EngineConfig config_;
    Logging::PassLogger logger_;
    Cards::Deck deck_;
    Stage::HandTracker tracker_;
    Ledger::TournamentState state_;
    std::optional<Equity::EquityEngine> equity_;
    int passCount_ = 0;
};

}
