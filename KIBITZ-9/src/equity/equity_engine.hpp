#pragma once

#include "board_texture.hpp"
#include "outs.hpp"
#include "cards/card.hpp"
#include "cards/deck.hpp"
#include "eval/evaluator.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace Equity {

struct EquitySettings {
    int maxRiverSamples = 200;   // opponent holdings evaluated on a complete board
    int opponentSamples = 100;   // holdings used for the opponent range picture
};

// percentages, always win + tie + lose == 100 and each inside [0, 100]
struct EquityResult {
    double winPercentage = 0.0;
    double tiePercentage = 0.0;
    double losePercentage = 0.0;
    bool simulated = false;              // false means a parametrized estimate
    int samples = 0;                     // opponent holdings actually evaluated
    int skippedSamples = 0;              // holdings the evaluator rejected
    double singleOpponentWinRate = 0.0;  // percent, heads-up rate before the n-way adjustment
    int opponents = 1;
    std::string note;
};

// heads-up showdown counts against sampled opponent holdings
struct SampleTally {
    int wins = 0;
    int ties = 0;
    int losses = 0;
    int skipped = 0;

    int total() const { return wins + ties + losses; }
};

struct OpponentRange {
    double averageScore = 0.0;
    int sampleSize = 0;
    std::map<Eval::HandCategory, int> categoryCounts;
};

struct ProbabilityAnalysis {
    EquityResult equity;
    BoardTexture texture;
    DrawInfo draws;
    std::optional<OpponentRange> opponentRange;   // only once the flop is out
    int remainingDeckSize = 0;
    int activeOpponents = 1;
    int activeSeatedPlayers = 0;
};

// 52 - board - 2 per player dealt in (every seated active player, not only those still betting)
int remainingDeckSize(int communityCount, int activeSeatedPlayers);

// base heads-up-and-up win rate for boards that are not complete yet
double preRiverBaseWinRate(int opponents);

/*
 Turns a heads-up tally into an n-way result.
 win(n) = win(1)^n treats every opponent hand as independent, it ignores
 the card removal between opponents - kept on purpose, a joint simulation
 is a different engine. Ties are halved once more than one opponent is in.
*/
EquityResult combineTally(const SampleTally& tally, int opponents);

EquityResult estimatePreRiver(int communityCount, int opponents);

// clamps into [0, 100] and makes lose the remainder
void normalize(EquityResult& result);

class EquityEngine {
public:
    // production: seeded from std::random_device
    explicit EquityEngine(EquitySettings settings = EquitySettings{});
    // tests: fixed seed for repeatable samples
    EquityEngine(EquitySettings settings, uint32_t seed);

    // hero's best hand vs sampled holdings on a 5-card board, skipped samples are counted not thrown
    // throws Core::InsufficientCards / Core::DuplicateCard only for a bad hero hand or board
    SampleTally tallyRiver(const std::vector<Cards::Card>& hole, const std::vector<Cards::Card>& board);

    EquityResult riverEquity(const std::vector<Cards::Card>& hole,
                             const std::vector<Cards::Card>& board,
                             int opponents);

    // river simulation on a complete board, parametrized estimate otherwise
    EquityResult equity(const std::vector<Cards::Card>& hole,
                        const std::vector<Cards::Card>& board,
                        int opponents);

    OpponentRange sampleOpponentRange(const std::vector<Cards::Card>& hole,
                                      const std::vector<Cards::Card>& board);

    ProbabilityAnalysis analyze(const std::vector<Cards::Card>& hole,
                                const std::vector<Cards::Card>& board,
                                int opponents,
                                int activeSeatedPlayers);

    const EquitySettings& settings() const { return settings_; }

private:
    using Holding = std::pair<Cards::Card, Cards::Card>;

    // every 2-card holding from the unseen cards, shuffled, first maxSamples kept
    std::vector<Holding> sampleHoldings(const std::vector<Cards::Card>& hole,
                                        const std::vector<Cards::Card>& board,
                                        int maxSamples);

    EquitySettings settings_;
    std::mt19937 rng_;
};

}
