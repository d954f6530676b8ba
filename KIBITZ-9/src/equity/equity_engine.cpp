#include "equity_engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace Equity {

using Cards::Card;

namespace {

constexpr double PRE_RIVER_TIE = 3.0;
constexpr double FLOP_SEEN_BONUS = 1.1;
constexpr double FALLBACK_TIE = 5.0;

}

int remainingDeckSize(int communityCount, int activeSeatedPlayers) {
    return std::max(0, Cards::DECK_SIZE - communityCount - 2 * activeSeatedPlayers);
}

double preRiverBaseWinRate(int opponents) {
    if (opponents <= 1) return 45.0;   // heads-up
    if (opponents == 2) return 30.0;   // 3-way
    if (opponents <= 4) return 20.0;   // 5-way or less
    if (opponents <= 6) return 15.0;   // 7-way or less
    return 10.0;                       // 8+ way
}

void normalize(EquityResult& result) {
    result.winPercentage = std::clamp(result.winPercentage, 0.0, 100.0);
    result.tiePercentage = std::clamp(result.tiePercentage, 0.0, 100.0 - result.winPercentage);
    result.losePercentage = std::clamp(100.0 - result.winPercentage - result.tiePercentage, 0.0, 100.0);
}

EquityResult combineTally(const SampleTally& tally, int opponents) {
    EquityResult result;
    result.opponents = std::max(1, opponents);
    result.samples = tally.total();
    result.skippedSamples = tally.skipped;

    if (tally.total() == 0) {
        // nothing could be evaluated, even split of the pot
        result.winPercentage = 100.0 / (result.opponents + 1);
        result.tiePercentage = FALLBACK_TIE;
        result.note = "No opponent holding could be evaluated";
        normalize(result);
        return result;
    }

    double single = static_cast<double>(tally.wins) / tally.total();
    double tieRate = static_cast<double>(tally.ties) / tally.total();

    double win = std::pow(single, result.opponents);
    double tie = result.opponents > 1 ? tieRate * 0.5 : tieRate;

    result.simulated = true;
    result.singleOpponentWinRate = single * 100.0;
    result.winPercentage = win * 100.0;
    result.tiePercentage = tie * 100.0;
    result.note = "Simulated against " + std::to_string(result.samples) + " holdings";
    normalize(result);
    return result;
}

EquityResult estimatePreRiver(int communityCount, int opponents) {
    EquityResult result;
    result.opponents = std::max(1, opponents);

    double base = preRiverBaseWinRate(result.opponents);
    // more community cards = more defined probabilities
    if (communityCount >= 3) base *= FLOP_SEEN_BONUS;

    result.winPercentage = base;
    result.tiePercentage = PRE_RIVER_TIE;
    result.simulated = false;
    result.note = "Estimated for " + std::to_string(result.opponents) + " opponents, not simulated";
    normalize(result);
    return result;
}

EquityEngine::EquityEngine(EquitySettings settings)
    : settings_(settings), rng_(std::random_device{}()) {}

EquityEngine::EquityEngine(EquitySettings settings, uint32_t seed)
    : settings_(settings), rng_(seed) {}

std::vector<EquityEngine::Holding> EquityEngine::sampleHoldings(const std::vector<Card>& hole,
                                                                const std::vector<Card>& board,
                                                                int maxSamples) {
    Cards::Deck deck;
    deck.markKnown(hole);
    deck.markKnown(board);
    std::vector<Card> pool = deck.unknownCards();

    std::vector<Holding> holdings;
    holdings.reserve(pool.size() * (pool.size() - 1) / 2);
    for (size_t i = 0; i < pool.size(); ++i) {
        for (size_t j = i + 1; j < pool.size(); ++j) {
            holdings.emplace_back(pool[i], pool[j]);
        }
    }

    std::shuffle(holdings.begin(), holdings.end(), rng_);
    if (static_cast<int>(holdings.size()) > maxSamples) {
        holdings.resize(std::max(0, maxSamples));
    }
    return holdings;
}

SampleTally EquityEngine::tallyRiver(const std::vector<Card>& hole, const std::vector<Card>& board) {
    std::vector<Card> heroCards = hole;
    heroCards.insert(heroCards.end(), board.begin(), board.end());

    // hero is evaluated once, a bad hero hand is the caller's problem
    const int heroScore = Eval::evaluate(heroCards).score;

    // samples are drawn before the parallel region so the result does not depend on threads
    const std::vector<Holding> holdings = sampleHoldings(hole, board, settings_.maxRiverSamples);
    const int n = static_cast<int>(holdings.size());

    int wins = 0, ties = 0, losses = 0, skipped = 0;

    #pragma omp parallel for reduction(+:wins, ties, losses, skipped)
    for (int i = 0; i < n; ++i) {
        std::vector<Card> villain = board;
        villain.push_back(holdings[i].first);
        villain.push_back(holdings[i].second);
        try {
            int villainScore = Eval::evaluate(villain).score;
            if (heroScore > villainScore) wins++;
            else if (heroScore == villainScore) ties++;
            else losses++;
        } catch (const Core::DuplicateCard&) {
            // holdings come from the unknown pool, so a clash here means a broken deck mask
            skipped++;
        } catch (const Core::InsufficientCards&) {
            skipped++;
        }
    }

    SampleTally tally;
    tally.wins = wins;
    tally.ties = ties;
    tally.losses = losses;
    tally.skipped = skipped;
    return tally;
}

EquityResult EquityEngine::riverEquity(const std::vector<Card>& hole,
                                       const std::vector<Card>& board,
                                       int opponents) {
    return combineTally(tallyRiver(hole, board), opponents);
}

EquityResult EquityEngine::equity(const std::vector<Card>& hole,
                                  const std::vector<Card>& board,
                                  int opponents) {
    if (board.size() == 5) {
        return riverEquity(hole, board, opponents);
    }
    return estimatePreRiver(static_cast<int>(board.size()), opponents);
}

OpponentRange EquityEngine::sampleOpponentRange(const std::vector<Card>& hole,
                                                const std::vector<Card>& board) {
    OpponentRange range;
    if (board.size() < 3) return range;

    const std::vector<Holding> holdings = sampleHoldings(hole, board, settings_.opponentSamples);

    double scoreSum = 0.0;
    for (const auto& h : holdings) {
        std::vector<Card> villain = board;
        villain.push_back(h.first);
        villain.push_back(h.second);
        try {
            Eval::HandEvaluation e = Eval::evaluate(villain);
            scoreSum += e.score;
            range.categoryCounts[e.category]++;
            range.sampleSize++;
        } catch (const Core::DuplicateCard&) {
            continue;
        } catch (const Core::InsufficientCards&) {
            continue;
        }
    }

    if (range.sampleSize > 0) {
        range.averageScore = scoreSum / range.sampleSize;
    }
    return range;
}

ProbabilityAnalysis EquityEngine::analyze(const std::vector<Card>& hole,
                                          const std::vector<Card>& board,
                                          int opponents,
                                          int activeSeatedPlayers) {
    ProbabilityAnalysis analysis;
    analysis.activeOpponents = std::max(1, opponents);
    analysis.activeSeatedPlayers = activeSeatedPlayers;
    analysis.remainingDeckSize = remainingDeckSize(static_cast<int>(board.size()), activeSeatedPlayers);

    analysis.equity = equity(hole, board, analysis.activeOpponents);
    analysis.texture = analyzeBoardTexture(board, analysis.activeOpponents);
    analysis.draws = computeOuts(hole, board);
    if (board.size() >= 3) {
        analysis.opponentRange = sampleOpponentRange(hole, board);
    }
    return analysis;
}

}
