#include "report.hpp"
#include <iomanip>
#include <sstream>

namespace Engine {

namespace {

void printCards(std::ostringstream& ss, const std::vector<CardRead>& reads) {
    if (reads.empty()) {
        ss << "-";
        return;
    }
    for (size_t i = 0; i < reads.size(); ++i) {
        if (i) ss << " ";
        const CardRead& r = reads[i];
        if (r.status == ReadStatus::Parsed && r.card) ss << Cards::toText(*r.card);
        else if (r.status == ReadStatus::NotRecognized) ss << "??";
        else ss << "!" << r.text;
    }
}

}

std::string formatReport(const PassResult& result) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);

    ss << "=== Pass " << result.pass << " ===\n";
    ss << "Stage: " << Stage::streetName(result.stage)
       << " (confidence " << result.stageConfidence * 100.0 << "%)"
       << ", hand #" << result.handCount
       << ", last finish: " << result.handFinishReason << "\n";
    if (result.transition.kind != Stage::TransitionKind::None) {
        ss << "Transition: " << Stage::streetName(result.transition.from) << " -> "
           << Stage::streetName(result.transition.to)
           << " (" << Stage::transitionName(result.transition.kind) << ")\n";
    }

    ss << "Hero: ";
    printCards(ss, result.heroReads);
    ss << "   Board: ";
    printCards(ss, result.communityReads);
    ss << "\n";
    if (result.pot) ss << "Pot: " << *result.pot << "\n";

    if (result.handEvaluation) {
        ss << "Hand: " << result.handEvaluation->description
           << " [" << Cards::toText(result.handEvaluation->bestFive) << "]\n";
    }
    if (result.preflopEvaluation) {
        ss << "Pre-flop: " << result.preflopEvaluation->description
           << " (" << result.preflopEvaluation->handClass << ")\n";
    }

    const DeckAnalysis& d = result.deckAnalysis;
    ss << "Deck: " << d.knownCards << " known / " << d.unknownCards << " unknown"
       << ", remaining after deal " << d.remainingDeckSize << "\n";
    ss << "Table: " << d.seatedPlayers << " seated, " << d.sittingOutPlayers << " sitting out, "
       << d.activeSeatedPlayers << " dealt in, ~" << d.estimatedActivePlayers << " in the hand, "
       << d.eliminatedPlayers << " eliminated\n";

    const Ledger::TournamentMetrics& m = result.tournamentMetrics;
    if (m.activePlayers > 0) {
        ss << "Tournament: " << m.activePlayers << " players, " << m.totalChips
           << " chips, avg " << m.averageStack << "\n";
        if (m.chipLeader) {
            ss << "  leader " << m.chipLeader->name << " (" << m.chipLeader->chips.value_or(0) << ")";
        }
        if (m.shortStack) {
            ss << ", short " << m.shortStack->name << " (" << m.shortStack->chips.value_or(0) << ")";
        }
        ss << "\n";
        if (m.heroRank) {
            ss << "  hero #" << *m.heroRank << "/" << m.activePlayers
               << ", " << m.heroChipShare << "% of chips\n";
        }
    }
    for (const auto& e : result.eliminations) {
        ss << "Eliminated: " << e.playerName << " (" << Ledger::seatName(e.seat)
           << ", last stack " << e.lastStack << ")\n";
    }

    if (result.probabilityAnalysis) {
        const Equity::ProbabilityAnalysis& p = *result.probabilityAnalysis;
        ss << "Equity vs " << p.activeOpponents << ": win " << p.equity.winPercentage
           << "% tie " << p.equity.tiePercentage
           << "% lose " << p.equity.losePercentage << "%"
           << (p.equity.simulated ? " (simulated)" : " (estimated)") << "\n";
        if (p.draws.totalOuts > 0) {
            ss << "Outs: " << p.draws.totalOuts << " (flush " << p.draws.flushOuts
               << ", straight " << p.draws.straightOuts << "), ~"
               << p.draws.improvePercentage << "% to improve\n";
        }
        ss << "Board: " << Equity::wetnessName(p.texture.wetness)
           << ", danger " << p.texture.dangerLevel << "\n";
        for (const auto& w : p.texture.warnings) {
            ss << "  ! " << w << "\n";
        }
        if (p.opponentRange && p.opponentRange->sampleSize > 0) {
            ss << "Opponent range: " << p.opponentRange->sampleSize << " samples";
            int best = 0;
            Eval::HandCategory common = Eval::HandCategory::HighCard;
            for (const auto& [category, count] : p.opponentRange->categoryCounts) {
                if (count > best) {
                    best = count;
                    common = category;
                }
            }
            ss << ", most often " << Eval::categoryName(common) << "\n";
        }
    }

    for (const auto& diag : result.diagnostics) {
        ss << "[" << Core::errorKindName(diag.kind) << "] " << diag.message << "\n";
    }
    return ss.str();
}

}
