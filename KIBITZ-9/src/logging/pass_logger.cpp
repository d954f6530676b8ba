#include "pass_logger.hpp"
#include <sstream>

namespace Logging {

PassLogger::PassLogger(const std::string& filename, std::ostream* echo) : echo_(echo) {
    if (!filename.empty()) {
        file_.open(filename, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "[warn] cannot open log file " << filename << "\n";
        }
    }
}

PassLogger::~PassLogger() {
    if (file_.is_open()) file_.close();
}

void PassLogger::write(const std::string& tag, const std::string& message) {
    if (file_.is_open()) {
        file_ << "[" << tag << "] " << message << "\n";
        file_.flush();
    }
    if (echo_) {
        *echo_ << "[" << tag << "] " << message << "\n";
    }
    lines_++;
}

void PassLogger::logTransition(const Stage::Transition& t) {
    if (t.kind == Stage::TransitionKind::None) return;

    std::ostringstream ss;
    ss << Stage::streetName(t.from) << " -> " << Stage::streetName(t.to)
       << " (" << Stage::transitionName(t.kind) << ")";
    if (t.kind == Stage::TransitionKind::HandFinished) {
        ss << " hand #" << t.handCount << ", " << t.reason;
    } else if (t.kind == Stage::TransitionKind::NewHand) {
        ss << " hand #" << t.handCount;
    }
    write(t.kind == Stage::TransitionKind::AnomalousBackward ? "warn" : "stage", ss.str());
}

void PassLogger::logElimination(const Ledger::EliminationEvent& e) {
    std::ostringstream ss;
    ss << e.playerName << " eliminated from " << Ledger::seatName(e.seat)
       << " (last stack " << e.lastStack << ")";
    write("ledger", ss.str());
}

void PassLogger::logDiagnostic(const Core::Diagnostic& d) {
    write("warn", Core::errorKindName(d.kind) + ": " + d.message);
}

void PassLogger::logPassSummary(int pass, Stage::Street street, int handCount, int activePlayers, int diagnostics) {
    std::ostringstream ss;
    ss << "pass " << pass << ", " << Stage::streetName(street)
       << ", hands " << handCount
       << ", active " << activePlayers
       << ", diagnostics " << diagnostics;
    write("pass", ss.str());
}

}
