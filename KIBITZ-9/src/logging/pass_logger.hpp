#pragma once

#include "core/errors.hpp"
#include "ledger/tournament_ledger.hpp"
#include "stage/stage_machine.hpp"
#include <fstream>
#include <iostream>
#include <string>

namespace Logging {

// per-session event log, lines go to the file (if any) and to the echo stream (if any)
class PassLogger {
public:
    // empty filename: no file; echo nullptr: silent
    explicit PassLogger(const std::string& filename = "", std::ostream* echo = &std::cout);
    ~PassLogger();

    void logTransition(const Stage::Transition& t);
    void logElimination(const Ledger::EliminationEvent& e);
    void logDiagnostic(const Core::Diagnostic& d);
    void logPassSummary(int pass, Stage::Street street, int handCount, int activePlayers, int diagnostics);

    bool fileOpen() const { return file_.is_open(); }
    int linesWritten() const { return lines_; }

private:
    void write(const std::string& tag, const std::string& message);

    std::ofstream file_;
    std::ostream* echo_;
    int lines_ = 0;
};

}
