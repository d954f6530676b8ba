#pragma once

#include "equity/equity_engine.hpp"
#include "ledger/tournament_ledger.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Config {

// CONFIGURATION
constexpr int DEFAULT_RIVER_SAMPLES = 200;
constexpr int DEFAULT_OPPONENT_SAMPLES = 100;
constexpr double DEFAULT_APPLY_CONFIDENCE = 0.5;
constexpr double DEFAULT_EMPTY_SEAT_CONFIDENCE = 0.3;

// active player estimate when nothing better is known, by community card count
constexpr int DEFAULT_ACTIVE_PREFLOP = 6;
constexpr int DEFAULT_ACTIVE_FLOP = 4;
constexpr int DEFAULT_ACTIVE_TURN = 3;
constexpr int DEFAULT_ACTIVE_RIVER = 3;

struct EngineConfig {
    int riverSamples = DEFAULT_RIVER_SAMPLES;
    int opponentSamples = DEFAULT_OPPONENT_SAMPLES;
    double applyConfidence = DEFAULT_APPLY_CONFIDENCE;
    double emptySeatConfidence = DEFAULT_EMPTY_SEAT_CONFIDENCE;
    std::optional<uint32_t> seed;   // unset: std::random_device
    std::string logFile;            // empty: no log file
    bool probabilityEnabled = true;
    bool verbose = false;

    Equity::EquitySettings equitySettings() const;
    Ledger::LedgerThresholds ledgerThresholds() const;
};

struct ConfigLoad {
    EngineConfig config;
    std::vector<std::string> warnings;   // unknown keys, malformed values
};

// key = value lines, '#' comments, blank lines ignored
ConfigLoad parseConfig(std::istream& in);

// missing file -> defaults plus a warning
ConfigLoad loadConfig(const std::string& path);

}
