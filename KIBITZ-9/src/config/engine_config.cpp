#include "engine_config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace Config {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<bool> parseBool(const std::string& v) {
    std::string l = lower(v);
    if (l == "true" || l == "1" || l == "yes" || l == "on") return true;
    if (l == "false" || l == "0" || l == "no" || l == "off") return false;
    return std::nullopt;
}

// whole string must be consumed
std::optional<long long> parseInt(const std::string& v) {
    try {
        size_t pos = 0;
        long long x = std::stoll(v, &pos);
        if (pos != v.size()) return std::nullopt;
        return x;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> parseDouble(const std::string& v) {
    try {
        size_t pos = 0;
        double x = std::stod(v, &pos);
        if (pos != v.size()) return std::nullopt;
        return x;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}

Equity::EquitySettings EngineConfig::equitySettings() const {
    Equity::EquitySettings s;
    s.maxRiverSamples = riverSamples;
    s.opponentSamples = opponentSamples;
    return s;
}

Ledger::LedgerThresholds EngineConfig::ledgerThresholds() const {
    Ledger::LedgerThresholds t;
    t.applyConfidence = applyConfidence;
    t.emptySeatConfidence = emptySeatConfidence;
    return t;
}

ConfigLoad parseConfig(std::istream& in) {
    ConfigLoad result;
    EngineConfig& cfg = result.config;

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            result.warnings.push_back("line " + std::to_string(lineNo) + ": expected key = value");
            continue;
        }
        std::string key = lower(trim(line.substr(0, eq)));
        std::string value = trim(line.substr(eq + 1));
        auto bad = [&]() {
            result.warnings.push_back("line " + std::to_string(lineNo) + ": bad value for " + key + ": '" + value + "'");
        };

        if (key == "river_samples" || key == "opponent_samples") {
            auto v = parseInt(value);
            if (!v || *v < 0) { bad(); continue; }
            (key == "river_samples" ? cfg.riverSamples : cfg.opponentSamples) = static_cast<int>(*v);
        } else if (key == "apply_confidence" || key == "empty_seat_confidence") {
            auto v = parseDouble(value);
            if (!v || *v < 0.0 || *v > 1.0) { bad(); continue; }
            (key == "apply_confidence" ? cfg.applyConfidence : cfg.emptySeatConfidence) = *v;
        } else if (key == "seed") {
            auto v = parseInt(value);
            if (!v || *v < 0 || *v > 0xFFFFFFFFLL) { bad(); continue; }
            cfg.seed = static_cast<uint32_t>(*v);
        } else if (key == "log_file") {
            cfg.logFile = value;
        } else if (key == "probability_enabled" || key == "verbose") {
            auto v = parseBool(value);
            if (!v) { bad(); continue; }
            (key == "verbose" ? cfg.verbose : cfg.probabilityEnabled) = *v;
        } else {
            result.warnings.push_back("line " + std::to_string(lineNo) + ": unknown key '" + key + "'");
        }
    }
    return result;
}

ConfigLoad loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        ConfigLoad result;
        result.warnings.push_back("cannot open " + path + ", using defaults");
        return result;
    }
    return parseConfig(in);
}

}
