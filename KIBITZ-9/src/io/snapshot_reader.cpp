#include "snapshot_reader.hpp"
#include "ledger/tournament_ledger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace IO {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    if (trim(value).empty()) return items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        items.push_back(trim(item));
    }
    // "As," still means two slots
    if (!value.empty() && value.back() == ',') items.push_back("");
    return items;
}

bool isEmpty(const Engine::Snapshot& s) {
    return s.heroCards.empty() && s.communityCards.empty() && !s.pot && !s.blinds &&
           !s.activeOpponentCardCount && s.seats.empty();
}

}

SnapshotFile readSnapshots(std::istream& in) {
    SnapshotFile file;
    Engine::Snapshot current;
    bool touched = false;

    auto flush = [&]() {
        if (touched || !isEmpty(current)) file.snapshots.push_back(current);
        current = Engine::Snapshot{};
        touched = false;
    };

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string text = trim(line);
        if (text.empty() || text[0] == '#') continue;
        if (text == "---") {
            flush();
            continue;
        }

        size_t eq = text.find('=');
        if (eq == std::string::npos) {
            file.warnings.push_back("line " + std::to_string(lineNo) + ": expected key=value");
            continue;
        }
        std::string key = trim(text.substr(0, eq));
        std::string value = trim(text.substr(eq + 1));
        touched = true;

        if (key == "hero") {
            current.heroCards = splitList(value);
        } else if (key == "board") {
            current.communityCards = splitList(value);
        } else if (key == "pot") {
            current.pot = value;
        } else if (key == "blinds") {
            current.blinds = value;
        } else if (key == "opponents") {
            try {
                current.activeOpponentCardCount = std::stoi(value);
            } catch (const std::invalid_argument&) {
                file.warnings.push_back("line " + std::to_string(lineNo) + ": bad opponent count '" + value + "'");
            } catch (const std::out_of_range&) {
                file.warnings.push_back("line " + std::to_string(lineNo) + ": bad opponent count '" + value + "'");
            }
        } else if (key.rfind("seat.", 0) == 0) {
            // seat.<SeatName>.name / seat.<SeatName>.stack
            size_t dot = key.rfind('.');
            std::string seatText = key.substr(5, dot == std::string::npos || dot < 5 ? 0 : dot - 5);
            std::string field = dot == std::string::npos ? "" : key.substr(dot + 1);
            std::optional<Ledger::SeatId> seat = Ledger::parseSeatName(seatText);
            if (!seat || (field != "name" && field != "stack")) {
                file.warnings.push_back("line " + std::to_string(lineNo) + ": unknown seat key '" + key + "'");
                continue;
            }
            Ledger::SeatText& entry = current.seats[*seat];
            if (field == "name") entry.name = value;
            else entry.stack = value;
        } else {
            file.warnings.push_back("line " + std::to_string(lineNo) + ": unknown key '" + key + "'");
        }
    }
    flush();
    return file;
}

SnapshotFile readSnapshotFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open snapshot file " + path);
    }
    return readSnapshots(in);
}

}
