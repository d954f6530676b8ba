// runs one analysis session over a snapshot file and prints a report per pass
#include "config/engine_config.hpp"
#include "engine/report.hpp"
#include "engine/session.hpp"
#include "io/snapshot_reader.hpp"
#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: kibitz <snapshots> [config]\n";
        return 2;
    }

    Config::EngineConfig config;
    if (argc == 3) {
        Config::ConfigLoad load = Config::loadConfig(argv[2]);
        for (const auto& w : load.warnings) {
            std::cerr << "[config] " << w << "\n";
        }
        config = load.config;
    }

    IO::SnapshotFile file;
    try {
        file = IO::readSnapshotFile(argv[1]);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    for (const auto& w : file.warnings) {
        std::cerr << "[input] " << w << "\n";
    }

    Engine::Session session(config);
    for (const auto& snapshot : file.snapshots) {
        std::cout << Engine::formatReport(session.analyze(snapshot)) << "\n";
    }

    std::cout << session.passCount() << " passes, "
              << session.tracker().handCount() << " hands, "
              << session.tournament().eliminations.size() << " eliminations\n";
    return 0;
}
