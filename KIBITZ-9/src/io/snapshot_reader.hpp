#pragma once

#include "engine/snapshot.hpp"
#include <istream>
#include <string>
#include <vector>

namespace IO {

struct SnapshotFile {
    std::vector<Engine::Snapshot> snapshots;
    std::vector<std::string> warnings;   // lines that were skipped, with their line number
};

/*
 Plain text snapshot list, one key=value per line:
   hero=As,Kd
   board=Qh,Jh,Tc
   pot=$1,200
   blinds=100/200
   opponents=3
   seat.Position_1.name=Bob
   seat.Position_1.stack=1,500
 '---' ends a snapshot, '#' starts a comment. Empty list items ("As,,Kd")
 are kept as not-recognized slots.
*/
SnapshotFile readSnapshots(std::istream& in);

SnapshotFile readSnapshotFile(const std::string& path);

}
