#pragma once

#include "snapshot.hpp"
#include <string>

namespace Engine {

// human readable multi-line summary of one pass, what the CLI prints
std::string formatReport(const PassResult& result);

}
