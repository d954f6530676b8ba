#pragma once

#include <optional>
#include <string>

namespace Ledger {

// what a recognized stack string turned into - unset fields mean "could not parse", never zero
struct StackReading {
    std::optional<long long> chips;
    std::optional<double> bbSize;

    bool hasChips() const { return chips.has_value(); }
};

struct Blinds {
    double smallBlind;
    double bigBlind;
};

/*
 Parses recognized stack text, chip patterns tried in order, first match wins:
 1. thousands separated integer ("1,500")
 2. K shorthand, times 1000 ("12.5K")
 3. plain integer ("750")
 Big blind size is read separately ("85.5 BB", "99BB") and removed before
 the chip patterns run, so a pure BB figure never turns into a chip count.
*/
StackReading parseStack(const std::string& text);

// keeps [A-Za-z0-9_] only, accepted if more than 2 characters survive
std::optional<std::string> cleanName(const std::string& text);

// "$1,234.50", "52.20", "1.2K", "3M"
std::optional<double> parseAmount(const std::string& text);

// "100/200", "$0.25/$0.50", "Blinds 50 / 100"
std::optional<Blinds> parseBlinds(const std::string& text);

// "Sitting Out" text in either field, a name without a stack, or an away/afk tag
bool isSittingOut(const std::string& nameText, const std::string& stackText);

}
