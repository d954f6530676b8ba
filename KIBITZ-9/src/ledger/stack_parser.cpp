#include "stack_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <stdexcept>

namespace Ledger {

namespace {

const std::regex BB_PATTERN(R"((\d+(?:\.\d+)?)\s*BB)", std::regex::icase);
const std::regex THOUSANDS_PATTERN(R"((\d{1,3}(?:,\d{3})+))");
const std::regex SHORTHAND_PATTERN(R"((\d+(?:\.\d+)?)\s*[Kk])");
const std::regex PLAIN_PATTERN(R"((\d+))");
const std::regex AMOUNT_PATTERN(R"((\d+(?:\.\d+)?))");
const std::regex BLINDS_PATTERN(R"(\$?(\d+(?:\.\d+)?)\s*/\s*\$?(\d+(?:\.\d+)?))");

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string removeChar(std::string s, char c) {
    s.erase(std::remove(s.begin(), s.end(), c), s.end());
    return s;
}

// stoll / stod wrappers, an overflowing OCR string leaves the field unset
std::optional<long long> toInteger(const std::string& digits) {
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::optional<double> toDouble(const std::string& digits) {
    try {
        return std::stod(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

}

StackReading parseStack(const std::string& text) {
    StackReading reading;
    if (text.empty()) return reading;

    std::string rest = text;
    std::smatch m;

    if (std::regex_search(rest, m, BB_PATTERN)) {
        reading.bbSize = toDouble(m[1].str());
        rest = m.prefix().str() + " " + m.suffix().str();
    }

    if (std::regex_search(rest, m, THOUSANDS_PATTERN)) {
        reading.chips = toInteger(removeChar(m[1].str(), ','));
    }
    else if (std::regex_search(rest, m, SHORTHAND_PATTERN)) {
        auto value = toDouble(m[1].str());
        if (value) reading.chips = static_cast<long long>(std::llround(*value * 1000.0));
    }
    else if (std::regex_search(rest, m, PLAIN_PATTERN)) {
        reading.chips = toInteger(m[1].str());
    }

    return reading;
}

std::optional<std::string> cleanName(const std::string& text) {
    std::string cleaned;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '_') cleaned += static_cast<char>(c);
    }
    if (cleaned.size() > 2) return cleaned;
    return std::nullopt;
}

std::optional<double> parseAmount(const std::string& text) {
    if (text.empty()) return std::nullopt;

    // remove common prefixes/suffixes
    std::string cleaned = removeChar(removeChar(removeChar(text, '$'), ','), ' ');
    if (cleaned.empty()) return std::nullopt;

    // handle K/M suffixes
    double multiplier = 1.0;
    char last = cleaned.back();
    if (last == 'K' || last == 'k') {
        multiplier = 1000.0;
        cleaned.pop_back();
    } else if (last == 'M' || last == 'm') {
        multiplier = 1000000.0;
        cleaned.pop_back();
    }

    std::smatch m;
    if (!std::regex_search(cleaned, m, AMOUNT_PATTERN)) return std::nullopt;

    auto value = toDouble(m[1].str());
    if (!value) return std::nullopt;
    return *value * multiplier;
}

std::optional<Blinds> parseBlinds(const std::string& text) {
    std::string cleaned = removeChar(text, ',');
    std::smatch m;
    if (!std::regex_search(cleaned, m, BLINDS_PATTERN)) return std::nullopt;

    auto sb = toDouble(m[1].str());
    auto bb = toDouble(m[2].str());
    if (!sb || !bb || *bb <= 0.0 || *sb > *bb) return std::nullopt;
    return Blinds{ *sb, *bb };
}

bool isSittingOut(const std::string& nameText, const std::string& stackText) {
    std::string name = toLower(nameText);
    std::string stack = toLower(stackText);

    auto saysSittingOut = [](const std::string& s) {
        return s.find("sitting") != std::string::npos && s.find("out") != std::string::npos;
    };

    if (saysSittingOut(stack) || saysSittingOut(name)) return true;
    if (!isBlank(name) && isBlank(stack)) return true;
    return name.find("away") != std::string::npos || name.find("afk") != std::string::npos;
}

}
