#include "errors.hpp"

namespace Core {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidCardFormat: return "InvalidCardFormat";
        case ErrorKind::InsufficientCards: return "InsufficientCards";
        case ErrorKind::DuplicateCard: return "DuplicateCard";
        case ErrorKind::StackParseFailure: return "StackParseFailure";
        case ErrorKind::ProbabilityEngineUnavailable: return "ProbabilityEngineUnavailable";
    }
    return "?";
}

InvalidCardFormat::InvalidCardFormat(const std::string& text)
    : std::invalid_argument("Invalid card format: '" + text + "'"), text_(text) {}

InsufficientCards::InsufficientCards(size_t given, size_t required)
    : std::invalid_argument("Insufficient cards: got " + std::to_string(given) +
                            ", need at least " + std::to_string(required)) {}

DuplicateCard::DuplicateCard(const std::string& cardText)
    : std::invalid_argument("Duplicate card: " + cardText) {}

}
