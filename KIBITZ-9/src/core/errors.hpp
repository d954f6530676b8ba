#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace Core {

// every non-fatal failure a pass can report
enum class ErrorKind : uint8_t {
    InvalidCardFormat,
    InsufficientCards,
    DuplicateCard,
    StackParseFailure,
    ProbabilityEngineUnavailable
};

std::string errorKindName(ErrorKind kind);

// one entry of the per-pass diagnostics list
struct Diagnostic {
    ErrorKind kind;
    std::string message;
};

// unparseable card text, the caller treats the slot as not recognized
class InvalidCardFormat : public std::invalid_argument {
public:
    explicit InvalidCardFormat(const std::string& text);
    const std::string& text() const { return text_; }
private:
    std::string text_;
};

// evaluator called with too few cards (caller bug)
class InsufficientCards : public std::invalid_argument {
public:
    InsufficientCards(size_t given, size_t required);
};

// same card passed twice (caller bug, or the recognizer read one card twice)
class DuplicateCard : public std::invalid_argument {
public:
    explicit DuplicateCard(const std::string& cardText);
};

}
