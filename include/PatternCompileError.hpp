#pragma once
#include <stdexcept>
#include <string>

// Thrown when a pattern set cannot be compiled into a matcher.
// patternIndex() is -1 when the failure is not tied to one expression.
class PatternCompileError : public std::runtime_error {
public:
    PatternCompileError(int pattern_index, const std::string& expression, const std::string& message)
        : std::runtime_error(format_(pattern_index, expression, message)),
          pattern_index_(pattern_index),
          expression_(expression),
          message_(message) {}

    int patternIndex() const noexcept { return pattern_index_; }
    const std::string& expression() const noexcept { return expression_; }
    const std::string& engineMessage() const noexcept { return message_; }

private:
    static std::string format_(int idx, const std::string& expr, const std::string& msg) {
        if (idx < 0) return "pattern set: " + msg;
        return "pattern #" + std::to_string(idx) + " '" + expr + "': " + msg;
    }

    int         pattern_index_;
    std::string expression_;
    std::string message_;
};
