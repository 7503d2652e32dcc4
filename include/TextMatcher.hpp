#pragma once
#include "PatternMatcherHS.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Multi-pattern matcher over UTF-8 text (HS_FLAG_UTF8 | HS_FLAG_UCP).
class TextMatcher {
public:
    using key_type = std::string_view;

    TextMatcher(std::vector<std::string> patterns, const PatternOptions& opts);

    // Both throw std::invalid_argument if key is not valid UTF-8.
    std::vector<std::size_t> matchAll(std::string_view key) const;
    bool isMatch(std::string_view key) const;

    size_t patternCount() const { return hs_.patternCount(); }
    const std::vector<std::string>& patterns() const { return hs_.patterns(); }
    const PatternOptions& options() const { return hs_.options(); }

private:
    static void requireUtf8_(std::string_view key);

    PatternMatcherHS hs_;
};
