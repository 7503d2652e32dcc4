#include "TextMatcher.hpp"
#include "Utf8.hpp"
#include <stdexcept>
#include <utility>

TextMatcher::TextMatcher(std::vector<std::string> patterns, const PatternOptions& opts)
    : hs_(std::move(patterns), HS_FLAG_UTF8 | HS_FLAG_UCP, opts) {}

// Desc: reject keys the engine cannot scan in UTF-8 mode
// In: std::string_view key
// Out: void; throws std::invalid_argument
void TextMatcher::requireUtf8_(std::string_view key) {
    if (!is_valid_utf8(key.data(), key.size())) {
        throw std::invalid_argument("TextMatcher: key is not valid UTF-8");
    }
}

std::vector<std::size_t> TextMatcher::matchAll(std::string_view key) const {
    requireUtf8_(key);
    return hs_.matchAll(key.data(), key.size());
}

bool TextMatcher::isMatch(std::string_view key) const {
    requireUtf8_(key);
    return hs_.matches(key.data(), key.size());
}
