#include "ByteMatcher.hpp"
#include <utility>

// Byte alphabet: no UTF-8 mode, '.' and classes consume single bytes
ByteMatcher::ByteMatcher(std::vector<std::string> patterns, const PatternOptions& opts)
    : hs_(std::move(patterns), 0u, opts) {}
