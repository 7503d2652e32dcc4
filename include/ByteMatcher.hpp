#pragma once
#include "PatternMatcherHS.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

// Non-owning view of a raw byte key. No encoding is assumed.
struct ByteView {
    const char* data = nullptr;
    std::size_t size = 0;

    ByteView() = default;
    ByteView(const char* d, std::size_t n) : data(d), size(n) {}
    ByteView(const std::uint8_t* d, std::size_t n)
        : data(reinterpret_cast<const char*>(d)), size(n) {}
    ByteView(const char* cstr) : data(cstr), size(cstr ? std::strlen(cstr) : 0) {}
    ByteView(std::string_view s) : data(s.data()), size(s.size()) {}
    ByteView(const std::string& s) : data(s.data()), size(s.size()) {}
    ByteView(const std::vector<std::uint8_t>& v)
        : data(reinterpret_cast<const char*>(v.data())), size(v.size()) {}
};

// Multi-pattern matcher over arbitrary bytes.
class ByteMatcher {
public:
    using key_type = ByteView;

    ByteMatcher(std::vector<std::string> patterns, const PatternOptions& opts);

    std::vector<std::size_t> matchAll(ByteView key) const { return hs_.matchAll(key.data, key.size); }
    bool isMatch(ByteView key) const { return hs_.matches(key.data, key.size); }

    size_t patternCount() const { return hs_.patternCount(); }
    const std::vector<std::string>& patterns() const { return hs_.patterns(); }
    const PatternOptions& options() const { return hs_.options(); }

private:
    PatternMatcherHS hs_;
};
