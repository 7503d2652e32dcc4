#pragma once
#include "ByteMatcher.hpp"
#include "MatchRange.hpp"
#include "PatternCompileError.hpp"
#include "PatternMatcherHS.hpp"
#include "TextMatcher.hpp"
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// Associative container whose keys are regular expressions. get(key) yields
// the value of every pattern matching key, in declaration order.
//
// Matcher supplies the alphabet: a key_type, construction from
// (patterns, PatternOptions), matchAll(key) returning ascending indices,
// isMatch(key), patternCount() and patterns().
//
// Immutable once built; const lookups may run concurrently from any thread.
template <class Matcher, class V>
class BasicRegexMap {
public:
    using key_type    = typename Matcher::key_type;
    using mapped_type = V;
    using range_type  = MatchRange<V>;

    // Throws PatternCompileError if any expression is invalid.
    BasicRegexMap(std::initializer_list<std::pair<std::string, V>> items,
                  const PatternOptions& opts = PatternOptions())
        : BasicRegexMap(items.begin(), items.end(), opts) {}

    // Any input range of (expression, value) pairs; the expression only has
    // to be convertible to std::string. Values are moved out of rvalue items.
    template <class InputIt,
              class = typename std::iterator_traits<InputIt>::iterator_category>
    BasicRegexMap(InputIt first, InputIt last,
                  const PatternOptions& opts = PatternOptions())
        : BasicRegexMap(split_(first, last), opts) {}

    template <class Range>
    static BasicRegexMap fromRange(Range&& items, const PatternOptions& opts = PatternOptions()) {
        using std::begin;
        using std::end;
        return BasicRegexMap(begin(items), end(items), opts);
    }

    BasicRegexMap(BasicRegexMap&&) = default;
    BasicRegexMap& operator=(BasicRegexMap&&) = default;
    BasicRegexMap(const BasicRegexMap&) = delete;
    BasicRegexMap& operator=(const BasicRegexMap&) = delete;

    // Values of all patterns matching key. Each call is an independent range.
    range_type get(key_type key) const { return range_type(matcher_.matchAll(key), values_); }

    // True iff get(key) would be non-empty; stops at the first match.
    bool containsKey(key_type key) const { return matcher_.isMatch(key); }

    std::size_t size() const noexcept { return values_.size(); }
    bool empty() const noexcept { return values_.empty(); }

    const std::string& pattern(std::size_t i) const { return matcher_.patterns().at(i); }
    const V& value(std::size_t i) const { return values_.at(i); }
    const PatternOptions& options() const { return matcher_.options(); }

private:
    struct Parts {
        std::vector<std::string> exprs;
        std::vector<V>           values;
    };

    template <class InputIt>
    static Parts split_(InputIt first, InputIt last) {
        Parts parts;
        for (; first != last; ++first) {
            auto&& item = *first;
            parts.exprs.emplace_back(item.first);
            parts.values.push_back(std::forward<decltype(item)>(item).second);
        }
        return parts;
    }

    BasicRegexMap(Parts&& parts, const PatternOptions& opts)
        : matcher_(std::move(parts.exprs), opts), values_(std::move(parts.values)) {}

    Matcher        matcher_;
    std::vector<V> values_;   // values_[i] belongs to pattern i
};

template <class V>
using RegexMap = BasicRegexMap<TextMatcher, V>;

template <class V>
using BytesRegexMap = BasicRegexMap<ByteMatcher, V>;
