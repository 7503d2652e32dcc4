#include "RegexMap.hpp"

#include <atomic>
#include <iterator>
#include <list>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace {

template <class V>
std::vector<V> collect(const MatchRange<V>& r) {
    return std::vector<V>(r.begin(), r.end());
}

RegexMap<int> fooBarMap() {
    return RegexMap<int>{
        {"foo", 1},
        {"bar", 2},
        {"foobar", 3},
        {"^foo$", 4},
        {"^bar$", 5},
        {"^foobar$", 6},
    };
}

TEST(RegexMapTest, ReturnsMatchesInDeclarationOrder) {
    const auto map = fooBarMap();
    EXPECT_EQ(collect(map.get("foo")), (std::vector<int>{1, 4}));
    EXPECT_EQ(collect(map.get("bar")), (std::vector<int>{2, 5}));
    EXPECT_EQ(collect(map.get("foobar")), (std::vector<int>{1, 2, 3, 6}));
    EXPECT_EQ(collect(map.get("XXX foo XXX")), (std::vector<int>{1}));
    EXPECT_EQ(collect(map.get("XXX bar XXX")), (std::vector<int>{2}));
}

TEST(RegexMapTest, FirstMatch) {
    const RegexMap<int> map{{"foo", 1}, {"bar", 2}};
    auto r = map.get("foo");
    ASSERT_NE(r.begin(), r.end());
    EXPECT_EQ(*r.begin(), 1);
    ASSERT_NE(r.first(), nullptr);
    EXPECT_EQ(*r.first(), 1);

    // later pattern matching earlier in the key still comes second
    auto both = map.get("bar foo");
    ASSERT_NE(both.first(), nullptr);
    EXPECT_EQ(*both.first(), 1);
}

TEST(RegexMapTest, NoMatch) {
    const RegexMap<int> map{{"foo", 1}};
    EXPECT_FALSE(map.containsKey("baz"));
    auto r = map.get("baz");
    EXPECT_TRUE(r.empty());
    EXPECT_EQ(r.size(), 0u);
    EXPECT_EQ(r.begin(), r.end());
    EXPECT_EQ(r.first(), nullptr);
}

TEST(RegexMapTest, InvalidPatternFailsConstruction) {
    EXPECT_THROW((RegexMap<int>{{"(", 1}}), PatternCompileError);

    try {
        RegexMap<int> map{{"ok", 1}, {"(", 2}, {"fine", 3}};
        FAIL() << "construction should have thrown";
    } catch (const PatternCompileError& e) {
        EXPECT_EQ(e.patternIndex(), 1);
        EXPECT_EQ(e.expression(), "(");
        EXPECT_FALSE(e.engineMessage().empty());
        EXPECT_NE(std::string(e.what()).find("pattern #1"), std::string::npos);
    }
}

TEST(RegexMapTest, SizeMatchesPairsSupplied) {
    const auto map = fooBarMap();
    EXPECT_EQ(map.size(), 6u);
    EXPECT_FALSE(map.empty());
    EXPECT_EQ(map.pattern(2), "foobar");
    EXPECT_EQ(map.value(2), 3);
    EXPECT_THROW(map.pattern(6), std::out_of_range);
    EXPECT_THROW(map.value(6), std::out_of_range);
}

TEST(RegexMapTest, RepeatedLookupsAreIdentical) {
    const auto map = fooBarMap();
    const auto first = collect(map.get("foobar"));
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(collect(map.get("foobar")), first);
    }

    // two live ranges from the same map do not interfere
    auto a = map.get("foo");
    auto b = map.get("bar");
    EXPECT_EQ(collect(a), (std::vector<int>{1, 4}));
    EXPECT_EQ(collect(b), (std::vector<int>{2, 5}));
}

TEST(RegexMapTest, ContainsKeyAgreesWithGet) {
    const auto map = fooBarMap();
    for (const char* key : {"foo", "bar", "foobar", "fo", "", "xbarx", "FOO", "ba r"}) {
        EXPECT_EQ(map.containsKey(key), !map.get(key).empty()) << "key: " << key;
    }
}

TEST(RegexMapTest, PatternContributesOncePerLookup) {
    const RegexMap<std::string> map{{"o", "oh"}, {"x", "ex"}};
    EXPECT_EQ(collect(map.get("foo boo zoo")), (std::vector<std::string>{"oh"}));
    EXPECT_EQ(map.get("xoxoxo").indices(), (std::vector<std::size_t>{0, 1}));
}

TEST(RegexMapTest, DuplicatePatternsKeepTheirOwnValues) {
    const RegexMap<int> map{{"foo", 1}, {"foo", 2}, {"foo", 3}};
    EXPECT_EQ(collect(map.get("foo")), (std::vector<int>{1, 2, 3}));
}

TEST(RegexMapTest, EmptyMapMatchesNothing) {
    const std::vector<std::pair<std::string, int>> none;
    const auto map = RegexMap<int>::fromRange(none);
    EXPECT_TRUE(map.empty());
    EXPECT_EQ(map.size(), 0u);
    EXPECT_TRUE(map.get("anything").empty());
    EXPECT_FALSE(map.containsKey("anything"));
    EXPECT_FALSE(map.containsKey(""));
}

TEST(RegexMapTest, EmptyMatchingPatternsMatchEveryKey) {
    const RegexMap<int> map{{"", 1}, {"^$", 2}, {"a*", 3}};
    EXPECT_EQ(collect(map.get("anything")), (std::vector<int>{1, 3}));
    EXPECT_EQ(collect(map.get("")), (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(map.containsKey("zzz"));
}

TEST(RegexMapTest, BuildsFromRanges) {
    const std::vector<std::pair<std::string, int>> vec{{"^a", 10}, {"b$", 20}};
    const auto from_vec = RegexMap<int>::fromRange(vec);
    EXPECT_EQ(collect(from_vec.get("ab")), (std::vector<int>{10, 20}));

    const std::list<std::pair<const char*, int>> lst{{"x", 1}, {"y", 2}};
    const RegexMap<int> from_list(lst.begin(), lst.end());
    EXPECT_EQ(collect(from_list.get("yx")), (std::vector<int>{1, 2}));

    // std::map iterates in key order
    const std::map<std::string, int> ordered{{"zeta", 3}, {"alpha", 1}, {"mid", 2}};
    const auto from_map = RegexMap<int>::fromRange(ordered);
    EXPECT_EQ(from_map.pattern(0), "alpha");
    EXPECT_EQ(collect(from_map.get("alpha mid zeta")), (std::vector<int>{1, 2, 3}));
}

TEST(RegexMapTest, MoveOnlyValues) {
    std::vector<std::pair<std::string, std::unique_ptr<int>>> items;
    items.emplace_back("one", std::make_unique<int>(1));
    items.emplace_back("two", std::make_unique<int>(2));

    const RegexMap<std::unique_ptr<int>> map(std::make_move_iterator(items.begin()),
                                             std::make_move_iterator(items.end()));
    auto r = map.get("one two");
    ASSERT_EQ(r.size(), 2u);
    auto it = r.begin();
    EXPECT_EQ(**it, 1);
    ++it;
    EXPECT_EQ(**it, 2);
    EXPECT_FALSE(items[0].second);
}

TEST(RegexMapTest, MovedMapKeepsWorking) {
    auto map = fooBarMap();
    RegexMap<int> moved(std::move(map));
    EXPECT_EQ(collect(moved.get("foobar")), (std::vector<int>{1, 2, 3, 6}));
}

TEST(RegexMapTest, CaselessOption) {
    PatternOptions opts;
    opts.caseless = true;
    const RegexMap<int> loose({{"^hello$", 1}, {"world", 2}}, opts);
    EXPECT_TRUE(loose.options().caseless);
    EXPECT_EQ(collect(loose.get("HeLLo")), (std::vector<int>{1}));
    EXPECT_TRUE(loose.containsKey("WORLD"));

    const RegexMap<int> strict{{"^hello$", 1}};
    EXPECT_FALSE(strict.containsKey("HELLO"));
}

TEST(RegexMapTest, DotallAndMultilineOptions) {
    PatternOptions dotall;
    dotall.dotall = true;
    EXPECT_TRUE((RegexMap<int>({{"a.b", 1}}, dotall)).containsKey("a\nb"));
    EXPECT_FALSE((RegexMap<int>{{"a.b", 1}}).containsKey("a\nb"));

    PatternOptions multiline;
    multiline.multiline = true;
    EXPECT_TRUE((RegexMap<int>({{"^second$", 1}}, multiline)).containsKey("first\nsecond\nthird"));
    EXPECT_FALSE((RegexMap<int>{{"^second$", 1}}).containsKey("first\nsecond\nthird"));
}

TEST(RegexMapTest, UnicodeKeys) {
    const RegexMap<int> map{{"^.$", 1}, {"^\\p{L}+$", 2}, {"\xc3\xa9", 3}};
    // one code point, two bytes
    EXPECT_EQ(collect(map.get("\xc3\xa9")), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(collect(map.get("h\xc3\xa9llo")), (std::vector<int>{2, 3}));
    EXPECT_TRUE(map.get("12").empty());
}

TEST(RegexMapTest, RejectsInvalidUtf8Keys) {
    const RegexMap<int> map{{"a", 1}};
    EXPECT_THROW(map.get("a\xff"), std::invalid_argument);
    EXPECT_THROW(map.containsKey("\xc3"), std::invalid_argument);
    EXPECT_NO_THROW(map.get("a\xc3\xa9"));
}

TEST(RegexMapTest, UnsupportedConstructsFailConstruction) {
    EXPECT_THROW((RegexMap<int>{{"(a)\\1", 1}}), PatternCompileError);
    EXPECT_THROW((RegexMap<int>{{"[z-a]", 1}}), PatternCompileError);
}

TEST(RegexMapTest, ConcurrentLookups) {
    const auto map = fooBarMap();
    const std::vector<std::pair<std::string, std::vector<int>>> expected{
        {"foo", {1, 4}},
        {"bar", {2, 5}},
        {"foobar", {1, 2, 3, 6}},
        {"XXX foo XXX", {1}},
        {"nothing", {}},
    };

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 500; ++i) {
                const auto& e = expected[static_cast<size_t>(i) % expected.size()];
                if (collect(map.get(e.first)) != e.second) ++mismatches;
                if (map.containsKey(e.first) == e.second.empty()) ++mismatches;
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(mismatches.load(), 0);
}

TEST(RegexMapTest, MapsOfDifferentSizesShareAThread) {
    std::vector<std::pair<std::string, int>> many;
    for (int i = 0; i < 200; ++i) {
        many.emplace_back("token" + std::to_string(i) + "[a-z]{2,8}\\d+", i);
    }
    const RegexMap<int> small{{"x", 1}};
    const auto large = RegexMap<int>::fromRange(many);

    for (int round = 0; round < 3; ++round) {
        EXPECT_EQ(collect(small.get("xyz")), (std::vector<int>{1}));
        EXPECT_EQ(collect(large.get("token42abc7")), (std::vector<int>{42}));
    }
}

}  // namespace
