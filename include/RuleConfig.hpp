#pragma once
#include "RegexMap.hpp"
#include <string>
#include <utility>
#include <vector>

// Ordered (pattern, value) rule set loaded from a JSON document.
class RuleConfig {
public:
    enum class Alphabet { Text, Bytes };

    // Both return false (and log to std::cerr) on any error; the config is
    // left empty in that case.
    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& json_text);

    Alphabet getAlphabet() const { return alphabet_; }
    const PatternOptions& getOptions() const { return options_; }
    const std::vector<std::pair<std::string, std::string>>& getRules() const { return rules_; }

    // Throw PatternCompileError when a rule's pattern is invalid.
    RegexMap<std::string> buildTextMap() const;
    BytesRegexMap<std::string> buildBytesMap() const;

    std::string canonicalRulesJson() const;
    static std::string hashCanonical(const std::string& data);

private:
    void clear_();

    Alphabet alphabet_ = Alphabet::Text;
    PatternOptions options_;
    std::vector<std::pair<std::string, std::string>> rules_;
};
