#include "RuleConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>
#include <nlohmann/json.hpp>
using nlohmann::json;

// Desc: parse the "alphabet" name, ignoring ASCII case
// In: std::string name
// Out: bool (false if the name is unknown); sets out
static bool parseAlphabet(std::string name, RuleConfig::Alphabet& out) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "text")  { out = RuleConfig::Alphabet::Text;  return true; }
    if (name == "bytes") { out = RuleConfig::Alphabet::Bytes; return true; }
    return false;
}

// Desc: render a rule value as text (strings as-is, other scalars as JSON)
// In: const json& v
// Out: std::string
static std::string valueText(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

// Desc: read one boolean option if present
// In: const json& opts, const char* name, bool& out
// Out: bool (false if present but not a boolean)
static bool readFlag(const json& opts, const char* name, bool& out) {
    if (!opts.contains(name)) return true;
    if (!opts[name].is_boolean()) {
        std::cerr << "[RuleConfig] 'options." << name << "' must be a boolean\n";
        return false;
    }
    out = opts[name].get<bool>();
    return true;
}


void RuleConfig::clear_() {
    alphabet_ = Alphabet::Text;
    options_  = PatternOptions();
    rules_.clear();
}


bool RuleConfig::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[RuleConfig] cannot open file: " << config_path << "\n";
        clear_();
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return loadFromString(ss.str());
}


bool RuleConfig::loadFromString(const std::string& json_text) {
    clear_();

    json j;
    try { j = json::parse(json_text); }
    catch (const json::parse_error& e) { std::cerr << "[RuleConfig] invalid JSON: " << e.what() << "\n"; return false; }

    if (!j.is_object()) { std::cerr << "[RuleConfig] top level must be an object\n"; return false; }

    // alphabet
    Alphabet alphabet = Alphabet::Text;
    if (j.contains("alphabet")) {
        if (!j["alphabet"].is_string()) { std::cerr << "[RuleConfig] 'alphabet' must be a string\n"; return false; }
        const std::string a = j["alphabet"].get<std::string>();
        if (!parseAlphabet(a, alphabet)) {
            std::cerr << "[RuleConfig] 'alphabet' must be 'text' or 'bytes', got: " << a << "\n";
            return false;
        }
    }

    // options
    PatternOptions opts;
    if (j.contains("options")) {
        const auto& o = j["options"];
        if (!o.is_object()) { std::cerr << "[RuleConfig] 'options' must be an object\n"; return false; }
        if (!readFlag(o, "caseless", opts.caseless))   return false;
        if (!readFlag(o, "dotall", opts.dotall))       return false;
        if (!readFlag(o, "multiline", opts.multiline)) return false;
    }

    // rules (order preserved)
    if (!j.contains("rules") || !j["rules"].is_array()) {
        std::cerr << "[RuleConfig] missing or invalid 'rules' (array expected)\n";
        return false;
    }
    std::vector<std::pair<std::string, std::string>> rules;
    size_t idx = 0;
    for (const auto& r : j["rules"]) {
        const json* pat = nullptr;
        const json* val = nullptr;
        if (r.is_object() && r.contains("pattern") && r.contains("value")) {
            pat = &r["pattern"];
            val = &r["value"];
        } else if (r.is_array() && r.size() == 2) {
            pat = &r[0];
            val = &r[1];
        } else {
            std::cerr << "[RuleConfig] rule #" << idx << " must be {\"pattern\",\"value\"} or [pattern, value]\n";
            return false;
        }
        if (!pat->is_string()) {
            std::cerr << "[RuleConfig] rule #" << idx << ": 'pattern' must be a string\n";
            return false;
        }
        if (val->is_structured()) {
            std::cerr << "[RuleConfig] rule #" << idx << ": 'value' must be a scalar\n";
            return false;
        }
        // Accept as-is; Hyperscan will compile/validate later
        rules.emplace_back(pat->get<std::string>(), valueText(*val));
        ++idx;
    }
    if (rules.empty()) { std::cerr << "[RuleConfig] 'rules' must not be empty\n"; return false; }

    alphabet_ = alphabet;
    options_  = opts;
    rules_    = std::move(rules);
    #ifdef REGEXMAP_DEBUG
    std::cerr << "[RuleConfig] loaded " << rules_.size() << " rules\n";
    #endif
    return true;
}


RegexMap<std::string> RuleConfig::buildTextMap() const {
    return RegexMap<std::string>(rules_.begin(), rules_.end(), options_);
}

BytesRegexMap<std::string> RuleConfig::buildBytesMap() const {
    return BytesRegexMap<std::string>(rules_.begin(), rules_.end(), options_);
}


// Desc: build canonical JSON of the rule set (rule order is significant)
// In: (none)
// Out: std::string (JSON)
std::string RuleConfig::canonicalRulesJson() const {
    json c;
    c["alphabet"] = alphabet_ == Alphabet::Bytes ? "bytes" : "text";
    c["options"] = {
        {"caseless",  options_.caseless},
        {"dotall",    options_.dotall},
        {"multiline", options_.multiline}
    };
    json rules = json::array();
    for (const auto& r : rules_) rules.push_back(json::array({r.first, r.second}));
    c["rules"] = std::move(rules);
    return c.dump();
}

// Desc: FNV-1a 64-bit digest of data, zero-padded lowercase hex
// In: const std::string& data
// Out: std::string (16 hex digits)
std::string RuleConfig::hashCanonical(const std::string& data) {
    constexpr std::uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
    constexpr std::uint64_t kPrime       = 0x100000001b3ULL;

    const std::uint64_t digest = std::accumulate(
        data.begin(), data.end(), kOffsetBasis,
        [](std::uint64_t h, char c) { return (h ^ static_cast<unsigned char>(c)) * kPrime; });

    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << digest;
    return out.str();
}
