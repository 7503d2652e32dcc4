// main.cpp
#include "ClassifyArgs.hpp"
#include "RuleConfig.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

void print_help() {
    std::cout << "Usage:\n"
              << "  ./regexmap-classify <rules.json> [options] [--] [key ...]\n"
              << "  ./regexmap-classify -h, --help     Show this help message\n"
              << "\n"
              << "Keys are read one per line from stdin when none are given.\n"
              << "Use '-' as rules path to read it from $REGEXMAP_RULES.\n"
              << "\n"
              << "Options:\n"
              << "  --first    print only the first matching value\n"
              << "  --count    print the number of matching rules\n"
              << "  --hash     print the rule set hash and exit\n"
              << "  --         treat every later argument as a key\n";
}

struct ClassifyOptions {
    bool first = false;
    bool count = false;
};

// Desc: print one key and its matches as "key<TAB>result"
// In: const std::string& key, const MatchRange<std::string>& matches, const ClassifyOptions& opt
// Out: void
static void print_matches(const std::string& key, const MatchRange<std::string>& matches,
                          const ClassifyOptions& opt) {
    std::cout << key << '\t';
    if (opt.count) {
        std::cout << matches.size();
    } else if (opt.first) {
        if (const std::string* v = matches.first()) std::cout << *v;
    } else {
        bool sep = false;
        for (const auto& v : matches) {
            if (sep) std::cout << ',';
            std::cout << v;
            sep = true;
        }
    }
    std::cout << '\n';
}

// Desc: classify one key; keys the map rejects (non-UTF-8 text) are skipped
// In: const Map& map, const std::string& key, const ClassifyOptions& opt
// Out: void
template <class Map>
static void classify(const Map& map, const std::string& key, const ClassifyOptions& opt) {
    try {
        print_matches(key, map.get(key), opt);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[classify] skipped key: " << e.what() << "\n";
    }
}

template <class Map>
static int run(const Map& map, const std::vector<std::string>& keys, const ClassifyOptions& opt) {
    if (!keys.empty()) {
        for (const auto& k : keys) classify(map, k, opt);
        return 0;
    }
    std::string line;
    while (std::getline(std::cin, line)) classify(map, line, opt);
    return 0;
}

int main(int argc, char** argv) {
    // Handle help flag early
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        print_help();
        return argc < 2 ? 1 : 0;
    }

    std::string rules_path = argv[1];
    if (rules_path == "-") {
        const char* env = std::getenv("REGEXMAP_RULES");
        if (!env || !*env) {
            std::cerr << "[classify] '-' given but REGEXMAP_RULES is not set\n";
            return 1;
        }
        rules_path = env;
    }

    ClassifyArgs args;
    if (!parseClassifyArgs(std::vector<std::string>(argv + 2, argv + argc), args)) {
        print_help();
        return 1;
    }
    ClassifyOptions opt;
    opt.first = args.first;
    opt.count = args.count;

    RuleConfig cfg;
    if (!cfg.loadFromFile(rules_path)) {
        std::cerr << "[classify] aborted: cannot load " << rules_path << "\n";
        return 1;
    }

    if (args.hash) {
        std::cout << RuleConfig::hashCanonical(cfg.canonicalRulesJson()) << "\n";
        return 0;
    }

    try {
        if (cfg.getAlphabet() == RuleConfig::Alphabet::Bytes) {
            return run(cfg.buildBytesMap(), args.keys, opt);
        }
        return run(cfg.buildTextMap(), args.keys, opt);
    } catch (const PatternCompileError& e) {
        std::cerr << "[classify] " << e.what() << "\n";
        return 2;
    } catch (const std::runtime_error& e) {
        std::cerr << "[classify] " << e.what() << "\n";
        return 1;
    }
}
