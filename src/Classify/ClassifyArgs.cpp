#include "ClassifyArgs.hpp"
#include <iostream>
#include <utility>

// Desc: parse the options and keys given after the rules path
// In: const std::vector<std::string>& args, ClassifyArgs& out
// Out: bool (false on an unknown option)
bool parseClassifyArgs(const std::vector<std::string>& args, ClassifyArgs& out) {
    ClassifyArgs parsed;
    bool only_keys = false;
    for (const auto& a : args) {
        if (only_keys)           parsed.keys.push_back(a);
        else if (a == "--")      only_keys = true;
        else if (a == "--first") parsed.first = true;
        else if (a == "--count") parsed.count = true;
        else if (a == "--hash")  parsed.hash = true;
        else if (a.compare(0, 2, "--") == 0) {
            std::cerr << "[classify] unknown option: " << a << "\n";
            out = ClassifyArgs();
            return false;
        }
        else parsed.keys.push_back(a);
    }
    out = std::move(parsed);
    return true;
}
