#pragma once
#include <string>
#include <vector>

// Options of regexmap-classify that follow the rules path.
struct ClassifyArgs {
    bool first = false;   // --first
    bool count = false;   // --count
    bool hash  = false;   // --hash
    std::vector<std::string> keys;
};

// Splits args into options and keys. Anything after "--" is a key.
// Returns false on an unknown "--option"; out is left default then.
bool parseClassifyArgs(const std::vector<std::string>& args, ClassifyArgs& out);
