#include "PatternMatcherHS.hpp"
#include "PatternCompileError.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {
    struct TlsScratchFree {
        void operator()(hs_scratch_t* s) const noexcept { hs_free_scratch(s); }
    };
    // One scratch per thread, shared by every database the thread scans.
    thread_local std::unique_ptr<hs_scratch_t, TlsScratchFree> tls_scratch;
}


// Desc: compile all patterns into one block-mode database and allocate base scratch
// In: std::vector<std::string> patterns, unsigned alphabet_flags, const PatternOptions& opts
// Out: (ctor); throws PatternCompileError on invalid syntax, std::runtime_error on HS failure
PatternMatcherHS::PatternMatcherHS(std::vector<std::string> patterns,
                                   unsigned alphabet_flags,
                                   const PatternOptions& opts)
    : patterns_(std::move(patterns)), options_(opts) {
    // No patterns: no database, matches() is trivially false
    if (patterns_.empty()) return;

    if (patterns_.size() > std::numeric_limits<unsigned>::max()) {
        throw PatternCompileError(-1, std::string(), "too many patterns");
    }

    unsigned common = HS_FLAG_SINGLEMATCH | HS_FLAG_ALLOWEMPTY | alphabet_flags;
    if (opts.caseless)  common |= HS_FLAG_CASELESS;
    if (opts.dotall)    common |= HS_FLAG_DOTALL;
    if (opts.multiline) common |= HS_FLAG_MULTILINE;

    std::vector<const char*> cpat;
    std::vector<unsigned>    flags;
    std::vector<unsigned>    ids;
    cpat.reserve(patterns_.size());
    flags.reserve(patterns_.size());
    ids.reserve(patterns_.size());
    for (size_t i = 0; i < patterns_.size(); ++i) {
        // hs_compile_multi takes NUL-terminated expressions
        if (patterns_[i].find('\0') != std::string::npos) {
            throw PatternCompileError(static_cast<int>(i), patterns_[i],
                                      "embedded NUL byte (write it as \\x00)");
        }
        cpat.push_back(patterns_[i].c_str());
        flags.push_back(common);
        ids.push_back(static_cast<unsigned>(i));
    }

    hs_database_t*      db = nullptr;
    hs_compile_error_t* ce = nullptr;
    hs_error_t rc = hs_compile_multi(
        cpat.data(),
        flags.data(),
        ids.data(),
        static_cast<unsigned>(cpat.size()),
        HS_MODE_BLOCK,
        nullptr,
        &db,
        &ce
    );

    if (rc != HS_SUCCESS) {
        const std::string msg = (ce && ce->message) ? ce->message : "compile failed (unknown)";
        const int idx = ce ? ce->expression : -1;
        if (ce) hs_free_compile_error(ce);
        #ifdef REGEXMAP_DEBUG
        std::cerr << "[PatternMatcherHS] compile failed at #" << idx << ": " << msg << "\n";
        #endif
        const bool known = idx >= 0 && static_cast<size_t>(idx) < patterns_.size();
        throw PatternCompileError(known ? idx : -1,
                                  known ? patterns_[idx] : std::string(),
                                  msg);
    }
    if (ce) hs_free_compile_error(ce);
    db_.reset(db);

    hs_scratch_t* scratch = nullptr;
    rc = hs_alloc_scratch(db_.get(), &scratch);
    if (rc != HS_SUCCESS) {
        std::cerr << "[PatternMatcherHS] hs_alloc_scratch failed: " << rc << "\n";
        throw std::runtime_error("PatternMatcherHS: hs_alloc_scratch failed");
    }
    base_scratch_.reset(scratch);

    #ifdef REGEXMAP_DEBUG
    size_t db_bytes = 0;
    hs_database_size(db_.get(), &db_bytes);
    std::cerr << "[PatternMatcherHS] compiled " << patterns_.size()
              << " patterns, database " << db_bytes << " bytes\n";
    #endif
}


// Desc: return this thread's scratch, cloning or growing it for db_ as needed
// In: (none)
// Out: hs_scratch_t* (owned by the thread); throws std::runtime_error on HS failure
hs_scratch_t* PatternMatcherHS::threadScratch_() const {
    hs_scratch_t* s = tls_scratch.get();
    if (!s) {
        if (hs_clone_scratch(base_scratch_.get(), &s) != HS_SUCCESS) {
            std::cerr << "[PatternMatcherHS] hs_clone_scratch failed\n";
            throw std::runtime_error("PatternMatcherHS: hs_clone_scratch failed");
        }
        tls_scratch.reset(s);
        return s;
    }

    // No-op when the scratch is already large enough for db_
    hs_error_t rc = regrow_scratch(tls_scratch, db_.get(), hs_alloc_scratch);
    if (rc != HS_SUCCESS) {
        // tls_scratch is empty now; the next lookup clones a fresh one
        std::cerr << "[PatternMatcherHS] hs_alloc_scratch (grow) failed: " << rc << "\n";
        throw std::runtime_error("PatternMatcherHS: hs_alloc_scratch failed");
    }
    return tls_scratch.get();
}


// Desc: run one block-mode scan of data[0, len) over db_
// In: const char* data, size_t len, match_event_handler on_match, void* ctx
// Out: void; throws std::length_error for oversize keys, std::runtime_error on scan error
void PatternMatcherHS::scan_(const char* data, std::size_t len,
                             match_event_handler on_match, void* ctx) const {
    if (len > std::numeric_limits<unsigned int>::max()) {
        throw std::length_error("PatternMatcherHS: key longer than 4 GiB");
    }
    static const char kEmpty[] = "";

    hs_error_t rc = hs_scan(
        db_.get(),
        data ? data : kEmpty,
        static_cast<unsigned int>(len),
        0,
        threadScratch_(),
        on_match,
        ctx
    );

    if (rc != HS_SUCCESS && rc != HS_SCAN_TERMINATED) {
        std::cerr << "[PatternMatcherHS] hs_scan error: " << rc << "\n";
        throw std::runtime_error("PatternMatcherHS: hs_scan failed with code " + std::to_string(rc));
    }
}


// Desc: collect the ids of all matching patterns
// In: const char* data, size_t len
// Out: std::vector<size_t> (ascending, no duplicates)
std::vector<std::size_t> PatternMatcherHS::matchAll(const char* data, std::size_t len) const {
    std::vector<std::size_t> ids;
    if (!db_) return ids;

    // SINGLEMATCH bounds the reports by the pattern count, so the callback never reallocates
    ids.reserve(patterns_.size());
    auto on_match = [](unsigned int id, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        static_cast<std::vector<std::size_t>*>(ctx)->push_back(id);
        return 0;
    };
    scan_(data, len, on_match, &ids);

    // reports arrive in match-offset order
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}


// Desc: stop at the first report of any pattern
// In: const char* data, size_t len
// Out: bool (true if any pattern matches)
bool PatternMatcherHS::matches(const char* data, std::size_t len) const {
    if (!db_) return false;

    bool matched = false;
    auto on_match = [](unsigned int, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        *static_cast<bool*>(ctx) = true;
        return HS_SCAN_TERMINATED;
    };
    scan_(data, len, on_match, &matched);
    return matched;
}
