#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <hs/hs.h>

// Compile-time switches applied to every pattern of a set.
struct PatternOptions {
    bool caseless  = false;   // HS_FLAG_CASELESS
    bool dotall    = false;   // HS_FLAG_DOTALL
    bool multiline = false;   // HS_FLAG_MULTILINE
};

// Grow an owned scratch for db with alloc (hs_alloc_scratch signature).
// alloc frees the old block whenever it writes a different pointer back,
// including the null it writes on failure, so owner never keeps a freed block.
template <class ScratchPtr, class AllocFn>
hs_error_t regrow_scratch(ScratchPtr& owner, const hs_database_t* db, AllocFn alloc) {
    hs_scratch_t* s = owner.get();
    hs_error_t rc = alloc(db, &s);
    if (s != owner.get()) {
        (void)owner.release();
        owner.reset(s);
    }
    return rc;
}

// High-performance multi-regex matcher built on Hyperscan (block mode).
// Pattern i is compiled with id i and reports at most once per scan.
class PatternMatcherHS {
public:
    // Compiles all patterns at once; throws PatternCompileError on bad syntax.
    // alphabet_flags is OR-ed into every pattern's flags (e.g. HS_FLAG_UTF8).
    PatternMatcherHS(std::vector<std::string> patterns,
                     unsigned alphabet_flags,
                     const PatternOptions& opts);

    PatternMatcherHS(PatternMatcherHS&&) noexcept = default;
    PatternMatcherHS& operator=(PatternMatcherHS&&) noexcept = default;
    PatternMatcherHS(const PatternMatcherHS&) = delete;
    PatternMatcherHS& operator=(const PatternMatcherHS&) = delete;

    // Ascending ids of every pattern that matches data[0, len).
    std::vector<std::size_t> matchAll(const char* data, std::size_t len) const;

    // Fast boolean check: does any pattern match data[0, len)?
    bool matches(const char* data, std::size_t len) const;

    size_t patternCount() const { return patterns_.size(); }
    const std::vector<std::string>& patterns() const { return patterns_; }
    const PatternOptions& options() const { return options_; }

private:
    struct DatabaseFree {
        void operator()(hs_database_t* db) const noexcept { hs_free_database(db); }
    };
    struct ScratchFree {
        void operator()(hs_scratch_t* s) const noexcept { hs_free_scratch(s); }
    };

    // Scratch owned by the calling thread, sized for db_.
    hs_scratch_t* threadScratch_() const;
    void scan_(const char* data, std::size_t len, match_event_handler on_match, void* ctx) const;

    std::vector<std::string> patterns_;
    PatternOptions           options_;
    // Both null when the set is empty.
    std::unique_ptr<hs_database_t, DatabaseFree> db_;
    std::unique_ptr<hs_scratch_t, ScratchFree>   base_scratch_;
};
