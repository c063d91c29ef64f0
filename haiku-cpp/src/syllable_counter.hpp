#pragma once

#include "dictionary.hpp"
#include <string>
#include <string_view>

namespace haiku {

// Rule-based syllable count of an already normalized word. No lookups.
// The result is not clamped and can be zero or negative for odd inputs.
int heuristic_count(std::string_view word);

class SyllableEstimator {
public:
    // Pure heuristic, empty cache
    SyllableEstimator() = default;
    // Cache seeded with a copy of every dictionary entry
    explicit SyllableEstimator(const Dictionary& dict);

    // Main entry point. Lookup order: exact word, "-ed"/"-es" root,
    // "-s" root, then the heuristic (memoized).
    // Not thread-safe: use one estimator per thread.
    int count(std::string_view raw_token);

    bool is_cached(std::string_view word) const {
        return cache_.count(std::string(word)) > 0;
    }
    size_t cache_size() const { return cache_.size(); }

private:
    SyllableTable cache_;

    const int* find_cached(const std::string& word) const {
        auto it = cache_.find(word);
        return it != cache_.end() ? &it->second : nullptr;
    }
};

} // namespace haiku
