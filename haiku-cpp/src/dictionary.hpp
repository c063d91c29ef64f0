#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <robin_hood.h>

namespace haiku {

using SyllableTable = robin_hood::unordered_flat_map<std::string, int>;

// Seed table of known syllable counts, keyed by normalized word.
// Every stored count is >= 1.
class Dictionary {
public:
    Dictionary() = default;

    // Load a hyphenation list ("word=hy-phen-a-tion" per line) or, for
    // *.json paths, a flat {"word": count} object.
    // Returns false if the file could not be opened or parsed.
    // When two lines normalize to the same key the first one is kept.
    bool load(const std::string& path);

    bool insert(std::string_view word, int syllables);

    std::optional<int> lookup(std::string_view word) const {
        auto it = entries_.find(std::string(word));
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(std::string_view word) const {
        return entries_.count(std::string(word)) > 0;
    }

    size_t size() const { return entries_.size(); }
    size_t malformed_lines() const { return malformed_; }

    const SyllableTable& entries() const { return entries_; }

private:
    SyllableTable entries_;
    size_t malformed_ = 0;

    bool load_hyphenated(const std::string& path);
    bool load_json(const std::string& path);
};

// Number of non-empty '-' separated pieces, e.g. "hy-phen-a-tion" -> 4
int count_hyphen_pieces(std::string_view hyphenated);

} // namespace haiku
