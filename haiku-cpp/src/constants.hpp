#pragma once

#include <string>
#include <string_view>

namespace haiku {

// Syllable budget of the three haiku lines
constexpr int LINE1_SYLLABLES = 5;
constexpr int LINE2_SYLLABLES = 7;
constexpr int LINE3_SYLLABLES = 5;

inline bool is_vowel(char c) {
    // 'y' is handled separately by the heuristic
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

inline bool is_punctuation(char c) {
    // Only the characters the normalizer strips, not general punctuation
    switch (c) {
        case '!': case '.': case '?': case ',':
        case ':': case ';': case '"': case '\'':
            return true;
        default:
            return false;
    }
}

inline bool is_ascii_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline char to_lower_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Lowercase + strip punctuation. Non-ASCII bytes pass through untouched.
inline std::string normalize_word(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (is_punctuation(c)) continue;
        out.push_back(to_lower_ascii(c));
    }
    return out;
}

} // namespace haiku
