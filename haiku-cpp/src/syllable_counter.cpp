#include "syllable_counter.hpp"
#include "constants.hpp"
#include <regex>
#include <vector>

namespace haiku {

namespace {

// Two-letter vowel-sound clusters. Order matters: each pass runs on the
// word left over by the previous one, and the last two entries repeat.
const std::vector<std::regex>& diphthong_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex("ea|ee"),
        std::regex("ai|ei|a[^aeiou]e"),
        std::regex("ou|oo|u[^aeiou]e"),
        std::regex("ay"),
        std::regex("igh|ie|[aeiou]y[aeiou]"),
        std::regex("oi|oy"),
        std::regex("ai|ei|a[^aeiou]e"),
        std::regex("ou"),
    };
    return patterns;
}

const std::vector<std::regex>& triphthong_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex("aye"),
        std::regex("i[^aeiou]e"),
        std::regex("oya"),
        std::regex("ay"),
        std::regex("owe"),
    };
    return patterns;
}

const std::regex& trailing_le_pattern() {
    static const std::regex pattern("[a-z]+les?");
    return pattern;
}

// Cut the first match of `re` out of `working`
bool remove_first_match(std::string& working, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(working, m, re)) return false;
    size_t pos = static_cast<size_t>(m.position(0));
    size_t len = static_cast<size_t>(m.length(0));
    working.erase(pos, len);
    return true;
}

int remove_all_passes(std::string& working, const std::vector<std::regex>& patterns) {
    int removed = 0;
    for (const auto& re : patterns) {
        if (remove_first_match(working, re)) removed++;
    }
    return removed;
}

} // namespace

int heuristic_count(std::string_view word) {
    int num = 0;

    // 1. vowels
    for (char c : word) {
        if (is_vowel(c)) num++;
    }

    // 2. 'y' acting as a vowel
    if ((num == 0 && word.find('y') != std::string_view::npos) || ends_with(word, "y")) {
        num++;
    }

    // 3. silent 'e'
    if (ends_with(word, "e") && num != 0) {
        num--;
    }

    // 4. one syllable less per diphthong / triphthong
    std::string working(word);
    num -= remove_all_passes(working, diphthong_patterns());
    num -= remove_all_passes(working, triphthong_patterns());

    // 5. "-le" / "-les" is pronounced, checked on the untouched word
    if (std::regex_match(word.begin(), word.end(), trailing_le_pattern())) {
        num++;
    }

    return num;
}

SyllableEstimator::SyllableEstimator(const Dictionary& dict)
    : cache_(dict.entries())
{
}

int SyllableEstimator::count(std::string_view raw_token) {
    std::string word = normalize_word(raw_token);

    if (const int* hit = find_cached(word)) {
        return *hit;
    }

    // Past tense / "-es" plural of a known root
    if (word.size() >= 2) {
        if (const int* root = find_cached(word.substr(0, word.size() - 2))) {
            if (ends_with(word, "ed")) {
                return *root;
            }
            if (ends_with(word, "es")) {
                return *root + 1;
            }
        }
    }

    // Plain "-s" plural
    if (!word.empty() && word.back() == 's') {
        if (const int* root = find_cached(word.substr(0, word.size() - 1))) {
            return *root;
        }
    }

    int num = heuristic_count(word);
    // "" must never become a root for "ed", "es" or "s"
    if (!word.empty()) {
        cache_.emplace(std::move(word), num);
    }
    return num;
}

} // namespace haiku
