#include "haiku_finder.hpp"
#include "constants.hpp"

namespace haiku {

bool is_word(std::string_view token) {
    if (token.empty()) return false;
    for (char c : token) {
        if (!is_ascii_letter(c)) return false;
    }
    return true;
}

HaikuScanner::HaikuScanner(SyllableEstimator& est)
    : estimator(est)
{
}

size_t HaikuScanner::scan(const std::vector<std::string>& tokens,
                          const std::function<void(const Match&)>& on_match) {
    size_t found = 0;
    const size_t n = tokens.size();

    for (size_t i = 0; i < n; ++i) {
        if (!is_word(tokens[i])) continue;

        int count = estimator.count(tokens[i]);
        if (count > LINE1_SYLLABLES) continue;  // no haiku can start here

        int line1 = count;
        int line2 = 0;
        int line3 = 0;
        Match match;
        match.begin = i;
        match.line2_begin = n;
        match.line3_begin = n;

        // Grow the window anchored at i. Branches are checked in order and
        // only the first applicable one runs.
        for (size_t j = i + 1; j < n; ++j) {
            if (!is_word(tokens[j])) break;

            count = estimator.count(tokens[j]);
            if (count + line1 <= LINE1_SYLLABLES) {
                line1 += count;
            } else if (count + line2 <= LINE2_SYLLABLES && line1 == LINE1_SYLLABLES) {
                if (match.line2_begin == n) match.line2_begin = j;
                line2 += count;
            } else if (count + line3 <= LINE3_SYLLABLES && line2 == LINE2_SYLLABLES &&
                       line1 == LINE1_SYLLABLES) {
                if (match.line3_begin == n) match.line3_begin = j;
                line3 += count;
            } else if (line1 == LINE1_SYLLABLES && line2 == LINE2_SYLLABLES &&
                       line3 == LINE3_SYLLABLES) {
                // tokens[j] overflowed a complete haiku; it is not part of it
                match.end = j;
                on_match(match);
                found++;
                break;
            } else {
                break;
            }
        }
    }
    return found;
}

std::vector<Match> HaikuScanner::scan(const std::vector<std::string>& tokens) {
    std::vector<Match> matches;
    scan(tokens, [&matches](const Match& m) { matches.push_back(m); });
    return matches;
}

std::string format_match(const std::vector<std::string>& tokens, const Match& match) {
    std::string out;
    for (size_t k = match.begin; k < match.end && k < tokens.size(); ++k) {
        out += tokens[k];
        out += ' ';
    }
    return out;
}

std::vector<std::string> format_lines(const std::vector<std::string>& tokens, const Match& match) {
    const size_t bounds[4] = {match.begin, match.line2_begin, match.line3_begin, match.end};
    std::vector<std::string> lines;
    lines.reserve(3);
    for (int l = 0; l < 3; ++l) {
        std::string line;
        for (size_t k = bounds[l]; k < bounds[l + 1] && k < tokens.size(); ++k) {
            if (!line.empty()) line += ' ';
            line += tokens[k];
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string format_summary(size_t haiku_count) {
    return "Found " + std::to_string(haiku_count) + " haikus.";
}

} // namespace haiku
