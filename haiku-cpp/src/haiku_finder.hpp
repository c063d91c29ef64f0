#pragma once

#include "syllable_counter.hpp"
#include <functional>
#include <vector>
#include <string>
#include <string_view>

namespace haiku {

// A token is a word iff it is one or more ASCII letters.
bool is_word(std::string_view token);

// Half-open token span [begin, end) with the first token of lines 2 and 3.
// Non-word tokens never appear inside a span.
struct Match {
    size_t begin = 0;
    size_t end = 0;
    size_t line2_begin = 0;
    size_t line3_begin = 0;
};

class HaikuScanner {
public:
    SyllableEstimator& estimator;

    explicit HaikuScanner(SyllableEstimator& est);

    // Streaming form: on_match is called in discovery order.
    // Returns the number of haikus found.
    size_t scan(const std::vector<std::string>& tokens,
                const std::function<void(const Match&)>& on_match);

    std::vector<Match> scan(const std::vector<std::string>& tokens);
};

// "tok tok tok " - single spaces, trailing separator included
std::string format_match(const std::vector<std::string>& tokens, const Match& match);

// The three haiku lines, tokens joined by single spaces
std::vector<std::string> format_lines(const std::vector<std::string>& tokens, const Match& match);

std::string format_summary(size_t haiku_count);

} // namespace haiku
