#pragma once

#include "haiku_finder.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace haiku {

// Scan result of one input text
struct InputResult {
    std::string input;
    std::vector<std::string> tokens;
    std::vector<Match> matches;
};

// One JSON object per haiku, one per line. Invalid UTF-8 in the input
// path or tokens is replaced rather than failing the dump.
void write_json_report(std::ostream& out, const std::vector<InputResult>& results);

// Returns false (after reporting to stderr) if `path` cannot be written.
bool save_json_report(const std::string& path, const std::vector<InputResult>& results);

} // namespace haiku
