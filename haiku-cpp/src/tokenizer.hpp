#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace haiku {

// Split on literal ' ' only. Empty pieces are dropped; tabs and
// punctuation stay inside tokens.
std::vector<std::string> split_on_spaces(std::string_view line);

// Append the tokens of every line of `path` to `tokens`.
// Returns false (tokens untouched) if the file cannot be opened.
bool load_tokens(const std::string& path, std::vector<std::string>& tokens);

} // namespace haiku
