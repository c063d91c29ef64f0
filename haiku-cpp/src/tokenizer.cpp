#include "tokenizer.hpp"
#include <fstream>
#include <iostream>

namespace haiku {

std::vector<std::string> split_on_spaces(std::string_view line) {
    // remove potential carriage return
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    std::vector<std::string> tokens;
    size_t start = 0;
    while (start < line.size()) {
        size_t space = line.find(' ', start);
        if (space == std::string_view::npos) space = line.size();
        if (space > start) {
            tokens.emplace_back(line.substr(start, space - start));
        }
        start = space + 1;
    }
    return tokens;
}

bool load_tokens(const std::string& path, std::vector<std::string>& tokens) {
    std::ifstream infile(path);
    if (!infile.is_open()) {
        std::cerr << "Error opening input file: " << path << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(infile, line)) {
        for (auto& tok : split_on_spaces(line)) {
            tokens.push_back(std::move(tok));
        }
    }
    return true;
}

} // namespace haiku
