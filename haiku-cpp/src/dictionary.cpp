#include "dictionary.hpp"
#include "constants.hpp"
#include <iostream>
#include <fstream>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>

namespace haiku {

int count_hyphen_pieces(std::string_view hyphenated) {
    int pieces = 0;
    size_t start = 0;
    while (start <= hyphenated.size()) {
        size_t dash = hyphenated.find('-', start);
        if (dash == std::string_view::npos) dash = hyphenated.size();
        if (dash > start) pieces++;
        start = dash + 1;
    }
    return pieces;
}

bool Dictionary::insert(std::string_view word, int syllables) {
    if (syllables < 1) return false;
    std::string key = normalize_word(word);
    if (key.empty()) return false;
    // First entry wins, so "Polish" after "polish" keeps the lowercase count
    entries_.emplace(std::move(key), syllables);
    return true;
}

bool Dictionary::load(const std::string& path) {
    size_t before = entries_.size();
    malformed_ = 0;

    bool ok = ends_with(path, ".json") ? load_json(path) : load_hyphenated(path);
    if (!ok) return false;

    std::cout << "Loaded " << (entries_.size() - before) << " syllable entries ("
              << malformed_ << " malformed lines skipped)." << std::endl;
    return true;
}

bool Dictionary::load_hyphenated(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open dictionary file: " << path << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Trim
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);

        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == line.size()) {
            malformed_++;
            continue;
        }

        std::string_view view(line);
        int syllables = count_hyphen_pieces(view.substr(eq + 1));
        if (!insert(view.substr(0, eq), syllables)) {
            malformed_++;
        }
    }
    return true;
}

bool Dictionary::load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open dictionary file: " << path << std::endl;
        return false;
    }

    nlohmann::json data;
    try {
        file >> data;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: Could not parse dictionary file: " << path
                  << " (" << e.what() << ")" << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Error: Dictionary file is not a JSON object: " << path << std::endl;
        return false;
    }

    for (const auto& [word, value] : data.items()) {
        // Non-negative integers parse as unsigned; anything above INT_MAX is rejected
        if (!value.is_number_unsigned() ||
            value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()) ||
            !insert(word, static_cast<int>(value.get<std::uint64_t>()))) {
            malformed_++;
        }
    }
    return true;
}

} // namespace haiku
