#include "report.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace haiku {

namespace {

nlohmann::json build_json_record(const InputResult& res, size_t index) {
    const Match& match = res.matches[index];
    return {
        {"input", res.input},
        {"index", index},
        {"begin", match.begin},
        {"end", match.end},
        {"text", format_match(res.tokens, match)},
        {"lines", format_lines(res.tokens, match)},
    };
}

} // namespace

void write_json_report(std::ostream& out, const std::vector<InputResult>& results) {
    for (const auto& res : results) {
        for (size_t k = 0; k < res.matches.size(); ++k) {
            out << build_json_record(res, k).dump(-1, ' ', false,
                                                  nlohmann::json::error_handler_t::replace)
                << "\n";
        }
    }
}

bool save_json_report(const std::string& path, const std::vector<InputResult>& results) {
    std::ofstream outfile(path);
    if (!outfile.is_open()) {
        std::cerr << "Error opening output file: " << path << std::endl;
        return false;
    }
    write_json_report(outfile, results);
    return true;
}

} // namespace haiku
