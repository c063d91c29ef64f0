/**
 * Unit tests for the haiku scanner and tokenizer.
 * Scanner fixtures (tokens, seed dictionary, expected spans) are shared
 * through data/scanner_cases.json.
 */

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <stdexcept>
#include "haiku_finder.hpp"
#include "report.hpp"
#include "tokenizer.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

#ifndef HAIKU_DATA_DIR
#define HAIKU_DATA_DIR "../data"
#endif

struct ExpectedMatch {
    size_t begin;
    size_t end;
    size_t line2_begin;
    size_t line3_begin;
    std::string text;
};

struct TestCase {
    int id;
    std::string description;
    std::map<std::string, int> dictionary;
    std::vector<std::string> tokens;
    std::vector<ExpectedMatch> expected;
};

class HaikuFinderTest {
private:
    std::string dataDir;
    std::vector<TestCase> testCases;
    int passCount = 0;
    int failCount = 0;

    static haiku::Dictionary basho_dictionary() {
        haiku::Dictionary dict;
        for (const auto& [word, syllables] : std::map<std::string, int>{
                 {"an", 1}, {"old", 1}, {"silent", 2}, {"pond", 1}, {"a", 1},
                 {"frog", 1}, {"jumps", 1}, {"into", 2}, {"the", 1}, {"splash", 1},
                 {"silence", 2}, {"again", 2}, {"and", 1}}) {
            dict.insert(word, syllables);
        }
        return dict;
    }

public:
    HaikuFinderTest() : dataDir(HAIKU_DATA_DIR) {
        std::string testCasesPath = dataDir + "/scanner_cases.json";
        std::ifstream file(testCasesPath);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open test cases file: " + testCasesPath);
        }
        json j;
        file >> j;

        for (const auto& tc : j) {
            TestCase testCase;
            testCase.id = tc["id"].get<int>();
            testCase.description = tc["description"].get<std::string>();
            for (const auto& [word, syllables] : tc["dictionary"].items()) {
                testCase.dictionary[word] = syllables.get<int>();
            }
            testCase.tokens = tc["tokens"].get<std::vector<std::string>>();
            for (const auto& exp : tc["expected"]) {
                ExpectedMatch m;
                m.begin = exp["begin"].get<size_t>();
                m.end = exp["end"].get<size_t>();
                m.line2_begin = exp["line2_begin"].get<size_t>();
                m.line3_begin = exp["line3_begin"].get<size_t>();
                m.text = exp["text"].get<std::string>();
                testCase.expected.push_back(m);
            }
            testCases.push_back(testCase);
        }
    }

    void runTest(const std::string& name, std::function<bool()> test) {
        std::cout << "  " << name << "... ";
        try {
            if (test()) {
                std::cout << "PASSED" << std::endl;
                passCount++;
            } else {
                std::cout << "FAILED" << std::endl;
                failCount++;
            }
        } catch (const std::exception& e) {
            std::cout << "FAILED (exception: " << e.what() << ")" << std::endl;
            failCount++;
        }
    }

    bool matchesEqual(const std::vector<std::string>& tokens,
                      const std::vector<haiku::Match>& got,
                      const std::vector<ExpectedMatch>& expected) {
        if (got.size() != expected.size()) return false;
        for (size_t i = 0; i < got.size(); i++) {
            if (got[i].begin != expected[i].begin || got[i].end != expected[i].end ||
                got[i].line2_begin != expected[i].line2_begin ||
                got[i].line3_begin != expected[i].line3_begin ||
                haiku::format_match(tokens, got[i]) != expected[i].text) {
                return false;
            }
        }
        return true;
    }

    void testAllCasesMatchExpected() {
        runTest("All scanner cases match expected", [this]() {
            std::vector<std::string> failures;
            for (const auto& tc : testCases) {
                haiku::Dictionary dict;
                for (const auto& [word, syllables] : tc.dictionary) {
                    dict.insert(word, syllables);
                }
                haiku::SyllableEstimator estimator(dict);
                haiku::HaikuScanner scanner(estimator);
                auto result = scanner.scan(tc.tokens);
                if (!matchesEqual(tc.tokens, result, tc.expected)) {
                    std::ostringstream oss;
                    oss << "[" << tc.id << "] " << tc.description << " (got "
                        << result.size() << " matches)";
                    failures.push_back(oss.str());
                }
            }
            if (!failures.empty()) {
                std::cerr << "\n    " << failures.size() << "/" << testCases.size() << " test cases failed" << std::endl;
                for (const auto& f : failures) {
                    std::cerr << "      " << f << std::endl;
                }
                return false;
            }
            return true;
        });
    }

    void testIsWord() {
        runTest("Word tokens are ASCII letters only", []() {
            return haiku::is_word("Pond") && haiku::is_word("a") &&
                   !haiku::is_word("") && !haiku::is_word("pond,") &&
                   !haiku::is_word("3rd") && !haiku::is_word("well-known") &&
                   !haiku::is_word("don't") && !haiku::is_word("caf\xC3\xA9");
        });
    }

    void testStreamingMatchesEager() {
        runTest("Streaming scan reports the same matches", []() {
            haiku::Dictionary dict = basho_dictionary();
            std::vector<std::string> tokens = haiku::split_on_spaces(
                "an old silent pond a frog jumps into the pond splash silence again and");

            haiku::SyllableEstimator estimator(dict);
            haiku::HaikuScanner scanner(estimator);
            std::vector<haiku::Match> streamed;
            size_t n = scanner.scan(tokens, [&streamed](const haiku::Match& m) {
                streamed.push_back(m);
            });
            auto eager = scanner.scan(tokens);
            return n == 1 && streamed.size() == 1 && eager.size() == 1 &&
                   streamed[0].begin == eager[0].begin && streamed[0].end == eager[0].end;
        });
    }

    void testFormatting() {
        runTest("Match and summary formatting", []() {
            haiku::Dictionary dict = basho_dictionary();
            std::vector<std::string> tokens = haiku::split_on_spaces(
                "an old silent pond a frog jumps into the pond splash silence again and");
            haiku::SyllableEstimator estimator(dict);
            haiku::HaikuScanner scanner(estimator);
            auto matches = scanner.scan(tokens);
            if (matches.size() != 1) return false;

            auto lines = haiku::format_lines(tokens, matches[0]);
            return haiku::format_match(tokens, matches[0]) ==
                       "an old silent pond a frog jumps into the pond splash silence again " &&
                   lines.size() == 3 &&
                   lines[0] == "an old silent pond" &&
                   lines[1] == "a frog jumps into the pond" &&
                   lines[2] == "splash silence again" &&
                   haiku::format_summary(matches.size()) == "Found 1 haikus." &&
                   haiku::format_summary(0) == "Found 0 haikus.";
        });
    }

    void testScannerKeepsNoStateBetweenScans() {
        runTest("Repeated scans give the same result", []() {
            haiku::Dictionary dict = basho_dictionary();
            std::vector<std::string> tokens = haiku::split_on_spaces(
                "an old silent pond a frog jumps into the pond splash silence again and");
            haiku::SyllableEstimator estimator(dict);
            haiku::HaikuScanner scanner(estimator);
            auto first = scanner.scan(tokens);
            auto second = scanner.scan(tokens);
            return first.size() == 1 && second.size() == 1 && first[0].end == second[0].end;
        });
    }

    void testSplitOnSpaces() {
        runTest("Split on literal spaces only", []() {
            auto tokens = haiku::split_on_spaces("  splash!  silence\tagain well-known 3rd\r");
            std::vector<std::string> expected = {"splash!", "silence\tagain", "well-known", "3rd"};
            return tokens == expected && haiku::split_on_spaces("").empty() &&
                   haiku::split_on_spaces("   ").empty();
        });
    }

    void testLoadTokens() {
        runTest("Load tokens from file", [this]() {
            std::vector<std::string> tokens;
            if (!haiku::load_tokens(dataDir + "/basho.txt", tokens)) return false;
            if (tokens.size() != 14 || tokens.front() != "an" || tokens.back() != "and") return false;

            haiku::Dictionary dict = basho_dictionary();
            haiku::SyllableEstimator estimator(dict);
            haiku::HaikuScanner scanner(estimator);
            auto matches = scanner.scan(tokens);
            return matches.size() == 1 && matches[0].begin == 0 && matches[0].end == 13;
        });
    }

    void testMissingInput() {
        runTest("Missing input leaves tokens untouched", [this]() {
            std::vector<std::string> tokens = {"kept"};
            bool loaded = haiku::load_tokens(dataDir + "/does_not_exist.txt", tokens);
            return !loaded && tokens.size() == 1 && tokens[0] == "kept";
        });
    }

    void testJsonReportReplacesInvalidUtf8() {
        runTest("JSON report survives invalid UTF-8", []() {
            haiku::Dictionary dict = basho_dictionary();
            haiku::InputResult res;
            res.input = "bad\xFF.txt";
            res.tokens = haiku::split_on_spaces(
                "an old silent pond a frog jumps into the pond splash silence again and");
            haiku::SyllableEstimator estimator(dict);
            haiku::HaikuScanner scanner(estimator);
            res.matches = scanner.scan(res.tokens);

            std::ostringstream out;
            haiku::write_json_report(out, {res});

            std::istringstream in(out.str());
            std::string line;
            std::vector<json> records;
            while (std::getline(in, line)) {
                records.push_back(json::parse(line));
            }
            return records.size() == 1 &&
                   records[0]["input"].get<std::string>() == "bad\xEF\xBF\xBD.txt" &&
                   records[0]["begin"].get<size_t>() == 0 &&
                   records[0]["end"].get<size_t>() == 13 &&
                   records[0]["lines"].size() == 3;
        });
    }

    void testUnwritableReport() {
        runTest("Unwritable report path is reported, not thrown", [this]() {
            std::vector<haiku::InputResult> results(1);
            results[0].input = "empty.txt";
            return !haiku::save_json_report(dataDir + "/no_such_dir/report.jsonl", results);
        });
    }

    void runAll() {
        std::cout << "\nRunning Haiku Finder Tests..." << std::endl;
        std::cout << "=============================" << std::endl;

        testAllCasesMatchExpected();
        testIsWord();
        testStreamingMatchesEager();
        testFormatting();
        testScannerKeepsNoStateBetweenScans();
        testSplitOnSpaces();
        testLoadTokens();
        testMissingInput();
        testJsonReportReplacesInvalidUtf8();
        testUnwritableReport();

        std::cout << "=============================" << std::endl;
        std::cout << "Results: " << passCount << " passed, " << failCount << " failed" << std::endl;
    }

    int getFailCount() const { return failCount; }
};

int main() {
    try {
        HaikuFinderTest tests;
        tests.runAll();
        return tests.getFailCount() > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Test setup failed: " << e.what() << std::endl;
        return 1;
    }
}
