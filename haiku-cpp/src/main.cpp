#include "haiku_finder.hpp"
#include "report.hpp"
#include "tokenizer.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <cstdint>
#include <exception>
#include <omp.h>

struct Args {
    std::vector<std::string> input_paths;
    std::string dict_path;
    std::string output_path;
    bool lines = false;
    bool threads_set = false;
    int threads = 4;
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            args.input_paths.push_back(argv[++i]);
        } else if (arg == "--dict" && i + 1 < argc) {
            args.dict_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--lines") {
            args.lines = true;
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = std::stoi(argv[++i]);
            args.threads_set = true;
        }
    }
    return args;
}

int run(const Args& args) {
    if (args.threads_set) {
        omp_set_num_threads(args.threads);
    }

    // 1. Load Dictionary (optional)
    haiku::Dictionary dict;
    if (!args.dict_path.empty()) {
        auto start_load = std::chrono::high_resolution_clock::now();
        if (!dict.load(args.dict_path)) {
            std::cerr << "Continuing without a syllable dictionary." << std::endl;
        }
        auto end_load = std::chrono::high_resolution_clock::now();
        std::cout << "Dictionary loaded in "
                  << std::chrono::duration<double>(end_load - start_load).count()
                  << "s" << std::endl;
    }

    // 2. Read Inputs. A missing file is scanned as an empty text.
    std::vector<haiku::InputResult> results(args.input_paths.size());
    size_t total_tokens = 0;
    for (size_t i = 0; i < args.input_paths.size(); ++i) {
        results[i].input = args.input_paths[i];
        if (!haiku::load_tokens(args.input_paths[i], results[i].tokens)) {
            std::cerr << "Scanning " << args.input_paths[i] << " as empty text." << std::endl;
        }
        total_tokens += results[i].tokens.size();
    }

    // 3. Scan, one estimator per input so no cache is shared between threads
    auto start_proc = std::chrono::high_resolution_clock::now();

    #pragma omp parallel for schedule(dynamic, 1)
    for (int64_t i = 0; i < static_cast<int64_t>(results.size()); ++i) {
        haiku::SyllableEstimator estimator(dict);
        haiku::HaikuScanner scanner(estimator);
        results[i].matches = scanner.scan(results[i].tokens);
    }

    auto end_proc = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double>(end_proc - start_proc).count();

    // 4. Report in input order
    for (const auto& res : results) {
        for (const auto& match : res.matches) {
            if (args.lines) {
                for (const auto& line : haiku::format_lines(res.tokens, match)) {
                    std::cout << line << "\n";
                }
                std::cout << "\n";
            } else {
                std::cout << haiku::format_match(res.tokens, match) << "\n";
            }
        }
        std::cout << haiku::format_summary(res.matches.size()) << std::endl;
    }

    std::cout << "Processed " << total_tokens << " tokens in " << duration << "s" << std::endl;

    // 5. Output JSON lines. A write failure is reported, not fatal.
    if (!args.output_path.empty()) {
        if (haiku::save_json_report(args.output_path, results)) {
            std::cout << "Done. Saved to " << args.output_path << std::endl;
        }
    }

    return 0;
}

int main(int argc, char* argv[]) {
    std::ios_base::sync_with_stdio(false);

    try {
        Args args = parse_args(argc, argv);

        if (args.input_paths.empty()) {
            std::cerr << "Usage: " << argv[0] << " --input <file> [--input <file> ...] [--dict <file>] [--output <file>] [--lines] [--threads <n>]" << std::endl;
            return 1;
        }

        return run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
