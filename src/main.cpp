#include <iostream>
#include <string>
#include <stdexcept>
#include <type_traits>
#include "settings.hpp"
#include "io_matrix.hpp"
#include "io_codes.hpp"
#include "code_builder.hpp"
#include "decoder.hpp"
#include "confusion.hpp"

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " <table> [options]\n"
              << "  <table>                              Tab-delimited PCL table: features as rows, samples as columns (required)\n"
              << "  -c, --codes <file>                   Codes file from an earlier run; compares the codes to the table\n"
              << "  -j, --jaccard_similarity_cutoff <x>  An encoded feature knocks out features at least this similar (Jaccard, 0-1)\n"
              << "  -m, --min_code_size <n>              Keep lengthening codes past uniqueness up to n features (default: 1)\n"
              << "  -d, --abund_detect <x>               Values at or above this are confidently present (default: 1e-20)\n"
              << "  -n, --abund_nondetect <x>            Values below this are confidently absent (default: 1e-20)\n"
              << "  -r, --ranking <method>               rarity or abundance_gap (default: rarity)\n"
              << "  -o, --output <file>                  Output file (default: derived from the input names)\n"
              << "  -e, --meta_mode <mode>               off, relab or rpkm: preset for metagenomic features (default: off)\n"
              << "  -h, --help                           Display this help and exit\n";
}

// Converts a numeric option value, naming the option on failure
template <typename T>
T parseNumber(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    T parsed{};
    try {
        if constexpr (std::is_same_v<T, int>) {
            parsed = std::stoi(value, &consumed);
        } else {
            parsed = std::stod(value, &consumed);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("❌ Error: Invalid value for " + option + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("❌ Error: Invalid value for " + option + ": " + value);
    }
    return parsed;
}

int main(int argc, char* argv[]) {
    if (argc == 1) {
        printHelp(argv[0]);
        return 1;
    }

    Options options;
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "-h" || arg == "--help") {
                printHelp(argv[0]);
                return 0;
            } else if ((arg == "-c" || arg == "--codes") && has_value) {
                options.codes_path = argv[++i];
            } else if ((arg == "-j" || arg == "--jaccard_similarity_cutoff") && has_value) {
                options.settings.similarity_cutoff = parseNumber<double>(arg, argv[++i]);
            } else if ((arg == "-m" || arg == "--min_code_size") && has_value) {
                options.settings.min_code_size = parseNumber<int>(arg, argv[++i]);
            } else if ((arg == "-d" || arg == "--abund_detect") && has_value) {
                options.settings.abund_detect = parseNumber<double>(arg, argv[++i]);
            } else if ((arg == "-n" || arg == "--abund_nondetect") && has_value) {
                options.settings.abund_nondetect = parseNumber<double>(arg, argv[++i]);
            } else if ((arg == "-r" || arg == "--ranking") && has_value) {
                options.settings.ranking = parse_ranking_method(argv[++i]);
            } else if ((arg == "-o" || arg == "--output") && has_value) {
                options.output_path = argv[++i];
            } else if ((arg == "-e" || arg == "--meta_mode") && has_value) {
                options.meta_mode = parse_meta_mode(argv[++i]);
            } else if (!arg.starts_with("-") && options.table_path.empty()) {
                options.table_path = arg;
            } else {
                std::cerr << "❌ Invalid option: " << arg << std::endl;
                printHelp(argv[0]);
                return 1;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        printHelp(argv[0]);
        return 1;
    }

    if (options.table_path.empty()) {
        std::cerr << "❌ Error: a table file is REQUIRED.\n";
        printHelp(argv[0]);
        return 1;
    }

    Settings settings;
    try {
        settings = resolve_settings(options);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::string output_file = default_output_path(options);

    try {
        Matrix table = read_table(options.table_path, settings.abund_nondetect);

        if (!options.codes_path) {
            std::cout << "🔹 Encoding the table\n";
            SampleCodes codes = encode(table, settings);
            write_codes(output_file, codes);
        } else {
            SampleCodes codes = read_codes(*options.codes_path);
            std::cout << "🔹 Decoding the table\n";
            SampleHits hits = decode(table, codes, settings.abund_detect);
            for (const auto& [label, count] : count_confusion(hits)) {
                std::cout << "   " << label << ": " << count << "\n";
            }
            write_hits(output_file, hits);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
