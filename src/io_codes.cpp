#include "io_codes.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "confusion.hpp"
#include "settings.hpp"

namespace {

std::vector<std::string> sorted_keys(const std::vector<std::string>& order) {
    std::vector<std::string> keys = order;
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::ofstream open_output(const std::string& output_file) {
    std::ofstream outFile(output_file);
    if (!outFile.is_open()) {
        throw std::runtime_error("❌ Error: Could not open output file: " + output_file);
    }
    return outFile;
}

} // namespace

void write_codes(std::ostream& out, const SampleCodes& codes) {
    out << "#SAMPLE\tCODE\n";
    for (const auto& sample : sorted_keys(codes.order)) {
        out << sample;
        const std::optional<Code>& code = codes.at(sample);
        if (!code) {
            out << "\t" << kNA;
        } else {
            for (const auto& feature : *code) {
                out << "\t" << feature;
            }
        }
        out << "\n";
    }
}

void write_codes(const std::string& output_file, const SampleCodes& codes) {
    std::ofstream outFile = open_output(output_file);
    write_codes(outFile, codes);
    if (!outFile) {
        throw std::runtime_error("❌ Error: Failed writing codes to: " + output_file);
    }
    std::cout << "📝 Wrote codes to: " << output_file << "\n";
}

SampleCodes read_codes(std::istream& in) {
    SampleCodes codes;
    std::string line;
    getline(in, line);  // header

    while (getline(in, line)) {
        // Trim surrounding whitespace, including a Windows line ending
        auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            continue;
        }
        auto last = line.find_last_not_of(" \t\r\n");
        std::istringstream lineStream(line.substr(first, last - first + 1));

        std::string sample;
        getline(lineStream, sample, '\t');
        Code code;
        std::string token;
        bool missing = false;
        while (getline(lineStream, token, '\t')) {
            if (token == kNA) {
                missing = true;
            }
            code.push_back(token);
        }
        if (missing) {
            codes.set(sample, std::nullopt);
        } else {
            codes.set(sample, std::move(code));
        }
    }
    return codes;
}

SampleCodes read_codes(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("❌ Error: Failed to open codes file: " + filePath);
    }
    std::cout << "📂 Reading codes file: " << filePath << "\n";
    SampleCodes codes = read_codes(file);
    std::cout << "✅ Codes file successfully loaded: " << filePath << " (" << codes.size() << " samples)\n";
    return codes;
}

void write_hits(std::ostream& out, const SampleHits& sample_hits) {
    for (const auto& [label, count] : count_confusion(sample_hits)) {
        out << "# " << label << ": " << count << "\n";
    }
    for (const auto& sample : sorted_keys(sample_hits.order)) {
        out << sample;
        const std::optional<HitList>& hits = sample_hits.at(sample);
        if (!hits) {
            out << "\tno_code\t" << kNA;
        } else {
            out << "\t" << (hits->empty() ? "no_matches" : "matches");
            for (const auto& hit : *hits) {
                out << "\t" << hit;
            }
        }
        out << "\n";
    }
}

void write_hits(const std::string& output_file, const SampleHits& sample_hits) {
    std::ofstream outFile = open_output(output_file);
    write_hits(outFile, sample_hits);
    if (!outFile) {
        throw std::runtime_error("❌ Error: Failed writing hits to: " + output_file);
    }
    std::cout << "📝 Wrote hits to: " << output_file << "\n";
}
