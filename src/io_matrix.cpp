#include "io_matrix.hpp"

#include <vector>
#include <seqan3/utility/views/zip.hpp>

namespace {

// Split one line on tabs, dropping a trailing carriage return
std::vector<std::string> split_tabs(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    std::vector<std::string> cells;
    std::istringstream lineStream(line);
    std::string token;
    while (getline(lineStream, token, '\t')) {
        cells.push_back(token);
    }
    return cells;
}

double parse_value(const std::string& token, const std::string& filePath, const std::string& feature) {
    double value = 0.0;
    std::size_t consumed = 0;
    try {
        value = std::stod(token, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("❌ Error: Invalid numeric '" + token + "' in " + filePath + " at feature: " + feature);
    }
    if (consumed != token.size()) {
        throw std::runtime_error("❌ Error: Invalid numeric '" + token + "' in " + filePath + " at feature: " + feature);
    }
    if (value < 0) {
        throw std::runtime_error("❌ Error: Negative abundance value in " + filePath + " at feature: " + feature);
    }
    return value;
}

} // namespace

// ✅ Read PCL table into a Matrix (preserves sample and feature order)
Matrix read_table(const std::string& filePath, double cutoff) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("❌ Error: Failed to open table file: " + filePath);
    }

    Matrix matrix;
    std::vector<std::string> samples;
    std::unordered_set<std::string> seen_features;

    std::string line;
    bool first_row = true;

    std::cout << "📂 Reading table file: " << filePath << "\n";

    while (getline(file, line)) {
        std::vector<std::string> cells = split_tabs(line);
        if (cells.empty()) {
            continue;
        }

        if (first_row) {
            std::unordered_set<std::string> seen_samples;
            for (std::size_t i = 1; i < cells.size(); ++i) {
                if (!seen_samples.insert(cells[i]).second) {
                    throw std::runtime_error("❌ Error: Duplicate sample name in header: " + cells[i]);
                }
                samples.push_back(cells[i]);
                matrix[cells[i]];
            }
            first_row = false;
            continue;
        }

        const std::string& feature = cells.front();
        if (!seen_features.insert(feature).second) {
            throw std::runtime_error("❌ Error: Duplicate feature: " + feature);
        }

        std::vector<double> values;
        for (std::size_t i = 1; i < cells.size(); ++i) {
            values.push_back(parse_value(cells[i], filePath, feature));
        }

        if (values.size() != samples.size()) {
            throw std::runtime_error("❌ Error: Row length mismatch at feature: " + feature +
                                     " (expected " + std::to_string(samples.size()) +
                                     " values, found " + std::to_string(values.size()) + ")");
        }

        for (auto && [sample, value] : seqan3::views::zip(samples, values)) {
            if (value >= cutoff) {
                matrix[sample].set(feature, value);
            }
        }
    }

    if (first_row) {
        throw std::runtime_error("❌ Error: No header found in table file: " + filePath);
    }

    std::cout << "✅ Table file successfully loaded: " << filePath << " (" << samples.size() << " samples, "
              << seen_features.size() << " features)\n";
    return matrix;
}
