#include "matrix_transform.hpp"

#include <stdexcept>

Matrix threshold_filter(const Matrix& matrix, double cutoff, ThresholdDirection direction) {
    Matrix filtered;
    for (const auto& sample : matrix.order) {
        ValueMap& kept = filtered[sample];
        const ValueMap& row = matrix.at(sample);
        for (const auto& feature : row.order) {
            double value = row.at(feature);
            bool pass = direction == ThresholdDirection::keep_above ? value >= cutoff : value < cutoff;
            if (pass) {
                kept.set(feature, value);
            }
        }
    }
    return filtered;
}

Matrix flip(const Matrix& matrix) {
    Matrix flipped;
    for (const auto& sample : matrix.order) {
        const ValueMap& row = matrix.at(sample);
        for (const auto& feature : row.order) {
            flipped[feature].set(sample, row.at(feature));
        }
    }
    return flipped;
}

PresenceSets to_presence_sets(const Matrix& matrix) {
    PresenceSets sets;
    for (const auto& key : matrix.order) {
        const ValueMap& row = matrix.at(key);
        sets.set(key, std::set<std::string>(row.order.begin(), row.order.end()));
    }
    return sets;
}

double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
    std::size_t shared = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            ++shared;
            ++ia;
            ++ib;
        }
    }
    std::size_t total = a.size() + b.size() - shared;
    if (total == 0) {
        throw std::domain_error("❌ Error: Jaccard similarity is undefined for two empty sets");
    }
    return static_cast<double>(shared) / static_cast<double>(total);
}
