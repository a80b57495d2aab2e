#ifndef MATRIX_TRANSFORM_HPP
#define MATRIX_TRANSFORM_HPP

#include <set>
#include <string>
#include "matrix.hpp"

enum class ThresholdDirection {
    keep_above,  // value >= cutoff
    keep_below   // value <  cutoff
};

// ✅ Copy of matrix with only the entries passing the cutoff; every sample is kept, even if emptied
Matrix threshold_filter(const Matrix& matrix, double cutoff,
                        ThresholdDirection direction = ThresholdDirection::keep_above);

// ✅ sample -> feature -> value  becomes  feature -> sample -> value
Matrix flip(const Matrix& matrix);

// ✅ Drop the values, keep membership
PresenceSets to_presence_sets(const Matrix& matrix);

// ✅ |a ∩ b| / |a ∪ b|; throws std::domain_error when both sets are empty
double jaccard(const std::set<std::string>& a, const std::set<std::string>& b);

#endif
