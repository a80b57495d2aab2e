#ifndef FEATURE_RANKING_HPP
#define FEATURE_RANKING_HPP

#include <string>
#include <vector>
#include "matrix.hpp"

enum class RankingMethod {
    rarity,
    abundance_gap
};

// sample -> features, lowest priority first (the code builder takes from the back)
using RankedFeatures = OrderedMap<std::vector<std::string>>;

// ✅ "rarity" / "abundance_gap"; throws std::invalid_argument otherwise
RankingMethod parse_ranking_method(const std::string& name);
std::string ranking_method_name(RankingMethod method);

// ✅ Least prevalent features last. `flipped` is feature -> sample -> value of the loaded table.
RankedFeatures rank_rarity(const Matrix& detected, const Matrix& flipped);

// ✅ Features whose value stands furthest above the next lower sample last.
// The comparison floor is abund_nondetect.
RankedFeatures rank_abundance_gap(const Matrix& detected, const Matrix& flipped, double abund_nondetect);

RankedFeatures rank_features(RankingMethod method, const Matrix& detected, const Matrix& flipped,
                             double abund_nondetect);

#endif
