#include "feature_ranking.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

// Stable sort keeps load order among ties, which keeps codes reproducible
std::vector<std::string> stable_order(std::vector<std::pair<std::string, double>> scored, bool descending) {
    std::stable_sort(scored.begin(), scored.end(), [descending](const auto& a, const auto& b) {
        return descending ? a.second > b.second : a.second < b.second;
    });
    std::vector<std::string> features;
    features.reserve(scored.size());
    for (auto& [feature, score] : scored) {
        features.push_back(std::move(feature));
    }
    return features;
}

} // namespace

RankingMethod parse_ranking_method(const std::string& name) {
    if (name == "rarity") {
        return RankingMethod::rarity;
    }
    if (name == "abundance_gap") {
        return RankingMethod::abundance_gap;
    }
    throw std::invalid_argument("❌ Error: Unknown ranking method: " + name + " (expected rarity or abundance_gap)");
}

std::string ranking_method_name(RankingMethod method) {
    return method == RankingMethod::rarity ? "rarity" : "abundance_gap";
}

RankedFeatures rank_rarity(const Matrix& detected, const Matrix& flipped) {
    RankedFeatures ranked;
    for (const auto& sample : detected.order) {
        const ValueMap& row = detected.at(sample);
        std::vector<std::pair<std::string, double>> prevalence;
        prevalence.reserve(row.size());
        for (const auto& feature : row.order) {
            prevalence.emplace_back(feature, static_cast<double>(flipped.at(feature).size()));
        }
        ranked.set(sample, stable_order(std::move(prevalence), true));
    }
    return ranked;
}

RankedFeatures rank_abundance_gap(const Matrix& detected, const Matrix& flipped, double abund_nondetect) {
    RankedFeatures ranked;
    for (const auto& sample : detected.order) {
        const ValueMap& row = detected.at(sample);
        std::vector<std::pair<std::string, double>> gaps;
        gaps.reserve(row.size());
        for (const auto& feature : row.order) {
            double focal = row.at(feature);
            double next_lower = abund_nondetect;
            const ValueMap& holders = flipped.at(feature);
            for (const auto& other : holders.order) {
                double value = holders.at(other);
                if (other != sample && value <= focal) {
                    next_lower = std::max(next_lower, value);
                }
            }
            gaps.emplace_back(feature, focal - next_lower);
        }
        ranked.set(sample, stable_order(std::move(gaps), false));
    }
    return ranked;
}

RankedFeatures rank_features(RankingMethod method, const Matrix& detected, const Matrix& flipped,
                             double abund_nondetect) {
    switch (method) {
        case RankingMethod::rarity:
            return rank_rarity(detected, flipped);
        case RankingMethod::abundance_gap:
            return rank_abundance_gap(detected, flipped, abund_nondetect);
    }
    throw std::invalid_argument("❌ Error: Unsupported ranking method");
}
