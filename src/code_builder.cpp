#include "code_builder.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include "feature_ranking.hpp"
#include "matrix_transform.hpp"

std::optional<Code> make_one_code(const std::string& sample,
                                  std::vector<std::string> ranked_features,
                                  const PresenceSets& sample_sets,
                                  const PresenceSets& feature_sets,
                                  std::optional<double> similarity_cutoff,
                                  int min_code_size) {
    std::set<std::string> other_samples;
    for (const auto& other : sample_sets.order) {
        if (other != sample) {
            other_samples.insert(other);
        }
    }

    const auto min_size = static_cast<std::size_t>(std::max(min_code_size, 0));
    Code code;
    while (!ranked_features.empty() && (!other_samples.empty() || code.size() < min_size)) {
        std::string feature = std::move(ranked_features.back());
        ranked_features.pop_back();
        code.push_back(feature);

        const std::set<std::string>& holders = feature_sets.at(feature);
        std::set<std::string> still_hit;
        std::set_intersection(other_samples.begin(), other_samples.end(),
                              holders.begin(), holders.end(),
                              std::inserter(still_hit, still_hit.end()));

        // No samples knocked out: drop the feature, unless the code is only being lengthened
        if (still_hit.size() == other_samples.size() && !other_samples.empty()) {
            code.pop_back();
        }
        other_samples = std::move(still_hit);

        if (similarity_cutoff) {
            std::erase_if(ranked_features, [&](const std::string& candidate) {
                return jaccard(holders, feature_sets.at(candidate)) >= *similarity_cutoff;
            });
        }
    }

    if (!other_samples.empty()) {
        return std::nullopt;
    }
    return code;
}

SampleCodes encode(const Matrix& loaded, const Settings& settings) {
    Matrix flipped = flip(loaded);
    Matrix detected = threshold_filter(loaded, settings.abund_detect);

    std::cout << "🔹 Ranking features by: " << ranking_method_name(settings.ranking) << "\n";
    RankedFeatures ranked = rank_features(settings.ranking, detected, flipped, settings.abund_nondetect);

    PresenceSets sample_sets = to_presence_sets(detected);
    PresenceSets feature_sets = to_presence_sets(flipped);

    SampleCodes codes;
    std::size_t failed = 0;
    for (const auto& sample : sample_sets.order) {
        std::optional<Code> code = make_one_code(sample, ranked.at(sample), sample_sets, feature_sets,
                                                 settings.similarity_cutoff, settings.min_code_size);
        if (!code) {
            ++failed;
        }
        codes.set(sample, std::move(code));
    }

    std::cout << "✅ Encoded " << codes.size() << " samples (" << failed << " without a unique code)\n";
    return codes;
}
