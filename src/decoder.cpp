#include "decoder.hpp"

#include <algorithm>
#include "matrix_transform.hpp"

HitList check_one_code(const Code& code, const PresenceSets& population) {
    HitList hits;
    for (const auto& sample : population.order) {
        const std::set<std::string>& features = population.at(sample);
        bool covered = std::ranges::all_of(code, [&features](const std::string& feature) {
            return features.contains(feature);
        });
        if (covered) {
            hits.push_back(sample);
        }
    }
    return hits;
}

SampleHits decode(const Matrix& loaded, const SampleCodes& codes, double abund_detect) {
    PresenceSets population = to_presence_sets(threshold_filter(loaded, abund_detect));

    SampleHits sample_hits;
    for (const auto& sample : codes.order) {
        const std::optional<Code>& code = codes.at(sample);
        if (!code) {
            sample_hits.set(sample, std::nullopt);
            continue;
        }
        sample_hits.set(sample, check_one_code(*code, population));
    }
    return sample_hits;
}
