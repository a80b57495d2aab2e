#ifndef CODE_BUILDER_HPP
#define CODE_BUILDER_HPP

#include <string>
#include <vector>
#include <optional>
#include "matrix.hpp"
#include "settings.hpp"

// Features in the order they were chosen; std::nullopt when the sample cannot be separated
using Code = std::vector<std::string>;
using SampleCodes = OrderedMap<std::optional<Code>>;

// ✅ Greedy hitting-set search for one sample
// ranked_features: lowest priority first, consumed from the back
// sample_sets:     sample -> detected features (defines the other samples to separate from)
// feature_sets:    feature -> samples holding it at the non-detect level
std::optional<Code> make_one_code(const std::string& sample,
                                  std::vector<std::string> ranked_features,
                                  const PresenceSets& sample_sets,
                                  const PresenceSets& feature_sets,
                                  std::optional<double> similarity_cutoff,
                                  int min_code_size);

// ✅ Build a code for every sample of a loaded table (values already cut at abund_nondetect)
SampleCodes encode(const Matrix& loaded, const Settings& settings);

#endif
