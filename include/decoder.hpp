#ifndef DECODER_HPP
#define DECODER_HPP

#include <string>
#include <vector>
#include <optional>
#include "matrix.hpp"
#include "code_builder.hpp"

// Samples hit by a code, in population order; std::nullopt when there was no code
using HitList = std::vector<std::string>;
using SampleHits = OrderedMap<std::optional<HitList>>;

// ✅ Every sample of the population whose features include all of the code
HitList check_one_code(const Code& code, const PresenceSets& population);

// ✅ Compare all codes to a loaded table, counting a feature as present at or above abund_detect
SampleHits decode(const Matrix& loaded, const SampleCodes& codes, double abund_detect);

#endif
