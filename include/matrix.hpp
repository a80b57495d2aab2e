#ifndef MATRIX_HPP
#define MATRIX_HPP

#include <set>
#include <string>
#include "ordered_map.hpp"

// ✅ Values of one sample keyed by feature (or of one feature keyed by sample)
using ValueMap = OrderedMap<double>;

// ✅ Holds sample -> feature -> abundance, or feature -> sample -> abundance once flipped
// Both levels keep the order the table was loaded in.
using Matrix = OrderedMap<ValueMap>;

// ✅ Membership only: sample -> features present (or feature -> samples holding it)
using PresenceSets = OrderedMap<std::set<std::string>>;

#endif
