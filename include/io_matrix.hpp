#ifndef IO_MATRIX_HPP
#define IO_MATRIX_HPP

#include "matrix.hpp"
#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <unordered_set>
#include <stdexcept>

// ✅ Read a tab-delimited PCL table (features as rows, samples as columns) into a sample -> feature -> value Matrix
// Values below cutoff are not stored; every sample is kept, in header order.
Matrix read_table(const std::string& filePath, double cutoff);

#endif
