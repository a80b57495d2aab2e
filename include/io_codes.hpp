#ifndef IO_CODES_HPP
#define IO_CODES_HPP

#include <string>
#include <iosfwd>
#include "code_builder.hpp"
#include "decoder.hpp"

// ✅ "#SAMPLE\tCODE" header, then one line per sample sorted by name; a missing code is written as #N/A
void write_codes(std::ostream& out, const SampleCodes& codes);
void write_codes(const std::string& output_file, const SampleCodes& codes);

// ✅ Read back a file written by write_codes (sample order follows the file)
SampleCodes read_codes(std::istream& in);
SampleCodes read_codes(const std::string& filePath);

// ✅ Five "# <class>: <count>" lines, then per sample: name, no_code / no_matches / matches, hits or #N/A
void write_hits(std::ostream& out, const SampleHits& sample_hits);
void write_hits(const std::string& output_file, const SampleHits& sample_hits);

#endif
