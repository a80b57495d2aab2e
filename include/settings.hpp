#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <string>
#include <optional>
#include "feature_ranking.hpp"

inline constexpr double kEpsilon = 1e-20;
inline constexpr const char* kNA = "#N/A";
inline constexpr const char* kCodesExtension = "codes.txt";
inline constexpr const char* kHitsExtension = "hits.txt";

// ✅ Fully resolved parameters handed to the encoder / decoder
struct Settings {
    double abund_detect = kEpsilon;                  // confidently present at or above this
    double abund_nondetect = kEpsilon;               // confidently absent below this; also the load cutoff
    std::optional<double> similarity_cutoff;         // Jaccard knockout, unset = no knockout
    int min_code_size = 1;
    RankingMethod ranking = RankingMethod::rarity;
};

enum class MetaMode {
    off,
    relab,
    rpkm
};

// ✅ Everything the command line can set, before presets are applied
struct Options {
    std::string table_path;
    std::optional<std::string> codes_path;           // set = decode mode
    std::optional<std::string> output_path;
    MetaMode meta_mode = MetaMode::off;
    Settings settings;
};

// ✅ "off" / "relab" / "rpkm"; throws std::invalid_argument otherwise
MetaMode parse_meta_mode(const std::string& name);

// ✅ Apply the meta mode preset (it overrides explicit values) and validate the result.
// Throws std::invalid_argument on an out of range cutoff or a negative code size.
Settings resolve_settings(const Options& options);

// ✅ File name up to its first dot: "data/visit1.pcl" -> "visit1"
std::string path_to_name(const std::string& path);

// ✅ <table>.codes.txt when encoding, <table>.<codes>.hits.txt when decoding, unless output_path is set
std::string default_output_path(const Options& options);

#endif
