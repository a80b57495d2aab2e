#include "settings.hpp"

#include <filesystem>
#include <stdexcept>

MetaMode parse_meta_mode(const std::string& name) {
    if (name == "off") {
        return MetaMode::off;
    }
    if (name == "relab") {
        return MetaMode::relab;
    }
    if (name == "rpkm") {
        return MetaMode::rpkm;
    }
    throw std::invalid_argument("❌ Error: Unknown meta mode: " + name + " (expected off, relab or rpkm)");
}

Settings resolve_settings(const Options& options) {
    Settings settings = options.settings;

    if (options.meta_mode != MetaMode::off) {
        settings.abund_detect = options.meta_mode == MetaMode::rpkm ? 5.0 : 0.001;
        settings.abund_nondetect = settings.abund_detect / 100.0;
        // Decoding tolerates features that dropped a little since encoding
        if (options.codes_path) {
            settings.abund_detect /= 10.0;
        }
        settings.similarity_cutoff = 0.8;
        settings.min_code_size = 7;
        settings.ranking = RankingMethod::abundance_gap;
    }

    if (settings.similarity_cutoff && (*settings.similarity_cutoff < 0.0 || *settings.similarity_cutoff > 1.0)) {
        throw std::invalid_argument("❌ Error: Jaccard similarity cutoff must be within [0, 1]");
    }
    if (settings.min_code_size < 0) {
        throw std::invalid_argument("❌ Error: Minimum code size cannot be negative");
    }
    return settings;
}

std::string path_to_name(const std::string& path) {
    std::string file_name = std::filesystem::path(path).filename().string();
    return file_name.substr(0, file_name.find('.'));
}

std::string default_output_path(const Options& options) {
    if (options.output_path) {
        return *options.output_path;
    }
    std::string name = path_to_name(options.table_path);
    if (options.codes_path) {
        return name + "." + path_to_name(*options.codes_path) + "." + kHitsExtension;
    }
    return name + "." + kCodesExtension;
}
