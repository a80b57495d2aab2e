#include "confusion.hpp"

#include <algorithm>
#include <array>

std::string confusion_label(ConfusionClass cls) {
    switch (cls) {
        case ConfusionClass::tp:    return "1|TP";
        case ConfusionClass::tp_fp: return "2|TP+FP";
        case ConfusionClass::fn_fp: return "3|FN+FP";
        case ConfusionClass::fn:    return "4|FN";
        case ConfusionClass::na:    return "5|NA";
    }
    return "5|NA";
}

ConfusionClass classify_hits(const std::string& sample, const std::optional<HitList>& hits) {
    if (!hits) {
        return ConfusionClass::na;
    }
    bool tp_hit = std::ranges::find(*hits, sample) != hits->end();
    bool fp_hit = std::ranges::any_of(*hits, [&sample](const std::string& hit) { return hit != sample; });
    if (tp_hit) {
        return fp_hit ? ConfusionClass::tp_fp : ConfusionClass::tp;
    }
    return fp_hit ? ConfusionClass::fn_fp : ConfusionClass::fn;
}

std::map<std::string, std::size_t> count_confusion(const SampleHits& sample_hits) {
    constexpr std::array<ConfusionClass, 5> all_classes = {
        ConfusionClass::tp, ConfusionClass::tp_fp, ConfusionClass::fn_fp, ConfusionClass::fn, ConfusionClass::na};

    std::map<std::string, std::size_t> counts;
    for (ConfusionClass cls : all_classes) {
        counts[confusion_label(cls)] = 0;
    }
    for (const auto& sample : sample_hits.order) {
        ++counts[confusion_label(classify_hits(sample, sample_hits.at(sample)))];
    }
    return counts;
}
