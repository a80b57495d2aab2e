#ifndef CONFUSION_HPP
#define CONFUSION_HPP

#include <map>
#include <cstddef>
#include <string>
#include <optional>
#include "decoder.hpp"

enum class ConfusionClass {
    tp,        // only the focal sample was hit
    tp_fp,     // focal sample and others
    fn_fp,     // others but not the focal sample
    fn,        // nothing was hit
    na         // no code to check
};

// "1|TP", "2|TP+FP", "3|FN+FP", "4|FN", "5|NA"; the numeric prefix fixes the report order
std::string confusion_label(ConfusionClass cls);

ConfusionClass classify_hits(const std::string& sample, const std::optional<HitList>& hits);

// ✅ Count per label, all five present, summing to the number of samples
std::map<std::string, std::size_t> count_confusion(const SampleHits& sample_hits);

#endif
