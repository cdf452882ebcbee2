#include "prereq/Normalizer.hpp"
#include "prereq/TextUtil.hpp"

#include <regex>

namespace prereq {

std::string strip_leading_labels(const std::string& text) {
    static const std::regex labels[] = {
        std::regex(R"(^pre-?requisites?\s+or\s+concurrent\s*:\s*)", std::regex::icase),
        std::regex(R"(^pre-?requisites?\s*:\s*)", std::regex::icase),
    };

    std::string out = text;
    for (const auto& re : labels) {
        out = std::regex_replace(out, re, "", std::regex_constants::format_first_only);
    }
    return out;
}

std::string normalize_requirement(const std::string& raw) {
    if (raw.empty()) return "";
    return textutil::trim(strip_leading_labels(textutil::collapse_whitespace(raw)));
}

} // namespace prereq
