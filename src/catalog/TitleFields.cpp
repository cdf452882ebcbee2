#include "catalog/TitleFields.hpp"
#include "prereq/TextUtil.hpp"

#include <algorithm>
#include <regex>
#include <vector>

namespace catalog {

int difficulty_from_code(const std::string& course_code) {
    static const std::regex re(R"(\d{4})");
    std::smatch m;
    if (!std::regex_search(course_code, m, re)) return 1;

    const int first_digit = m.str(0)[0] - '0';
    if (first_digit == 0) return 1;
    return std::min(first_digit, 4);
}

TitleFields parse_title_fields(const std::string& raw_title) {
    struct Pattern {
        std::regex re;
        bool first_number_only;
    };

    // tried in order; department codes are 3 or 4 letters
    static const std::vector<Pattern> patterns = {
        {std::regex(R"(^([A-Z]{3,4}/[A-Z]{3,4})\s+(\d{4})\s+-\s+(.+?)\s+\(.+\)$)"), false},
        {std::regex(R"(^([A-Z]{3,4})\s+([\d-]+)\s+-\s+(.+?)\s+\(.+\)$)"), true},
        {std::regex(R"(^([A-Z]{3,4})\s+(\d{4}L)\s+-\s+(.+?)\s+\(.+\)$)"), false},
        {std::regex(R"(^([A-Z]{3,4})\s+(\d{4})\s+-\s+(.+?)\s+\(.+\)$)"), false},
        {std::regex(R"(^([A-Z]{3,4})\s+(\d{4})\s+-\s+(.+)$)"), false},
    };

    TitleFields out;
    const std::string title = textutil::collapse_whitespace(raw_title);

    for (const auto& p : patterns) {
        std::smatch m;
        if (!std::regex_match(title, m, p.re)) continue;

        std::string number = m[2].str();
        if (p.first_number_only) number = number.substr(0, number.find('-'));

        out.course_code = m[1].str() + " " + number;
        out.course_title = textutil::trim(m[3].str());
        break;
    }

    out.difficulty_level = difficulty_from_code(out.course_code);
    return out;
}

} // namespace catalog
