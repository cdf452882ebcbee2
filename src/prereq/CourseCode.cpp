#include "prereq/CourseCode.hpp"

#include <regex>

namespace prereq {

static const std::regex& course_pattern() {
    static const std::regex re(R"(\b([A-Z]{4})\s*(\d{4})\b)");
    return re;
}

static std::string join_code(const std::smatch& m) {
    return m[1].str() + m[2].str();
}

std::optional<std::string> first_course_code(const std::string& text) {
    std::smatch m;
    if (std::regex_search(text, m, course_pattern())) return join_code(m);
    return std::nullopt;
}

std::vector<std::string> find_course_codes(const std::string& text) {
    std::vector<std::string> out;
    for (std::sregex_iterator it(text.begin(), text.end(), course_pattern()), end; it != end; ++it) {
        out.push_back(join_code(*it));
    }
    return out;
}

std::string course_code_from_title(const std::string& title) {
    static const std::regex re(R"(([A-Z]{4})\s*(\d{4}))");
    std::smatch m;
    if (std::regex_search(title, m, re)) return join_code(m);
    return "";
}

} // namespace prereq
