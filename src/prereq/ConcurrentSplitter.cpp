#include "prereq/ConcurrentSplitter.hpp"
#include "prereq/CourseCode.hpp"
#include "prereq/TextUtil.hpp"

#include <regex>
#include <utility>
#include <vector>

namespace prereq {

bool ConcurrentSplitter::is_concurrent_only(const std::string& text) {
    return textutil::starts_with_icase(text, "concurrent") ||
           textutil::starts_with_icase(text, "prerequisite: concurrent");
}

std::string ConcurrentSplitter::extract_note(const std::string& text) {
    static const std::regex re(R"(\bfor\s+([^.]+))", std::regex::icase);
    std::smatch m;
    if (!std::regex_search(text, m, re)) return "";
    return textutil::trim(m[1].str());
}

std::optional<Node> ConcurrentSplitter::parse_concurrent(const std::string& text) {
    if (text.empty()) return std::nullopt;

    const auto codes = find_course_codes(text);
    if (codes.empty()) return std::nullopt;

    std::string note = extract_note(text);

    if (codes.size() == 1) {
        return make_concurrent(make_course(codes.front()), std::move(note));
    }

    std::vector<Node> alternatives;
    alternatives.reserve(codes.size());
    for (const auto& code : codes) alternatives.push_back(make_course(code));
    return make_concurrent(make_or(std::move(alternatives)), std::move(note));
}

SplitRequirement ConcurrentSplitter::split(const std::string& raw) const {
    SplitRequirement out;

    const std::string text = textutil::collapse_whitespace(raw);
    if (text.empty()) return out;

    if (is_concurrent_only(text)) {
        out.corequisites = parse_concurrent(text);
        return out;
    }

    static const std::regex transition(
        R"(,?\s*and\s+concurrent(?:ly)?\s+with|must\s+be\s+taken\s+concurrently\s+with)",
        std::regex::icase);

    std::smatch m;
    if (std::regex_search(text, m, transition)) {
        const std::string prereq_part = textutil::trim(m.prefix().str());
        const std::string concurrent_part = textutil::trim(m.suffix().str());

        if (!prereq_part.empty()) out.prerequisites = m_parser.parse(prereq_part);
        if (!concurrent_part.empty()) out.corequisites = parse_concurrent(concurrent_part);
        return out;
    }

    out.prerequisites = m_parser.parse(text);
    return out;
}

} // namespace prereq
