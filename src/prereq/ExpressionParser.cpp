#include "prereq/ExpressionParser.hpp"
#include "prereq/GroupExtractor.hpp"
#include "prereq/Normalizer.hpp"
#include "prereq/TextUtil.hpp"

#include <regex>
#include <utility>

namespace prereq {

static std::vector<std::string> split_on(const std::string& text, const std::regex& sep) {
    std::vector<std::string> parts;
    for (std::sregex_token_iterator it(text.begin(), text.end(), sep, -1), end; it != end; ++it) {
        parts.push_back(textutil::trim(it->str()));
    }
    if (parts.empty()) parts.push_back(textutil::trim(text));
    return parts;
}

std::vector<std::string> ExpressionParser::split_conjunction(const std::string& text) {
    static const std::regex re(R"(\s+and\s+(?!concurrent\b))", std::regex::icase);
    return split_on(text, re);
}

std::vector<std::string> ExpressionParser::split_disjunction(const std::string& text) {
    static const std::regex re(R"(\s+or\s+)", std::regex::icase);
    return split_on(text, re);
}

std::optional<Node> ExpressionParser::parse_disjunction(const std::string& text) const {
    if (text.empty()) return std::nullopt;

    const auto parts = split_disjunction(text);
    if (parts.size() == 1) return m_atomic.classify(parts.front());

    std::vector<Node> children;
    children.reserve(parts.size());
    for (const auto& part : parts) {
        if (auto child = m_atomic.classify(part)) children.push_back(std::move(*child));
    }
    return combine_or(std::move(children));
}

std::optional<Node> ExpressionParser::parse(const std::string& text) const {
    const std::string t = normalize_requirement(text);
    if (t.empty()) return std::nullopt;

    // groups first; only falls through when nothing could be substituted
    if (t.find('(') != std::string::npos && t.find(')') != std::string::npos) {
        GroupExtraction ex = extract_groups(t);
        if (!ex.groups.empty()) {
            auto outer = parse(ex.text);
            if (!outer) return std::nullopt;
            return reinsert_groups(std::move(*outer), ex,
                                   [this](const std::string& inner) { return parse(inner); });
        }
    }

    const auto parts = split_conjunction(t);
    if (parts.size() > 1) {
        std::vector<Node> children;
        children.reserve(parts.size());
        for (const auto& part : parts) {
            if (auto child = parse_disjunction(part)) children.push_back(std::move(*child));
        }
        return combine_and(std::move(children));
    }

    return parse_disjunction(t);
}

} // namespace prereq
