#include "prereq/CourseAstAssembler.hpp"
#include "prereq/TextUtil.hpp"

#include <utility>
#include <vector>

namespace prereq {

bool operator==(const PrerequisiteAst& a, const PrerequisiteAst& b) {
    return a.prerequisites == b.prerequisites &&
           a.corequisites == b.corequisites &&
           a.raw_text == b.raw_text &&
           a.parse_error == b.parse_error;
}

PrerequisiteAst make_error_ast(const std::string& raw_text, const std::string& message) {
    PrerequisiteAst ast;
    ast.raw_text = raw_text;
    ast.parse_error = message.empty() ? "unknown error" : message;
    return ast;
}

PrerequisiteAst CourseAstAssembler::assemble(const std::string& prerequisites_text,
                                             const std::string& concurrent_text) const {
    PrerequisiteAst ast;

    const std::string prereq = textutil::trim(prerequisites_text);
    const std::string concurrent = textutil::trim(concurrent_text);
    if (prereq.empty() && concurrent.empty()) return ast;

    ast.raw_text = prereq;

    SplitRequirement split = m_splitter.split(prereq);
    ast.prerequisites = std::move(split.prerequisites);
    ast.corequisites = std::move(split.corequisites);

    if (!concurrent.empty()) {
        ast.raw_text += " | Concurrent: " + concurrent;

        // both sources kept side by side, duplicates included
        if (auto from_field = ConcurrentSplitter::parse_concurrent(textutil::collapse_whitespace(concurrent))) {
            if (ast.corequisites) {
                std::vector<Node> both;
                both.push_back(std::move(*ast.corequisites));
                both.push_back(std::move(*from_field));
                ast.corequisites = make_and(std::move(both));
            } else {
                ast.corequisites = std::move(from_field);
            }
        }
    }

    return ast;
}

} // namespace prereq
