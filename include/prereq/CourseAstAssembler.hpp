#pragma once
#include "prereq/ConcurrentSplitter.hpp"
#include "prereq/Node.hpp"

#include <optional>
#include <string>

namespace prereq {

struct PrerequisiteAst {
    std::optional<Node> prerequisites;  // nullopt: no prerequisite of this kind
    std::optional<Node> corequisites;
    std::string raw_text;
    std::string parse_error;            // set only when processing the course threw

    bool has_error() const { return !parse_error.empty(); }
};

bool operator==(const PrerequisiteAst& a, const PrerequisiteAst& b);

// AST recorded for a course whose processing failed
PrerequisiteAst make_error_ast(const std::string& raw_text, const std::string& message);

// Builds one course's AST from its prerequisite and concurrent fields.
class CourseAstAssembler {
public:
    PrerequisiteAst assemble(const std::string& prerequisites_text,
                             const std::string& concurrent_text = "") const;

private:
    ConcurrentSplitter m_splitter;
};

} // namespace prereq
