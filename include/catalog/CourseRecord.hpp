#pragma once
#include "catalog/TitleFields.hpp"
#include "prereq/CourseAstAssembler.hpp"

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace catalog {

struct CourseRecord {
    nlohmann::ordered_json source;   // record as loaded; unknown fields pass through
    std::string title;               // "CSCE 1101 - Fundamentals of ..."
    std::string prerequisites;       // raw catalog text
    std::string concurrent;          // raw catalog text

    std::optional<prereq::PrerequisiteAst> ast;

    // Shape problems found on load. load_error turns into a parse_error
    // marker on the next parse; ast_error means the stored AST was unreadable
    // and `ast` was left empty.
    std::string load_error;
    std::string ast_error;

    bool linked = false;             // reverse fields below are valid
    std::vector<std::string> is_prerequisite_for;
    std::vector<std::string> is_corequisite_for;

    std::optional<TitleFields> title_fields;
};

} // namespace catalog
