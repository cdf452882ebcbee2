#pragma once
#include "catalog/CourseRecord.hpp"
#include "prereq/CourseAstAssembler.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace catalog {

struct CourseFailure {
    std::string title;
    std::string message;
};

struct ParseStats {
    int total = 0;
    int with_prerequisites = 0;
    int with_corequisites = 0;
    int empty = 0;
    int errors = 0;
    std::vector<CourseFailure> failures;
};

struct RequiredCourse {
    std::string course_code;
    std::size_t dependents = 0;
};

struct LinkStats {
    int total = 0;
    int with_ast = 0;
    int unkeyed = 0;            // title yielded no course code
    int with_prereq_for = 0;
    int with_coreq_for = 0;
    int leaves = 0;             // required by nothing, either way
    std::vector<CourseFailure> unreadable;      // stored AST could not be read; linked as absent
    std::vector<RequiredCourse> most_required;  // top 5 by is_prerequisite_for size
};

using AstBuilder = std::function<prereq::PrerequisiteAst(const CourseRecord&)>;

// Attaches an AST to every record. A builder that throws, or a record that
// failed to load cleanly, marks only that record with a parse error; the
// rest of the batch continues.
ParseStats parse_catalog(std::vector<CourseRecord>& records, const AstBuilder& build);
ParseStats parse_catalog(std::vector<CourseRecord>& records);

// Builds the reverse-dependency index over every record's AST and writes
// the sorted is_prerequisite_for / is_corequisite_for lists back.
LinkStats link_catalog(std::vector<CourseRecord>& records);

// Fills title_fields from each record's title; returns how many matched.
int annotate_titles(std::vector<CourseRecord>& records);

} // namespace catalog
