#include "catalog/CatalogPipeline.hpp"

#include "graph/DependencyGraph.hpp"
#include "prereq/CourseCode.hpp"
#include "prereq/TextUtil.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace catalog {

ParseStats parse_catalog(std::vector<CourseRecord>& records, const AstBuilder& build) {
    ParseStats stats;
    stats.total = static_cast<int>(records.size());

    for (auto& rec : records) {
        const std::string prereq_text = textutil::trim(rec.prerequisites);
        const std::string concurrent_text = textutil::trim(rec.concurrent);

        rec.ast_error.clear();
        if (!rec.load_error.empty()) {
            rec.ast = prereq::make_error_ast(prereq_text, rec.load_error);
            stats.errors += 1;
            stats.failures.push_back({rec.title, rec.load_error});
            continue;
        }

        if (prereq_text.empty() && concurrent_text.empty()) stats.empty += 1;

        try {
            rec.ast = build(rec);
        } catch (const std::exception& e) {
            rec.ast = prereq::make_error_ast(prereq_text, e.what());
            stats.errors += 1;
            stats.failures.push_back({rec.title, e.what()});
            continue;
        }

        if (rec.ast->prerequisites) stats.with_prerequisites += 1;
        if (rec.ast->corequisites) stats.with_corequisites += 1;
    }

    return stats;
}

ParseStats parse_catalog(std::vector<CourseRecord>& records) {
    const prereq::CourseAstAssembler assembler;
    return parse_catalog(records, [&assembler](const CourseRecord& rec) {
        return assembler.assemble(rec.prerequisites, rec.concurrent);
    });
}

LinkStats link_catalog(std::vector<CourseRecord>& records) {
    LinkStats stats;
    stats.total = static_cast<int>(records.size());

    std::vector<std::string> keys;
    keys.reserve(records.size());

    std::vector<graph::CourseRequirements> inputs;
    inputs.reserve(records.size());

    for (const auto& rec : records) {
        std::string code = prereq::course_code_from_title(rec.title);
        if (code.empty()) stats.unkeyed += 1;
        if (rec.ast) stats.with_ast += 1;
        if (!rec.ast_error.empty()) stats.unreadable.push_back({rec.title, rec.ast_error});

        inputs.push_back({code, rec.ast ? &*rec.ast : nullptr});
        keys.push_back(std::move(code));
    }

    const graph::ReverseIndex index = graph::build_reverse_index(inputs);

    for (size_t i = 0; i < records.size(); ++i) {
        auto& rec = records[i];
        rec.linked = true;
        rec.is_prerequisite_for.clear();
        rec.is_corequisite_for.clear();

        if (!keys[i].empty()) {
            rec.is_prerequisite_for = index.prerequisite_for(keys[i]);
            rec.is_corequisite_for = index.corequisite_for(keys[i]);
        }

        if (!rec.is_prerequisite_for.empty()) stats.with_prereq_for += 1;
        if (!rec.is_corequisite_for.empty()) stats.with_coreq_for += 1;
        if (rec.is_prerequisite_for.empty() && rec.is_corequisite_for.empty()) stats.leaves += 1;

        if (!rec.is_prerequisite_for.empty()) {
            stats.most_required.push_back({keys[i], rec.is_prerequisite_for.size()});
        }
    }

    std::sort(stats.most_required.begin(), stats.most_required.end(),
              [](const RequiredCourse& a, const RequiredCourse& b) {
                  if (a.dependents != b.dependents) return a.dependents > b.dependents;
                  return a.course_code < b.course_code;
              });
    if (stats.most_required.size() > 5) stats.most_required.resize(5);

    return stats;
}

int annotate_titles(std::vector<CourseRecord>& records) {
    int matched = 0;
    for (auto& rec : records) {
        rec.title_fields = parse_title_fields(rec.title);
        if (!rec.title_fields->course_code.empty()) matched += 1;
    }
    return matched;
}

} // namespace catalog
