#include "TestHarness.hpp"

#include "catalog/CatalogPipeline.hpp"
#include "graph/DependencyGraph.hpp"
#include "prereq/CourseCode.hpp"

#include <set>
#include <stdexcept>
#include <vector>

namespace tests {

using catalog::CourseRecord;

static CourseRecord course(const std::string& title, const std::string& prereq, const std::string& concurrent = "") {
    CourseRecord r;
    r.source = nlohmann::ordered_json::object();
    r.title = title;
    r.prerequisites = prereq;
    r.concurrent = concurrent;
    return r;
}

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ",";
        out += v[i];
    }
    return out;
}

static std::vector<CourseRecord> sample_catalog() {
    std::vector<CourseRecord> records;
    records.push_back(course("CSCE 2001 - Data Structures (3 cr.)", "CSCE 1001"));
    records.push_back(course("CSCE 1001 - Fundamentals (3 cr.)", ""));
    records.push_back(course("CSCE 3001 - Algorithms (3 cr.)", "CSCE 1001 and Junior standing"));
    records.push_back(course("CSCE 1002 - Fundamentals Lab (1 cr.)", "Concurrent with CSCE 1001"));
    records.push_back(course("Orientation Seminar", "CSCE 1001"));
    return records;
}

static void test_parse_stats(TestContext& ctx) {
    auto records = sample_catalog();
    const auto stats = catalog::parse_catalog(records);

    ctx.check_eq(stats.total, 5, "total");
    ctx.check_eq(stats.empty, 1, "empty");
    ctx.check_eq(stats.with_prerequisites, 3, "with prerequisites");
    ctx.check_eq(stats.with_corequisites, 1, "with corequisites");
    ctx.check_eq(stats.errors, 0, "no errors");

    bool all_have_ast = true;
    for (const auto& r : records) all_have_ast = all_have_ast && r.ast.has_value();
    ctx.check(all_have_ast, "every record gets an AST, empty ones included");
}

static void test_failure_is_local(TestContext& ctx) {
    auto records = sample_catalog();
    const prereq::CourseAstAssembler assembler;

    const auto stats = catalog::parse_catalog(records, [&](const CourseRecord& r) {
        if (r.title.rfind("CSCE 3001", 0) == 0) throw std::runtime_error("unexpected input");
        return assembler.assemble(r.prerequisites, r.concurrent);
    });

    ctx.check_eq(stats.errors, 1, "one error counted");
    ctx.check_eq(stats.failures.size() == 1 ? stats.failures[0].message : "", "unexpected input", "failure recorded");

    const auto& bad = records[2];
    ctx.check(bad.ast.has_value() && bad.ast->has_error(), "failed course carries the marker");
    ctx.check(bad.ast.has_value() && !bad.ast->prerequisites && !bad.ast->corequisites, "trees cleared");
    ctx.check_eq(bad.ast.has_value() ? bad.ast->raw_text : "", "CSCE 1001 and Junior standing", "raw text kept");

    ctx.check(records[0].ast.has_value() && records[0].ast->prerequisites.has_value(), "earlier course parsed");
    ctx.check(records[3].ast.has_value() && records[3].ast->corequisites.has_value(), "later course parsed");
}

static void test_link(TestContext& ctx) {
    auto records = sample_catalog();
    catalog::parse_catalog(records);
    const auto stats = catalog::link_catalog(records);

    ctx.check_eq(join(records[1].is_prerequisite_for), "CSCE2001,CSCE3001", "sorted reverse prerequisites");
    ctx.check_eq(join(records[1].is_corequisite_for), "CSCE1002", "reverse corequisites");
    ctx.check(records[0].is_prerequisite_for.empty(), "nothing requires CSCE 2001");
    ctx.check(records[4].linked && records[4].is_prerequisite_for.empty(), "unkeyed course kept with empty lists");

    ctx.check_eq(stats.unkeyed, 1, "unkeyed count");
    ctx.check_eq(stats.with_prereq_for, 1, "courses required as prerequisite");
    ctx.check_eq(stats.with_coreq_for, 1, "courses required as corequisite");
    ctx.check_eq(stats.leaves, 4, "leaf courses");
    ctx.check(stats.most_required.size() == 1 && stats.most_required[0].course_code == "CSCE1001" &&
                  stats.most_required[0].dependents == 2,
              "most required course");
}

static void test_leaf_totals(TestContext& ctx) {
    auto records = sample_catalog();
    catalog::parse_catalog(records);
    catalog::link_catalog(records);

    std::vector<graph::CourseRequirements> inputs;
    for (const auto& r : records) inputs.push_back({prereq::course_code_from_title(r.title), &*r.ast});

    std::set<std::string> collected;
    for (const auto& fe : graph::collect_forward_edges(inputs)) {
        collected.insert(fe.prerequisites.begin(), fe.prerequisites.end());
    }

    int empty_lists = 0;
    int never_collected = 0;
    for (const auto& r : records) {
        if (r.is_prerequisite_for.empty()) ++empty_lists;
        if (!collected.count(prereq::course_code_from_title(r.title))) ++never_collected;
    }
    ctx.check_eq(empty_lists, never_collected, "leaf count matches codes never collected");
}

static void test_link_without_ast(TestContext& ctx) {
    auto records = sample_catalog();
    const auto stats = catalog::link_catalog(records);
    ctx.check_eq(stats.with_ast, 0, "nothing parsed yet");
    ctx.check_eq(stats.leaves, 5, "every course is a leaf");
}

static void test_link_skips_unreadable_ast(TestContext& ctx) {
    auto records = sample_catalog();
    catalog::parse_catalog(records);
    records[0].ast.reset();
    records[0].ast_error = "root[0].prerequisite_ast must be an object";

    const auto stats = catalog::link_catalog(records);
    ctx.check_eq(stats.unreadable.size(), 1, "unreadable AST reported");
    ctx.check_eq(join(records[1].is_prerequisite_for), "CSCE3001", "course without an AST contributes no edges");

    catalog::parse_catalog(records);
    ctx.check(records[0].ast_error.empty() && records[0].ast.has_value(), "reparse replaces the unreadable AST");
}

static void test_load_error_marks_record(TestContext& ctx) {
    auto records = sample_catalog();
    records[2].load_error = "root[2].concurrent must be a string";

    const auto stats = catalog::parse_catalog(records);
    ctx.check_eq(stats.errors, 1, "counted as an error");
    ctx.check_eq(stats.empty, 1, "not counted as empty");
    ctx.check_eq(records[2].ast ? records[2].ast->parse_error : "", "root[2].concurrent must be a string",
                 "load problem becomes the marker");
    ctx.check(records[0].ast && records[0].ast->prerequisites.has_value(), "neighbours parsed");
}

static void test_annotate_titles(TestContext& ctx) {
    auto records = sample_catalog();
    const int matched = catalog::annotate_titles(records);
    ctx.check_eq(matched, 4, "four titles carry a course code");
    ctx.check(records[0].title_fields && records[0].title_fields->course_code == "CSCE 2001", "display code");
    ctx.check(records[4].title_fields && records[4].title_fields->course_code.empty(), "no match stays empty");
}

void register_pipeline_tests(TestRunner& runner) {
    runner.run("pipeline: parse stats", test_parse_stats);
    runner.run("pipeline: failure is local to one course", test_failure_is_local);
    runner.run("pipeline: link", test_link);
    runner.run("pipeline: leaf totals", test_leaf_totals);
    runner.run("pipeline: link without ASTs", test_link_without_ast);
    runner.run("pipeline: load error marks record", test_load_error_marks_record);
    runner.run("pipeline: link skips unreadable AST", test_link_skips_unreadable_ast);
    runner.run("pipeline: annotate titles", test_annotate_titles);
}

} // namespace tests
