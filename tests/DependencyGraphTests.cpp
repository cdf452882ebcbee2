#include "TestHarness.hpp"

#include "graph/DependencyGraph.hpp"
#include "prereq/CourseAstAssembler.hpp"

#include <algorithm>
#include <set>
#include <vector>

namespace tests {

using graph::Direction;
using namespace prereq;

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ",";
        out += v[i];
    }
    return out;
}

static std::string join(const std::set<std::string>& s) {
    return join(std::vector<std::string>(s.begin(), s.end()));
}

static PrerequisiteAst ast_of(const std::string& prereq, const std::string& concurrent = "") {
    return CourseAstAssembler{}.assemble(prereq, concurrent);
}

static void test_collect_directions(TestContext& ctx) {
    std::vector<Node> kids;
    kids.push_back(make_course("CSCE1001"));
    kids.push_back(make_concurrent(make_course("CSCE1002")));
    kids.push_back(make_group(make_course("MACT1121")));
    kids.push_back(make_text("Senior standing", ConditionCategory::Standing));
    const Node tree = make_and(std::move(kids));

    ctx.check_eq(join(graph::collect_course_codes(tree, Direction::Prerequisite)), "CSCE1001,MACT1121",
                 "prerequisite walk skips Concurrent wrappers");
    ctx.check_eq(join(graph::collect_course_codes(tree, Direction::Corequisite)), "CSCE1001,CSCE1002,MACT1121",
                 "corequisite walk enters Concurrent wrappers");
}

static void test_three_course_catalog(TestContext& ctx) {
    // A requires B, C requires B
    const auto a = ast_of("CSCE 1001");
    const auto b = ast_of("");
    const auto c = ast_of("CSCE 1001 or MACT 1121");

    const graph::ReverseIndex idx = graph::build_reverse_index({
        {"CSCE2001", &a},
        {"CSCE1001", &b},
        {"CSCE3001", &c},
    });

    ctx.check_eq(join(idx.prerequisite_for("CSCE1001")), "CSCE2001,CSCE3001", "sorted dependents of B");
    ctx.check_eq(join(idx.prerequisite_for("MACT1121")), "CSCE3001", "code outside the catalog still keyed");
    ctx.check(idx.prerequisite_for("CSCE2001").empty(), "A is a leaf");
    ctx.check(idx.corequisite_for("CSCE1001").empty(), "no corequisite edges");
}

static void test_corequisite_map(TestContext& ctx) {
    const auto x = ast_of("CSCE 1001 and concurrent with CSCE 1002", "CSCE 1003");
    const auto idx = graph::build_reverse_index({{"CSCE2100", &x}});

    ctx.check_eq(join(idx.prerequisite_for("CSCE1001")), "CSCE2100", "prerequisite edge");
    ctx.check(idx.prerequisite_for("CSCE1002").empty(), "concurrent course is not a prerequisite");
    ctx.check_eq(join(idx.corequisite_for("CSCE1002")), "CSCE2100", "embedded concurrent edge");
    ctx.check_eq(join(idx.corequisite_for("CSCE1003")), "CSCE2100", "concurrent field edge");
}

static void test_skips_and_self_loops(TestContext& ctx) {
    const auto a = ast_of("CSCE 1001");
    const auto self = ast_of("CSCE 4999");

    const auto idx = graph::build_reverse_index({
        {"", &a},              // no join key
        {"CSCE2001", nullptr}, // no AST
        {"CSCE4999", &self},
    });

    ctx.check(idx.prerequisite_for("CSCE1001").empty(), "unkeyed course contributes no edges");
    ctx.check_eq(join(idx.prerequisite_for("CSCE4999")), "CSCE4999", "self reference kept");
}

static void test_duplicates_are_sets(TestContext& ctx) {
    const auto a = ast_of("CSCE 1001 or (CSCE 1001 and Senior standing)");
    const auto idx = graph::build_reverse_index({{"CSCE2001", &a}, {"CSCE2001", &a}});
    ctx.check_eq(join(idx.prerequisite_for("CSCE1001")), "CSCE2001", "one entry per dependent");
}

static void test_partition_merge(TestContext& ctx) {
    const auto a = ast_of("CSCE 1001 and concurrent with CSCE 1002");
    const auto b = ast_of("CSCE 1001 or CSCE 2001");
    const auto c = ast_of("CSCE 2001", "CSCE 1002");

    const std::vector<graph::CourseRequirements> all = {{"CSCE2001", &a}, {"CSCE3001", &b}, {"CSCE4001", &c}};
    const auto whole = graph::build_reverse_index(all);

    auto left = graph::build_reverse_index({all[0]});
    const auto right = graph::build_reverse_index({all[1], all[2]});
    left.merge(right);
    ctx.check(left == whole, "merged partitions equal the single build");

    auto again = left;
    again.merge(right);
    ctx.check(again == whole, "merge is idempotent");
}

static void test_inversion_property(TestContext& ctx) {
    const auto a = ast_of("CSCE 1001 and (CSCE 1101 or MACT 1121)");
    const auto b = ast_of("CSCE 1101 and concurrent with CSCE 2211");
    const auto c = ast_of("Junior standing or CSCE 2001");
    const std::vector<graph::CourseRequirements> courses = {{"CSCE2001", &a}, {"CSCE2211", &b}, {"CSCE3001", &c}};

    const auto edges = graph::collect_forward_edges(courses);
    const auto idx = graph::ReverseIndex::invert(edges);

    bool forward_ok = true;
    for (const auto& fe : edges) {
        for (const auto& p : fe.prerequisites) {
            const auto deps = idx.prerequisite_for(p);
            if (std::find(deps.begin(), deps.end(), fe.course_code) == deps.end()) forward_ok = false;
        }
    }
    ctx.check(forward_ok, "every collected prerequisite appears reversed");

    bool backward_ok = true;
    for (const auto& [required, dependents] : idx.prereq_of()) {
        for (const auto& d : dependents) {
            bool found = false;
            for (const auto& fe : edges) {
                if (fe.course_code == d && fe.prerequisites.count(required)) found = true;
            }
            if (!found) backward_ok = false;
        }
    }
    ctx.check(backward_ok, "every reversed edge was collected");
}

void register_dependency_graph_tests(TestRunner& runner) {
    runner.run("graph: collect directions", test_collect_directions);
    runner.run("graph: three course catalog", test_three_course_catalog);
    runner.run("graph: corequisite map", test_corequisite_map);
    runner.run("graph: skips and self loops", test_skips_and_self_loops);
    runner.run("graph: set semantics", test_duplicates_are_sets);
    runner.run("graph: partition merge", test_partition_merge);
    runner.run("graph: inversion property", test_inversion_property);
}

} // namespace tests
