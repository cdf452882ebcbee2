#pragma once
#include "prereq/CourseAstAssembler.hpp"
#include "prereq/Node.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace graph {

enum class Direction {
    Prerequisite,  // Concurrent wrappers are not descended into
    Corequisite    // Concurrent wrappers are descended into
};

std::set<std::string> collect_course_codes(const prereq::Node& node, Direction dir);

struct CourseRequirements {
    std::string course_code;                        // join key, may be empty
    const prereq::PrerequisiteAst* ast = nullptr;   // not owned
};

// Forward references of one course, before inversion.
struct ForwardEdges {
    std::string course_code;
    std::set<std::string> prerequisites;
    std::set<std::string> corequisites;
};

// Pass 1: courses without a join key are skipped.
std::vector<ForwardEdges> collect_forward_edges(const std::vector<CourseRequirements>& courses);

// Reverse adjacency: required course -> courses that require it.
class ReverseIndex {
public:
    using Map = std::map<std::string, std::set<std::string>>;

    // Pass 2
    static ReverseIndex invert(const std::vector<ForwardEdges>& edges);

    void add_prerequisite_edge(const std::string& required, const std::string& dependent);
    void add_corequisite_edge(const std::string& required, const std::string& dependent);

    // set union per key; partitions built separately can be merged in any order
    void merge(const ReverseIndex& other);

    // sorted, deduplicated; empty for codes nothing depends on
    std::vector<std::string> prerequisite_for(const std::string& course_code) const;
    std::vector<std::string> corequisite_for(const std::string& course_code) const;

    const Map& prereq_of() const { return m_prereq_of; }
    const Map& coreq_of() const { return m_coreq_of; }

private:
    Map m_prereq_of;
    Map m_coreq_of;
};

ReverseIndex build_reverse_index(const std::vector<CourseRequirements>& courses);

bool operator==(const ReverseIndex& a, const ReverseIndex& b);

} // namespace graph
