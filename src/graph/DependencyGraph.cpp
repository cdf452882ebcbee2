#include "graph/DependencyGraph.hpp"

#include <utility>
#include <variant>

namespace graph {

namespace {

struct CodeCollector {
    Direction dir;
    std::set<std::string>& out;

    void walk(const prereq::Node& n) { std::visit(*this, n.value); }

    void operator()(const prereq::Course& c) {
        if (!c.course_code.empty()) out.insert(c.course_code);
    }
    void operator()(const prereq::And& a) {
        for (const auto& child : a.children) walk(child);
    }
    void operator()(const prereq::Or& o) {
        for (const auto& child : o.children) walk(child);
    }
    void operator()(const prereq::Group& g) {
        if (g.expression) walk(*g.expression);
    }
    void operator()(const prereq::Concurrent& c) {
        // a concurrent requirement is not a true prerequisite
        if (dir == Direction::Corequisite && c.course) walk(*c.course);
    }
    void operator()(const prereq::TextCondition&) {}
};

} // namespace

std::set<std::string> collect_course_codes(const prereq::Node& node, Direction dir) {
    std::set<std::string> out;
    CodeCollector c{dir, out};
    c.walk(node);
    return out;
}

std::vector<ForwardEdges> collect_forward_edges(const std::vector<CourseRequirements>& courses) {
    std::vector<ForwardEdges> out;
    out.reserve(courses.size());

    for (const auto& course : courses) {
        if (course.course_code.empty() || !course.ast) continue;

        ForwardEdges fe;
        fe.course_code = course.course_code;
        if (course.ast->prerequisites) {
            fe.prerequisites = collect_course_codes(*course.ast->prerequisites, Direction::Prerequisite);
        }
        if (course.ast->corequisites) {
            fe.corequisites = collect_course_codes(*course.ast->corequisites, Direction::Corequisite);
        }
        out.push_back(std::move(fe));
    }
    return out;
}

void ReverseIndex::add_prerequisite_edge(const std::string& required, const std::string& dependent) {
    if (required.empty() || dependent.empty()) return;
    m_prereq_of[required].insert(dependent);
}

void ReverseIndex::add_corequisite_edge(const std::string& required, const std::string& dependent) {
    if (required.empty() || dependent.empty()) return;
    m_coreq_of[required].insert(dependent);
}

ReverseIndex ReverseIndex::invert(const std::vector<ForwardEdges>& edges) {
    ReverseIndex idx;
    for (const auto& fe : edges) {
        for (const auto& p : fe.prerequisites) idx.add_prerequisite_edge(p, fe.course_code);
        for (const auto& q : fe.corequisites) idx.add_corequisite_edge(q, fe.course_code);
    }
    return idx;
}

void ReverseIndex::merge(const ReverseIndex& other) {
    for (const auto& [code, deps] : other.m_prereq_of) m_prereq_of[code].insert(deps.begin(), deps.end());
    for (const auto& [code, deps] : other.m_coreq_of) m_coreq_of[code].insert(deps.begin(), deps.end());
}

static std::vector<std::string> lookup(const ReverseIndex::Map& m, const std::string& code) {
    auto it = m.find(code);
    if (it == m.end()) return {};
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> ReverseIndex::prerequisite_for(const std::string& course_code) const {
    return lookup(m_prereq_of, course_code);
}

std::vector<std::string> ReverseIndex::corequisite_for(const std::string& course_code) const {
    return lookup(m_coreq_of, course_code);
}

ReverseIndex build_reverse_index(const std::vector<CourseRequirements>& courses) {
    return ReverseIndex::invert(collect_forward_edges(courses));
}

bool operator==(const ReverseIndex& a, const ReverseIndex& b) {
    return a.prereq_of() == b.prereq_of() && a.coreq_of() == b.coreq_of();
}

} // namespace graph
