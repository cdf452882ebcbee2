#include "prereq/Node.hpp"

#include <sstream>
#include <utility>

namespace prereq {

// ---------- Group / Concurrent value semantics ----------

Group::Group() = default;
Group::Group(Node expr) : expression(std::make_unique<Node>(std::move(expr))) {}
Group::Group(const Group& other)
    : expression(other.expression ? std::make_unique<Node>(*other.expression) : nullptr) {}
Group::Group(Group&& other) noexcept = default;
Group& Group::operator=(const Group& other) {
    if (this != &other) {
        expression = other.expression ? std::make_unique<Node>(*other.expression) : nullptr;
    }
    return *this;
}
Group& Group::operator=(Group&& other) noexcept = default;
Group::~Group() = default;

Concurrent::Concurrent() = default;
Concurrent::Concurrent(Node course_node, std::string note_text)
    : course(std::make_unique<Node>(std::move(course_node))), note(std::move(note_text)) {}
Concurrent::Concurrent(const Concurrent& other)
    : course(other.course ? std::make_unique<Node>(*other.course) : nullptr), note(other.note) {}
Concurrent::Concurrent(Concurrent&& other) noexcept = default;
Concurrent& Concurrent::operator=(const Concurrent& other) {
    if (this != &other) {
        course = other.course ? std::make_unique<Node>(*other.course) : nullptr;
        note = other.note;
    }
    return *this;
}
Concurrent& Concurrent::operator=(Concurrent&& other) noexcept = default;
Concurrent::~Concurrent() = default;

// ---------- factories ----------

Node make_course(std::string course_code, bool is_concurrent) {
    Course c;
    c.course_code = std::move(course_code);
    c.is_concurrent = is_concurrent;
    return Node{std::move(c)};
}

Node make_and(std::vector<Node> children) {
    return Node{And{std::move(children)}};
}

Node make_or(std::vector<Node> children) {
    return Node{Or{std::move(children)}};
}

Node make_group(Node expression) {
    return Node{Group(std::move(expression))};
}

Node make_concurrent(Node course, std::string note) {
    return Node{Concurrent(std::move(course), std::move(note))};
}

Node make_text(std::string condition, ConditionCategory category) {
    return Node{TextCondition{std::move(condition), category}};
}

std::optional<Node> combine_and(std::vector<Node> children) {
    if (children.empty()) return std::nullopt;
    if (children.size() == 1) return std::move(children.front());
    return make_and(std::move(children));
}

std::optional<Node> combine_or(std::vector<Node> children) {
    if (children.empty()) return std::nullopt;
    if (children.size() == 1) return std::move(children.front());
    return make_or(std::move(children));
}

// ---------- equality ----------

static bool same_ptr_value(const std::unique_ptr<Node>& a, const std::unique_ptr<Node>& b) {
    if (!a || !b) return !a && !b;
    return *a == *b;
}

bool operator==(const Course& a, const Course& b) {
    return a.course_code == b.course_code &&
           a.is_concurrent == b.is_concurrent &&
           a.is_optional == b.is_optional;
}

bool operator==(const And& a, const And& b) { return a.children == b.children; }
bool operator==(const Or& a, const Or& b) { return a.children == b.children; }

bool operator==(const Group& a, const Group& b) {
    return same_ptr_value(a.expression, b.expression);
}

bool operator==(const Concurrent& a, const Concurrent& b) {
    return a.note == b.note && same_ptr_value(a.course, b.course);
}

bool operator==(const TextCondition& a, const TextCondition& b) {
    return a.condition == b.condition && a.category == b.category;
}

bool operator==(const Node& a, const Node& b) { return a.value == b.value; }
bool operator!=(const Node& a, const Node& b) { return !(a == b); }

// ---------- category names ----------

const char* category_name(ConditionCategory c) {
    switch (c) {
        case ConditionCategory::Standing: return "standing";
        case ConditionCategory::Approval: return "approval";
        case ConditionCategory::Exemption: return "exemption";
        case ConditionCategory::Preparation: return "preparation";
        case ConditionCategory::Other: return "other";
    }
    return "other";
}

std::optional<ConditionCategory> category_from_name(const std::string& name) {
    if (name == "standing") return ConditionCategory::Standing;
    if (name == "approval") return ConditionCategory::Approval;
    if (name == "exemption") return ConditionCategory::Exemption;
    if (name == "preparation") return ConditionCategory::Preparation;
    if (name == "other") return ConditionCategory::Other;
    return std::nullopt;
}

// ---------- rendering ----------

namespace {

struct Renderer {
    std::ostringstream& out;

    void children(const char* tag, const std::vector<Node>& kids) {
        out << tag << "[";
        for (size_t i = 0; i < kids.size(); ++i) {
            if (i) out << ", ";
            std::visit(*this, kids[i].value);
        }
        out << "]";
    }

    void operator()(const Course& c) {
        out << "Course(" << c.course_code;
        if (c.is_concurrent) out << ", concurrent";
        if (c.is_optional) out << ", optional";
        out << ")";
    }
    void operator()(const And& a) { children("And", a.children); }
    void operator()(const Or& o) { children("Or", o.children); }
    void operator()(const Group& g) {
        out << "Group[";
        if (g.expression) std::visit(*this, g.expression->value);
        out << "]";
    }
    void operator()(const Concurrent& c) {
        out << "Concurrent(";
        if (c.course) std::visit(*this, c.course->value);
        out << ", note=\"" << c.note << "\")";
    }
    void operator()(const TextCondition& t) {
        out << "Text(\"" << t.condition << "\", " << category_name(t.category) << ")";
    }
};

} // namespace

std::string to_string(const Node& node) {
    std::ostringstream oss;
    Renderer r{oss};
    std::visit(r, node.value);
    return oss.str();
}

std::string to_string(const std::optional<Node>& node) {
    if (!node) return "None";
    return to_string(*node);
}

} // namespace prereq
