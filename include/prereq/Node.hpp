#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prereq {

enum class ConditionCategory {
    Standing,
    Approval,
    Exemption,
    Preparation,
    Other
};

struct Node;

struct Course {
    std::string course_code;     // e.g. "CSCE1001", no internal whitespace
    bool is_concurrent = false;  // "(or concurrent)" modifier
    bool is_optional = false;    // reserved, never set by the parser
};

struct And {
    std::vector<Node> children;  // at least one
};

struct Or {
    std::vector<Node> children;  // at least one
};

// Parenthesized sub-expression. Kept even when logically redundant so the
// original grouping can be rendered back.
struct Group {
    std::unique_ptr<Node> expression;

    Group();
    explicit Group(Node expr);
    Group(const Group& other);
    Group(Group&& other) noexcept;
    Group& operator=(const Group& other);
    Group& operator=(Group&& other) noexcept;
    ~Group();
};

struct Concurrent {
    std::unique_ptr<Node> course;  // Course, or Or of Course
    std::string note;

    Concurrent();
    Concurrent(Node course_node, std::string note_text);
    Concurrent(const Concurrent& other);
    Concurrent(Concurrent&& other) noexcept;
    Concurrent& operator=(const Concurrent& other);
    Concurrent& operator=(Concurrent&& other) noexcept;
    ~Concurrent();
};

struct TextCondition {
    std::string condition;  // verbatim fragment
    ConditionCategory category = ConditionCategory::Other;
};

struct Node {
    using Variant = std::variant<Course, And, Or, Group, Concurrent, TextCondition>;
    Variant value;

    template <typename T>
    const T* as() const { return std::get_if<T>(&value); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(value); }
};

Node make_course(std::string course_code, bool is_concurrent = false);
Node make_and(std::vector<Node> children);
Node make_or(std::vector<Node> children);
Node make_group(Node expression);
Node make_concurrent(Node course, std::string note = "");
Node make_text(std::string condition, ConditionCategory category);

// Collapse a combinator parse: no children -> nullopt, one child -> that child.
std::optional<Node> combine_and(std::vector<Node> children);
std::optional<Node> combine_or(std::vector<Node> children);

bool operator==(const Course& a, const Course& b);
bool operator==(const And& a, const And& b);
bool operator==(const Or& a, const Or& b);
bool operator==(const Group& a, const Group& b);
bool operator==(const Concurrent& a, const Concurrent& b);
bool operator==(const TextCondition& a, const TextCondition& b);
bool operator==(const Node& a, const Node& b);
bool operator!=(const Node& a, const Node& b);

const char* category_name(ConditionCategory c);
std::optional<ConditionCategory> category_from_name(const std::string& name);

// Compact one-line rendering, e.g. And[Course(CSCE1001), Group[Or[...]]]
std::string to_string(const Node& node);
std::string to_string(const std::optional<Node>& node);

} // namespace prereq
