#pragma once
#include "prereq/ExpressionParser.hpp"
#include "prereq/Node.hpp"

#include <optional>
#include <string>

namespace prereq {

struct SplitRequirement {
    std::optional<Node> prerequisites;
    std::optional<Node> corequisites;
};

// Separates the prerequisite part of a requirement string from its
// concurrent (corequisite) part and parses each one.
class ConcurrentSplitter {
public:
    SplitRequirement split(const std::string& text) const;

    // Course codes in `text` wrapped in a Concurrent node: one code gives
    // Concurrent(Course), several give Concurrent(Or[Course...]), none gives
    // nullopt. A trailing "for <reason>" clause becomes the note.
    static std::optional<Node> parse_concurrent(const std::string& text);

    // text that is a concurrent statement from its first word
    static bool is_concurrent_only(const std::string& text);

private:
    static std::string extract_note(const std::string& text);

    ExpressionParser m_parser;
};

} // namespace prereq
