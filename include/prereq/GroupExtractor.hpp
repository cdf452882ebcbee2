#pragma once
#include "prereq/Node.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace prereq {

// Result of swapping every outermost balanced "(...)" span for an opaque
// token. Scratch data for one parse call only.
struct GroupExtraction {
    std::string text;                 // input with spans replaced by tokens
    std::vector<std::string> groups;  // span contents without parentheses, index = token number
};

std::string placeholder_token(std::size_t index);

// "(or concurrent)" spans and unbalanced parentheses stay in the text as-is.
GroupExtraction extract_groups(const std::string& text);

using InnerParser = std::function<std::optional<Node>(const std::string&)>;

// Walk a tree parsed from GroupExtraction::text and replace every leaf that is
// exactly a token with Group(parse_inner(content)). Groups whose content parses
// to nothing are dropped and the enclosing And/Or collapses accordingly.
std::optional<Node> reinsert_groups(Node node, const GroupExtraction& extraction, const InnerParser& parse_inner);

} // namespace prereq
