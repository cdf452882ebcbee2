#pragma once
#include "prereq/AtomicClassifier.hpp"
#include "prereq/Node.hpp"

#include <optional>
#include <string>
#include <vector>

namespace prereq {

// Recursive parser for one requirement expression.
//
// "and" is the outer split and "or" the inner one, so "A or B and C" reads as
// And[Or[A, B], C]. Catalog text is written as lists of alternatives joined by
// "and"; this is not the usual boolean precedence and is kept on purpose.
// Parenthesized spans are handled before either split.
class ExpressionParser {
public:
    std::optional<Node> parse(const std::string& text) const;

    // whitespace-delimited "and", except "and concurrent"
    static std::vector<std::string> split_conjunction(const std::string& text);

    // whitespace-delimited "or"
    static std::vector<std::string> split_disjunction(const std::string& text);

private:
    std::optional<Node> parse_disjunction(const std::string& text) const;

    AtomicClassifier m_atomic;
};

} // namespace prereq
