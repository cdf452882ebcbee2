#pragma once
#include "prereq/Node.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace prereq {

// Turns one fragment without and/or structure into a leaf: a Course
// reference, a TextCondition, or nothing when the fragment is noise.
class AtomicClassifier {
public:
    // "other" text at or below this length is dropped
    static constexpr std::size_t kMinOtherLength = 5;

    std::optional<Node> classify(const std::string& fragment) const;

    // keyword table lookup on free text, first matching category wins
    static ConditionCategory categorize(const std::string& text);

private:
    // removes an inline "(or concurrent)" modifier; true if one was present
    static bool strip_concurrent_modifier(std::string& text);
};

} // namespace prereq
