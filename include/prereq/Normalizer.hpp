#pragma once
#include <string>

namespace prereq {

// Drop catalog labels such as "Pre-requisites or concurrent:" or
// "Prerequisite:" from the front of the text (case-insensitive).
std::string strip_leading_labels(const std::string& text);

// collapse whitespace + strip labels; empty in, empty out
std::string normalize_requirement(const std::string& raw);

} // namespace prereq
