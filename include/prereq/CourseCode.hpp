#pragma once
#include <optional>
#include <string>
#include <vector>

namespace prereq {

// Four uppercase letters, optional whitespace, four digits. Three-letter
// departments are deliberately not matched.
std::optional<std::string> first_course_code(const std::string& text);

// every occurrence, in order, normalized ("CSCE 1001" -> "CSCE1001")
std::vector<std::string> find_course_codes(const std::string& text);

// Join key for a catalog record: "CSCE 1101 - Fundamentals..." -> "CSCE1101".
// Empty when the title carries no code.
std::string course_code_from_title(const std::string& title);

} // namespace prereq
