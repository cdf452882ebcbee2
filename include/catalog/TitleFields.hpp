#pragma once
#include <string>

namespace catalog {

struct TitleFields {
    std::string course_code;   // display form, e.g. "APLN 5331" or "SOC/ANTH 5280"
    std::string course_title;  // e.g. "Sociolinguistics"
    int difficulty_level = 1;  // 1..4
};

// Split a catalog display title such as "APLN 5331 - Sociolinguistics (3 cr.)".
// Empty code/title when nothing matches.
TitleFields parse_title_fields(const std::string& title);

// first digit of the course number, 0 -> 1, capped at 4, 1 when absent
int difficulty_from_code(const std::string& course_code);

} // namespace catalog
