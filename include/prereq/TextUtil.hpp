#pragma once
#include <string>

namespace textutil {

// collapse every whitespace run to one space, trim both ends
std::string collapse_whitespace(const std::string& s);

std::string trim(const std::string& s);

// strip any of `chars` from both ends
std::string trim_chars(const std::string& s, const std::string& chars);

std::string to_lower_ascii(const std::string& s);

bool starts_with_icase(const std::string& s, const std::string& prefix);

}
