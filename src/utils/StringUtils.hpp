#pragma once

#include <string>

namespace string_utils
{

// Trims trailing whitespace from a string.
std::string Rtrim(std::string str);

// Trims leading whitespace from a string.
std::string Ltrim(std::string str);

// Trims leading and trailing whitespace from a string.
std::string Trim(std::string str);

// ASCII lower-case copy.
std::string ToLower(std::string str);

}  // namespace string_utils
