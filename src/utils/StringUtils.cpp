#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace string_utils
{

std::string Ltrim(std::string str)
{
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char chr) { return !std::isspace(chr); }));
    return str;
}

std::string Rtrim(std::string str)
{
    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char chr) { return !std::isspace(chr); }).base(), str.end());
    return str;
}

std::string Trim(std::string str)
{
    return Ltrim(Rtrim(std::move(str)));
}

std::string ToLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
    return str;
}

}  // namespace string_utils
