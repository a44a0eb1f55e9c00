#pragma once

#include <algorithm>
#include <cctype>
#include <string_view>

namespace ViewMapper::StringUtils
{

  inline std::string_view Trim(std::string_view Value)
  {
    while (!Value.empty() && std::isspace(static_cast<unsigned char>(Value.front())))
    {
      Value.remove_prefix(1);
    }
    while (!Value.empty() && std::isspace(static_cast<unsigned char>(Value.back())))
    {
      Value.remove_suffix(1);
    }
    return Value;
  }

  inline bool EqualsIgnoreCase(std::string_view A, std::string_view B)
  {
    return A.size() == B.size() && std::equal(A.begin(), A.end(), B.begin(), [](char X, char Y) {
             return std::tolower(static_cast<unsigned char>(X)) == std::tolower(static_cast<unsigned char>(Y));
           });
  }

  // Boolean init parameters: surrounding whitespace ignored, case-insensitive
  inline bool IsFlag(std::string_view Value, std::string_view Flag)
  {
    return EqualsIgnoreCase(Trim(Value), Flag);
  }

} // namespace ViewMapper::StringUtils
