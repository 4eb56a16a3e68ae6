#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace lcmerge {

// ASCII lower-casing for case-insensitive name lookups.
inline std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace lcmerge
