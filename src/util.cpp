// String helpers shared by config parsing and path handling
#include "mergemaster/util.hpp"

#include <algorithm>
#include <cctype>

namespace mergemaster::strutil {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split(std::string_view str, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = str.find(sep, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(str.substr(start));
      return out;
    }
    out.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
}

std::optional<bool> parse_bool(std::string_view str) {
  std::string s(str);
  std::ranges::transform(s, s.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  if (s == "true" || s == "yes" || s == "on" || s == "1")
    return true;
  if (s == "false" || s == "no" || s == "off" || s == "0")
    return false;
  return std::nullopt;
}

} // namespace mergemaster::strutil
