#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mergemaster {

// String helpers
namespace strutil {
  // Strip leading/trailing spaces, tabs and a trailing CR
  std::string trim(std::string_view str);

  // Split on `sep`, keeping empty fields
  std::vector<std::string> split(std::string_view str, char sep);

  // "true"/"yes"/"on"/"1" and "false"/"no"/"off"/"0" (case-insensitive)
  std::optional<bool> parse_bool(std::string_view str);
}

}
