#pragma once
#include "mergemaster/error.hpp"
#include "mergemaster/fs.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mergemaster {

struct IgnoreRule {
  std::string pattern;   // glob with the '!' prefix and leading/trailing '/' removed
  bool negated = false;  // "!pattern": re-includes what earlier rules excluded
  bool dir_only = false; // "pattern/": only matches directories
  bool anchored = false; // contained a '/': matched against the whole relative path
};

// Ordered gitignore-style rules. Immutable once parsed.
class IgnoreRuleSet {
public:
  IgnoreRuleSet() = default;

  // Parse ignore-file text; blank lines and comments are dropped.
  static IgnoreRuleSet parse(std::string_view text);

  [[nodiscard]] const std::vector<IgnoreRule>& rules() const { return rules_; }
  [[nodiscard]] bool empty() const { return rules_.empty(); }

  // Is `relative_path` ('/'-separated, relative to the rules' root) excluded?
  // A path under an excluded directory is excluded regardless of later negations.
  [[nodiscard]] bool ignores(std::string_view relative_path, bool is_dir = false) const;

private:
  explicit IgnoreRuleSet(std::vector<IgnoreRule> rules) : rules_(std::move(rules)) {}

  // Verdict of the last rule matching `path`: 1 = excluded, 0 = re-included, -1 = no match
  [[nodiscard]] int last_match(const std::vector<std::string>& segments, std::size_t count,
                               bool is_dir) const;

  std::vector<IgnoreRule> rules_;
};

// Inclusion test over absolute file paths
using PathPredicate = std::function<bool(const std::filesystem::path&)>;

// Predicate excluding files matched by <root>/.gitignore. Accepts everything when
// `enabled` is false, the ignore file is absent, or the rules cannot be loaded
// (the last case is recorded in `diagnostics`).
PathPredicate build_ignore_filter(const std::filesystem::path& root, bool enabled,
                                  const fs::Filesystem& fsys, Diagnostics& diagnostics);

} // namespace mergemaster
