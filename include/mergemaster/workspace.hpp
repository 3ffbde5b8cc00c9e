#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace mergemaster {

// Base directory against which display paths and ignore rules are computed.
class Workspace {
public:
  Workspace() = default; // no root: display paths degrade to base names
  explicit Workspace(const std::filesystem::path& root);

  [[nodiscard]] bool has_root() const { return !root_.empty(); }
  [[nodiscard]] const std::filesystem::path& root() const { return root_; }

  // Root directory's own base name, e.g. "proj" for /home/u/proj
  [[nodiscard]] std::string root_name() const;

  // "<root name>/<path relative to root>" with '/' separators,
  // or the base name of `abs` when there is no root.
  [[nodiscard]] std::string relative_path(const std::filesystem::path& abs) const;

private:
  std::filesystem::path root_;
};

// Nearest ancestor of `start` (inclusive) holding .git or .mergemaster
std::optional<std::filesystem::path> find_workspace_root(const std::filesystem::path& start);

} // namespace mergemaster
