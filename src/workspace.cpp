#include "mergemaster/workspace.hpp"

#include "mergemaster/consts.hpp"
#include "mergemaster/fs.hpp"

namespace stdfs = std::filesystem;

namespace mergemaster {

Workspace::Workspace(const stdfs::path &root) {
  if (root.empty())
    return;
  root_ = fs::resolved_path(root);
}

std::string Workspace::root_name() const { return root_.filename().generic_string(); }

std::string Workspace::relative_path(const stdfs::path &abs) const {
  const stdfs::path norm = fs::resolved_path(abs, false);
  if (!has_root())
    return norm.filename().generic_string();

  const std::string rel = norm.lexically_relative(root_).generic_string();
  const std::string name = root_name();
  if (name.empty())
    return rel;
  if (rel.empty() || rel == ".")
    return name;
  return name + consts::kSlash + rel;
}

std::optional<stdfs::path> find_workspace_root(const stdfs::path &start) {
  stdfs::path cur = fs::resolved_path(start);
  while (true) {
    if (fs::exists(cur / consts::kGitDir) || fs::exists(cur / consts::kConfigDir))
      return cur;
    if (!cur.has_parent_path() || cur.parent_path() == cur)
      return std::nullopt;
    cur = cur.parent_path();
  }
}

} // namespace mergemaster
