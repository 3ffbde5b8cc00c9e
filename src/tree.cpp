#include "mergemaster/tree.hpp"

#include "mergemaster/consts.hpp"
#include "mergemaster/util.hpp"

#include <algorithm>

namespace mergemaster {

FileTree::FileTree() { nodes_.push_back(TreeNode{}); }

std::size_t FileTree::child(std::size_t parent, std::string_view name) {
  auto &kids = nodes_[parent].children;
  const auto it = std::ranges::lower_bound(
      kids, name, std::less<>{}, [this](std::size_t id) -> std::string_view { return nodes_[id].name; });
  if (it != kids.end() && nodes_[*it].name == name)
    return *it;

  const std::size_t id = nodes_.size();
  const auto pos = it - kids.begin();
  nodes_.push_back(TreeNode{.name = std::string(name)});
  // push_back may have reallocated; index the parent again
  auto &fresh = nodes_[parent].children;
  fresh.insert(fresh.begin() + pos, id);
  return id;
}

void FileTree::insert(std::string_view relative_path) {
  const auto parts = strutil::split(relative_path, consts::kSlash);
  std::size_t cur = kRoot;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (parts[i].empty())
      continue;
    const std::size_t next = child(cur, parts[i]);
    if (i + 1 == parts.size()) {
      if (nodes_[next].children.empty())
        nodes_[next].is_leaf = true;
    } else {
      // a directory is never a leaf, even if some path ended on it earlier
      nodes_[next].is_leaf = false;
    }
    cur = next;
  }
}

std::string FileTree::label(std::size_t id) const {
  const auto &n = nodes_[id];
  return n.children.empty() ? n.name : n.name + consts::kSlash;
}

void FileTree::render_children(std::size_t id, const std::string &prefix, std::string &out) const {
  const auto &kids = nodes_[id].children;
  for (std::size_t i = 0; i < kids.size(); ++i) {
    const bool last = i + 1 == kids.size();
    out += prefix;
    out += last ? consts::kBranchLast : consts::kBranchMid;
    out += label(kids[i]);
    out += consts::kLF;
    if (!nodes_[kids[i]].children.empty())
      render_children(kids[i], prefix + std::string(last ? consts::kIndentLast : consts::kIndentMid),
                      out);
  }
}

std::string FileTree::render() const {
  // each top-level node (one per disjoint root) starts its own zero-indent listing
  std::string out;
  for (const std::size_t top : nodes_[kRoot].children) {
    out += label(top);
    out += consts::kLF;
    render_children(top, "", out);
  }
  return out;
}

bool tree_order_less(std::string_view a, std::string_view b) {
  return std::ranges::lexicographical_compare(strutil::split(a, consts::kSlash),
                                              strutil::split(b, consts::kSlash));
}

std::string render_tree(const std::vector<std::string> &relative_paths) {
  FileTree tree;
  for (const auto &p : relative_paths)
    tree.insert(p);
  return tree.render();
}

} // namespace mergemaster
