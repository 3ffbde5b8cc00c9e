#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mergemaster {

struct TreeNode {
  std::string name;
  std::vector<std::size_t> children; // node ids, kept sorted by name
  bool is_leaf = false;              // a file; never true once the node has children
};

// Name trie over '/'-separated display paths. Nodes live in one arena; id 0 is the
// unnamed root.
class FileTree {
public:
  static constexpr std::size_t kRoot = 0;

  FileTree();

  // Add a file path; every segment but the last becomes a directory node.
  void insert(std::string_view relative_path);

  [[nodiscard]] const TreeNode& node(std::size_t id) const { return nodes_.at(id); }
  [[nodiscard]] std::size_t size() const { return nodes_.size(); }

  // ASCII rendering, one line per node. Empty when nothing was inserted.
  [[nodiscard]] std::string render() const;

private:
  std::size_t child(std::size_t parent, std::string_view name);
  void render_children(std::size_t id, const std::string& prefix, std::string& out) const;
  [[nodiscard]] std::string label(std::size_t id) const;

  std::vector<TreeNode> nodes_;
};

// Orders display paths segment by segment, the order the tree lists them in.
bool tree_order_less(std::string_view a, std::string_view b);

// Build and render in one step
std::string render_tree(const std::vector<std::string>& relative_paths);

} // namespace mergemaster
