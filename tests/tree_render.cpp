#include "mergemaster/tree.hpp"

#include <iostream>
#include <string>
#include <vector>

static std::vector<std::string> lines_of(const std::string &s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < s.size()) {
    const auto nl = s.find('\n', start);
    out.push_back(s.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

int main() {
  using mergemaster::render_tree;

  // single common root
  {
    const std::string got = render_tree({"proj/src/a.ts", "proj/src/b.ts"});
    const std::string want = "proj/\n"
                             "└── src/\n"
                             "    ├── a.ts\n"
                             "    └── b.ts\n";
    if (got != want) {
      std::cerr << "single root tree mismatch:\n" << got;
      return 1;
    }
  }

  // nested levels use the continuation glyphs of their ancestors
  {
    const std::string got = render_tree({"p/c/d/e", "p/b", "p/a/2", "p/a/1"});
    const std::string want = "p/\n"
                             "├── a/\n"
                             "│   ├── 1\n"
                             "│   └── 2\n"
                             "├── b\n"
                             "└── c/\n"
                             "    └── d/\n"
                             "        └── e\n";
    if (got != want) {
      std::cerr << "nested tree mismatch:\n" << got;
      return 1;
    }

    // one leaf line per file, one directory line per distinct proper prefix
    int leaves = 0;
    int dirs = 0;
    for (const auto &line : lines_of(got))
      (line.ends_with('/') ? dirs : leaves)++;
    if (leaves != 4 || dirs != 4) {
      std::cerr << "expected 4 leaves and 4 dirs, got " << leaves << " and " << dirs << "\n";
      return 1;
    }
  }

  // disjoint roots are listed one after another
  {
    const std::string got = render_tree({"b/x.txt", "a.txt"});
    if (got != "a.txt\nb/\n└── x.txt\n") {
      std::cerr << "disjoint roots mismatch:\n" << got;
      return 1;
    }
  }

  // insertion order does not matter
  if (render_tree({"r/z", "r/m/q", "r/a"}) != render_tree({"r/a", "r/m/q", "r/z"})) {
    std::cerr << "tree depends on insertion order\n";
    return 1;
  }

  if (!render_tree({}).empty()) {
    std::cerr << "empty set should render nothing\n";
    return 1;
  }

  // a node first seen as a file becomes a directory once it gains children
  {
    mergemaster::FileTree tree;
    tree.insert("p/x");
    tree.insert("p/x/y");
    const auto &p = tree.node(tree.node(mergemaster::FileTree::kRoot).children.at(0));
    const auto &x = tree.node(p.children.at(0));
    if (tree.size() != 4 || x.is_leaf || x.children.size() != 1) {
      std::cerr << "p/x should be a directory\n";
      return 1;
    }
    if (tree.render() != "p/\n└── x/\n    └── y\n") {
      std::cerr << "leaf promotion render mismatch:\n" << tree.render();
      return 1;
    }
  }

  // segment-wise ordering: "a" sorts before "a-b" even though '-' < '/'
  if (!mergemaster::tree_order_less("p/a/x", "p/a-b/x") ||
      mergemaster::tree_order_less("p/a-b/x", "p/a/x")) {
    std::cerr << "tree_order_less should compare by segment\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
