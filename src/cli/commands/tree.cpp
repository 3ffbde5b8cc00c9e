#include "cli/invocation.hpp"

#include "mergemaster/config.hpp"

#include <filesystem>
#include <iostream>

int cmd_tree(int argc, char **argv) {
  auto inv = mergemaster::cli::parse_invocation("tree", argc, argv, false);
  if (!inv)
    return 2;
  if (inv->args.empty()) {
    std::cerr << "usage: mergemaster tree <path> [<path> ...]\n";
    return 2;
  }

  try {
    const std::filesystem::path root = mergemaster::cli::resolve_root(*inv);
    const auto result = mergemaster::cli::run_merge(*inv, root, mergemaster::load_settings(root));
    mergemaster::cli::report("tree", result.diagnostics, inv->quiet);
    std::cout << result.tree;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "tree: " << e.what() << "\n";
    return 1;
  }
}
