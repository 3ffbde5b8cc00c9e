#include "cli/invocation.hpp"

#include "mergemaster/config.hpp"
#include "mergemaster/output.hpp"

#include <filesystem>
#include <iostream>

int cmd_copy(int argc, char **argv) {
  auto inv = mergemaster::cli::parse_invocation("copy", argc, argv, false);
  if (!inv)
    return 2;
  if (inv->args.empty()) {
    std::cerr << "usage: mergemaster copy <path> [<path> ...]\n";
    return 2;
  }

  try {
    const std::filesystem::path root = mergemaster::cli::resolve_root(*inv);
    const auto result = mergemaster::cli::run_merge(*inv, root, mergemaster::load_settings(root));
    mergemaster::cli::report("copy", result.diagnostics, inv->quiet);

    mergemaster::output::copy_to_clipboard(result.document);
    std::cout << "copied " << result.written.size() << " files to the clipboard\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "copy: " << e.what() << "\n";
    return 1;
  }
}
