#include "cli/invocation.hpp"

#include "mergemaster/config.hpp"
#include "mergemaster/hash.hpp"
#include "mergemaster/output.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int cmd_merge(int argc, char **argv) {
  auto inv = mergemaster::cli::parse_invocation("merge", argc, argv, true);
  if (!inv)
    return 2;
  if (inv->args.empty()) {
    std::cerr << "usage: mergemaster merge [-o <file>] <path> [<path> ...]\n";
    return 2;
  }

  try {
    const fs::path root = mergemaster::cli::resolve_root(*inv);
    const auto settings = mergemaster::load_settings(root);

    const bool to_stdout = inv->output && inv->output->string() == "-";
    fs::path dest;
    if (!to_stdout) {
      dest = inv->output ? fs::absolute(*inv->output) : root / settings.output;
      // fail before reading anything if there is nowhere to write
      mergemaster::output::check_destination(dest);
    }

    std::vector<fs::path> exclude;
    if (!to_stdout)
      exclude.push_back(dest);
    const auto result = mergemaster::cli::run_merge(*inv, root, settings, exclude);
    mergemaster::cli::report("merge", result.diagnostics, inv->quiet);

    if (to_stdout) {
      std::cout << result.document;
      std::cout.flush();
      return 0;
    }
    mergemaster::output::write_document(dest, result.document);
    std::cout << "wrote " << dest.string() << " (" << result.written.size() << " files, sha1 "
              << mergemaster::to_hex(mergemaster::sha1(result.document)) << ")\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "merge: " << e.what() << "\n";
    return 1;
  }
}
