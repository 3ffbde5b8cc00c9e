#include "cli/invocation.hpp"

#include "mergemaster/fs.hpp"
#include "mergemaster/selection.hpp"
#include "mergemaster/workspace.hpp"

#include <iostream>

namespace stdfs = std::filesystem;

namespace mergemaster::cli {

std::optional<Invocation> parse_invocation(const std::string &cmd, int argc, char **argv,
                                           bool accepts_output) {
  Invocation inv;
  bool options_done = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (options_done || a.empty() || a[0] != '-' || a == "-") {
      inv.args.push_back(a);
      continue;
    }
    if (a == "--") {
      options_done = true;
    } else if (a == "--root") {
      if (i + 1 >= argc) {
        std::cerr << cmd << ": --root needs a directory\n";
        return std::nullopt;
      }
      inv.root = argv[++i];
    } else if (a == "--no-gitignore") {
      inv.respect_gitignore = false;
    } else if (a == "--gitignore") {
      inv.respect_gitignore = true;
    } else if (a == "-q" || a == "--quiet") {
      inv.quiet = true;
    } else if (accepts_output && (a == "-o" || a == "--output")) {
      if (i + 1 >= argc) {
        std::cerr << cmd << ": " << a << " needs a path\n";
        return std::nullopt;
      }
      inv.output = argv[++i];
    } else {
      std::cerr << cmd << ": unknown option: " << a << "\n";
      return std::nullopt;
    }
  }
  return inv;
}

stdfs::path resolve_root(const Invocation &inv) {
  if (inv.root) {
    std::error_code ec;
    if (!stdfs::is_directory(*inv.root, ec))
      throw MergeError(MergeErrorKind::NoWorkspace,
                       "workspace root is not a directory: " + inv.root->string());
    return fs::resolved_path(*inv.root);
  }
  std::error_code ec;
  const stdfs::path cwd = stdfs::current_path(ec);
  if (ec)
    throw MergeError(MergeErrorKind::NoWorkspace, "cannot determine current directory: " + ec.message());
  if (auto found = find_workspace_root(cwd))
    return *found;
  return cwd;
}

MergeResult run_merge(const Invocation &inv, const stdfs::path &root, const Settings &settings,
                      const std::vector<stdfs::path> &exclude) {
  const fs::LocalFilesystem fsys;
  Diagnostics skipped;
  std::vector<PathRef> selection;
  for (const auto &arg : inv.args) {
    if (auto ref = classify(arg, fsys)) {
      selection.push_back(std::move(*ref));
    } else {
      skipped.push_back(Diagnostic{.kind = DiagnosticKind::UnreadableEntry,
                                   .path = stdfs::absolute(arg).string(),
                                   .message = "no such file or directory: " + arg});
    }
  }

  MergeOptions options;
  options.respect_ignore = inv.respect_gitignore.value_or(settings.respect_gitignore);
  options.exclude = exclude;

  MergeResult result = merge(Workspace{root}, selection, options, fsys);
  result.diagnostics.insert(result.diagnostics.begin(), skipped.begin(), skipped.end());
  return result;
}

void report(const std::string &cmd, const Diagnostics &diagnostics, bool quiet) {
  if (quiet)
    return;
  for (const auto &d : diagnostics)
    std::cerr << cmd << ": warning: " << d.message << "\n";
}

} // namespace mergemaster::cli
