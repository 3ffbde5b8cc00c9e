#pragma once
#include "mergemaster/config.hpp"
#include "mergemaster/error.hpp"
#include "mergemaster/merge.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mergemaster::cli {

// Options shared by merge/copy/tree/config
struct Invocation {
  std::optional<std::filesystem::path> root;
  std::optional<bool> respect_gitignore;       // overrides the config file
  std::optional<std::filesystem::path> output; // merge only
  bool quiet = false;
  std::vector<std::string> args; // positional arguments
};

// Parse argv (argv[0] is the command name). Prints a message and returns
// std::nullopt on a malformed option.
std::optional<Invocation> parse_invocation(const std::string& cmd, int argc, char** argv,
                                           bool accepts_output);

// --root if given (must be a directory), else the nearest ancestor of the
// current directory holding .git or .mergemaster, else the current directory.
// Throws MergeError(NoWorkspace).
std::filesystem::path resolve_root(const Invocation& inv);

// Stat the positional paths and merge them. Paths that do not exist are
// reported as diagnostics. `exclude` is passed through to MergeOptions.
MergeResult run_merge(const Invocation& inv, const std::filesystem::path& root,
                      const Settings& settings,
                      const std::vector<std::filesystem::path>& exclude = {});

// "<cmd>: warning: <message>" per diagnostic unless quiet
void report(const std::string& cmd, const Diagnostics& diagnostics, bool quiet);

} // namespace mergemaster::cli
