#pragma once
#include "mergemaster/error.hpp"
#include "mergemaster/fs.hpp"
#include "mergemaster/selection.hpp"
#include "mergemaster/workspace.hpp"

#include <stop_token>
#include <string>
#include <vector>

namespace mergemaster {

struct MergeOptions {
  bool respect_ignore = true; // apply <root>/.gitignore
  std::stop_token stop;       // checked between directory and file operations
  std::vector<std::filesystem::path> exclude; // files never admitted, e.g. the output file
};

struct MergeResult {
  std::string document;             // tree + "\n\n\n" + content blocks
  std::string tree;                 // tree summary alone
  std::vector<std::string> files;   // every resolved file, in document order
  std::vector<std::string> written; // files that produced a content block
  Diagnostics diagnostics;          // per-entry failures that were skipped
};

// Resolve `selection` against `workspace` and compose the merged document.
// Throws MergeError(NoWorkspace) when the workspace has no root and
// MergeError(Cancelled) when `options.stop` is requested. Delivery is up to the caller.
MergeResult merge(const Workspace& workspace, const std::vector<PathRef>& selection,
                  const MergeOptions& options, const fs::Filesystem& fsys);

} // namespace mergemaster
