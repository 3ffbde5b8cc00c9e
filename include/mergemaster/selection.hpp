#pragma once
#include "mergemaster/error.hpp"
#include "mergemaster/fs.hpp"
#include "mergemaster/ignore.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <stop_token>
#include <vector>

namespace mergemaster {

enum class RefKind : std::uint8_t { File, Directory };

// One entry of the caller's selection
struct PathRef {
  std::filesystem::path path; // absolute
  RefKind kind;
};

// Deduplicated absolute, lexically normal file paths. Never holds directories.
using FileSet = std::set<std::filesystem::path>;

// Stat `p` and wrap it as a PathRef; nullopt if it is neither a file nor a directory.
std::optional<PathRef> classify(const std::filesystem::path& p, const fs::Filesystem& fsys);

// Expand files and directories (recursively) into a FileSet. Each file is tested
// with `include` before insertion; directories are never tested themselves.
// An unreadable directory is recorded in `diagnostics` and its subtree skipped.
// Symlinks met during recursion are not followed.
// Throws MergeError(Cancelled) if `stop` is requested between entries.
FileSet resolve_selection(const std::vector<PathRef>& selection, const PathPredicate& include,
                          const fs::Filesystem& fsys, Diagnostics& diagnostics,
                          std::stop_token stop = {});

} // namespace mergemaster
