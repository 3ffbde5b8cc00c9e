#include "mergemaster/selection.hpp"

#include <vector>

namespace stdfs = std::filesystem;

namespace mergemaster {

namespace {

void check_stop(const std::stop_token &stop) {
  if (stop.stop_requested())
    throw MergeError(MergeErrorKind::Cancelled, "merge cancelled");
}

void offer(const stdfs::path &file, const PathPredicate &include, FileSet &out) {
  if (include(file))
    out.insert(file);
}

// Depth-first walk of everything below `dir`
void collect_directory(const stdfs::path &dir, const PathPredicate &include,
                       const fs::Filesystem &fsys, FileSet &out, Diagnostics &diagnostics,
                       const std::stop_token &stop) {
  std::vector<stdfs::path> pending{dir};
  while (!pending.empty()) {
    check_stop(stop);
    const stdfs::path cur = std::move(pending.back());
    pending.pop_back();

    std::vector<fs::DirEntry> entries;
    try {
      entries = fsys.list_directory(cur);
    } catch (const std::exception &e) {
      diagnostics.push_back(Diagnostic{.kind = DiagnosticKind::UnreadableDirectory,
                                       .path = cur.string(),
                                       .message = e.what()});
      continue;
    }

    for (const auto &entry : entries) {
      if (entry.kind == fs::EntryKind::File) {
        check_stop(stop);
        offer(cur / entry.name, include, out);
      } else if (entry.kind == fs::EntryKind::Directory) {
        pending.push_back(cur / entry.name);
      }
    }
  }
}

} // namespace

std::optional<PathRef> classify(const stdfs::path &p, const fs::Filesystem &fsys) {
  const stdfs::path abs = stdfs::absolute(p).lexically_normal();
  switch (fsys.stat(abs)) {
  case fs::EntryKind::File:
    return PathRef{.path = fs::resolved_path(abs, false), .kind = RefKind::File};
  case fs::EntryKind::Directory:
    return PathRef{.path = fs::resolved_path(abs), .kind = RefKind::Directory};
  default:
    return std::nullopt;
  }
}

FileSet resolve_selection(const std::vector<PathRef> &selection, const PathPredicate &include,
                          const fs::Filesystem &fsys, Diagnostics &diagnostics,
                          std::stop_token stop) {
  FileSet out;
  for (const auto &ref : selection) {
    check_stop(stop);
    // one spelling per file, however the selection reached it
    const stdfs::path abs = fs::resolved_path(ref.path, ref.kind == RefKind::Directory);

    if (ref.kind == RefKind::File)
      offer(abs, include, out);
    else
      collect_directory(abs, include, fsys, out, diagnostics, stop);
  }
  return out;
}

} // namespace mergemaster
