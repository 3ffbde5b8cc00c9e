#include "mergemaster/merge.hpp"

#include "mergemaster/consts.hpp"
#include "mergemaster/ignore.hpp"
#include "mergemaster/serializer.hpp"
#include "mergemaster/tree.hpp"

#include <algorithm>

namespace mergemaster {

MergeResult merge(const Workspace &workspace, const std::vector<PathRef> &selection,
                  const MergeOptions &options, const fs::Filesystem &fsys) {
  if (!workspace.has_root())
    throw MergeError(MergeErrorKind::NoWorkspace,
                     "no workspace root to resolve the selection against");

  MergeResult result;

  // rules are read fresh on every call
  PathPredicate include =
      build_ignore_filter(workspace.root(), options.respect_ignore, fsys, result.diagnostics);
  if (!options.exclude.empty()) {
    std::vector<std::filesystem::path> excluded;
    for (const auto &p : options.exclude)
      excluded.push_back(fs::resolved_path(p, false));
    include = [excluded = std::move(excluded), rules = std::move(include)](
                  const std::filesystem::path &abs) {
      return std::ranges::find(excluded, abs) == excluded.end() && rules(abs);
    };
  }
  const FileSet files = resolve_selection(selection, include, fsys, result.diagnostics, options.stop);

  std::vector<SourceFile> ordered;
  ordered.reserve(files.size());
  for (const auto &path : files)
    ordered.push_back(SourceFile{.relative_path = workspace.relative_path(path), .path = path});
  std::ranges::sort(ordered, [](const SourceFile &a, const SourceFile &b) {
    return tree_order_less(a.relative_path, b.relative_path);
  });

  FileTree tree;
  for (const auto &file : ordered) {
    tree.insert(file.relative_path);
    result.files.push_back(file.relative_path);
  }
  result.tree = tree.render();

  auto content = serialize_files(ordered, fsys, result.diagnostics, options.stop);
  result.written = std::move(content.written);

  result.document.reserve(result.tree.size() + consts::kSectionGap.size() + content.text.size());
  result.document += result.tree;
  result.document += consts::kSectionGap;
  result.document += content.text;
  return result;
}

} // namespace mergemaster
