#pragma once
#include "mergemaster/error.hpp"
#include "mergemaster/fs.hpp"

#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace mergemaster {

// A file scheduled for serialization: where to read it, what to call it
struct SourceFile {
  std::string relative_path;
  std::filesystem::path path;
};

struct SerializedContent {
  std::string text;                // concatenated blocks
  std::vector<std::string> written; // relative paths that produced a block, in order
};

// "==...==" separator line (no newline)
std::string rule_line();

// One delimited block:
//   \n<rule>\n<--- Start-File: P --->\n<rule>\n\n<content>\n\n<rule>\n<--- End-File: P --->\n<rule>\n
std::string format_block(std::string_view relative_path, std::string_view content);

// Blocks for `files` in the order given. A file that cannot be read as text is
// skipped and recorded in `diagnostics`.
SerializedContent serialize_files(const std::vector<SourceFile>& files, const fs::Filesystem& fsys,
                                  Diagnostics& diagnostics, std::stop_token stop = {});

} // namespace mergemaster
