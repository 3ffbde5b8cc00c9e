#include "mergemaster/serializer.hpp"

#include "mergemaster/consts.hpp"

namespace mergemaster {

std::string rule_line() { return std::string(consts::kRuleWidth, consts::kRuleChar); }

std::string format_block(std::string_view relative_path, std::string_view content) {
  const std::string rule = rule_line();
  std::string out;
  out.reserve(content.size() + (2 * relative_path.size()) + (6 * rule.size()) + 64);

  out += consts::kLF;
  out += rule;
  out += consts::kLF;
  out += consts::kStartFilePrefix;
  out += relative_path;
  out += consts::kMarkerSuffix;
  out += consts::kLF;
  out += rule;
  out += "\n\n";

  out += content;
  out += "\n\n";

  out += rule;
  out += consts::kLF;
  out += consts::kEndFilePrefix;
  out += relative_path;
  out += consts::kMarkerSuffix;
  out += consts::kLF;
  out += rule;
  out += consts::kLF;
  return out;
}

SerializedContent serialize_files(const std::vector<SourceFile> &files, const fs::Filesystem &fsys,
                                  Diagnostics &diagnostics, std::stop_token stop) {
  SerializedContent out;
  for (const auto &file : files) {
    if (stop.stop_requested())
      throw MergeError(MergeErrorKind::Cancelled, "merge cancelled");

    std::string content;
    try {
      content = fsys.read_text(file.path);
    } catch (const std::exception &e) {
      diagnostics.push_back(Diagnostic{.kind = DiagnosticKind::UnreadableFile,
                                       .path = file.path.string(),
                                       .message = e.what()});
      continue;
    }
    out.text += format_block(file.relative_path, content);
    out.written.push_back(file.relative_path);
  }
  return out;
}

} // namespace mergemaster
