#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace mergemaster {

// Conditions that abort a merge before any output is produced
enum class MergeErrorKind : std::uint8_t { NoWorkspace, NoDestination, Cancelled };

class MergeError : public std::runtime_error {
public:
  MergeError(MergeErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] MergeErrorKind kind() const noexcept { return kind_; }

private:
  MergeErrorKind kind_;
};

// Recoverable per-entry failures; the entry is skipped and the merge continues
enum class DiagnosticKind : std::uint8_t {
  UnreadableEntry,     // selected path is missing or not a file/directory
  UnreadableDirectory, // listing failed during recursion
  UnreadableFile,      // read failed or content is not text
  IgnoreRulesUnusable, // ignore file present but unreadable, or filter setup failed
};

struct Diagnostic {
  DiagnosticKind kind;
  std::string path;    // absolute path of the skipped entry
  std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

} // namespace mergemaster
