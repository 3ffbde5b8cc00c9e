#pragma once
#include <cstddef>
#include <string_view>

namespace mergemaster::consts {

// Directory and file names
inline constexpr std::string_view kConfigDir        = ".mergemaster";
inline constexpr std::string_view kConfigFile       = "config";
inline constexpr std::string_view kIgnoreFile       = ".gitignore";
inline constexpr std::string_view kGitDir           = ".git";
inline constexpr std::string_view kDefaultOutput    = "merged_output.txt";
inline constexpr std::string_view kGzipSuffix       = ".gz";

// ——— Content block delimiters ———
inline constexpr std::size_t kRuleWidth = 50; // '=' characters per separator line
inline constexpr char kRuleChar = '=';
inline constexpr std::string_view kStartFilePrefix = "<--- Start-File: ";
inline constexpr std::string_view kEndFilePrefix   = "<--- End-File: ";
inline constexpr std::string_view kMarkerSuffix    = " --->";

// Joins the tree summary and the content blocks
inline constexpr std::string_view kSectionGap = "\n\n\n";

// ——— Tree glyphs ———
inline constexpr std::string_view kBranchMid  = "├── ";
inline constexpr std::string_view kBranchLast = "└── ";
inline constexpr std::string_view kIndentMid  = "│   ";
inline constexpr std::string_view kIndentLast = "    ";

// ——— Config keys ———
inline constexpr std::string_view kKeyRespectGitignore = "respect-gitignore";
inline constexpr std::string_view kKeyOutput           = "output";

// ——— Common characters ———
inline constexpr char kSlash = '/';
inline constexpr char kLF    = '\n';

} // namespace mergemaster::consts
