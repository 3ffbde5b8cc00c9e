#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace mergemaster::output {

// Throws MergeError(NoDestination) if `dest` is empty or an existing directory.
void check_destination(const std::filesystem::path& dest);

// Atomically write `document` to `dest`; gzip-compressed when `dest` ends in ".gz".
// Throws MergeError(NoDestination) if `dest` is empty, a directory, or not writable.
void write_document(const std::filesystem::path& dest, std::string_view document);

// Shell command the clipboard sink pipes into, or empty if none is available.
// MERGEMASTER_CLIPBOARD overrides the search for wl-copy / xclip / xsel / pbcopy.
std::string clipboard_command();

// Place `document` on the system clipboard.
// Throws MergeError(NoDestination) when no tool is available or it fails.
void copy_to_clipboard(std::string_view document);

} // namespace mergemaster::output
