#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace mergemaster::fs {

enum class EntryKind : std::uint8_t { File, Directory, Other, Missing };

struct DirEntry {
  std::string name; // base name, no separators
  EntryKind kind;
};

// Access layer the merge engine reads the project through.
class Filesystem {
public:
  virtual ~Filesystem() = default;

  // Kind of the entry at `p`, following symlinks. Never throws.
  virtual EntryKind stat(const std::filesystem::path &p) const = 0;

  // Immediate children of directory `p`. Throws std::runtime_error if unreadable.
  virtual std::vector<DirEntry> list_directory(const std::filesystem::path &p) const = 0;

  // Whole file as text. Throws std::runtime_error on read failure or invalid UTF-8.
  virtual std::string read_text(const std::filesystem::path &p) const = 0;
};

// std::filesystem backed implementation
class LocalFilesystem final : public Filesystem {
public:
  EntryKind stat(const std::filesystem::path &p) const override;
  std::vector<DirEntry> list_directory(const std::filesystem::path &p) const override;
  std::string read_text(const std::filesystem::path &p) const override;
};

// Largest input zlib accepts in one call
inline constexpr std::size_t kMaxZlibSlice = 0xFFFFFFFFu;

bool exists(const std::filesystem::path& p);

// Absolute, normalized spelling of `p` with symlinks resolved, so that a path
// reached through a link and its physical spelling compare equal. With
// `follow_last` false the final component is kept as named (a selected link
// stays a link). Parts that do not exist are normalized lexically.
std::filesystem::path resolved_path(const std::filesystem::path& p, bool follow_last = true);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Strict UTF-8 check (rejects overlongs, surrogates and code points above U+10FFFF)
bool is_valid_utf8(std::span<const std::uint8_t> data);

// Single-member gzip stream (RFC 1952) of `data`. The input is handed to zlib
// in slices of at most `slice` bytes, since zlib counts input in 32-bit units.
std::vector<std::uint8_t> gzip_compress(std::span<const std::uint8_t> data,
                                        std::size_t slice = kMaxZlibSlice);
std::vector<std::uint8_t> gzip_decompress(std::span<const std::uint8_t> data);

} // namespace mergemaster::fs
