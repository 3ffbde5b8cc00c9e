#include "mergemaster/fs.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

namespace mergemaster::fs {

EntryKind LocalFilesystem::stat(const std::filesystem::path &p) const {
  std::error_code ec;
  const auto st = std::filesystem::status(p, ec);
  if (ec || !std::filesystem::exists(st))
    return EntryKind::Missing;
  if (std::filesystem::is_regular_file(st))
    return EntryKind::File;
  if (std::filesystem::is_directory(st))
    return EntryKind::Directory;
  return EntryKind::Other;
}

std::vector<DirEntry> LocalFilesystem::list_directory(const std::filesystem::path &p) const {
  std::error_code ec;
  std::filesystem::directory_iterator it(p, ec);
  if (ec)
    throw std::runtime_error("cannot read directory " + p.string() + ": " + ec.message());

  std::vector<DirEntry> out;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec)
      throw std::runtime_error("cannot read directory " + p.string() + ": " + ec.message());
    // links are listed but never followed while walking a tree
    std::error_code lec;
    const EntryKind kind = it->is_symlink(lec) ? EntryKind::Other : stat(it->path());
    out.push_back(DirEntry{.name = it->path().filename().string(), .kind = kind});
  }
  if (ec)
    throw std::runtime_error("cannot read directory " + p.string() + ": " + ec.message());
  return out;
}

std::string LocalFilesystem::read_text(const std::filesystem::path &p) const {
  const auto bytes = read_file(p);
  if (!is_valid_utf8(bytes))
    throw std::runtime_error("not valid UTF-8 text: " + p.string());
  return {bytes.begin(), bytes.end()};
}

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::filesystem::path resolved_path(const std::filesystem::path &p, bool follow_last) {
  std::error_code ec;
  std::filesystem::path abs = std::filesystem::absolute(p, ec);
  if (ec)
    abs = p;
  abs = abs.lexically_normal();
  // "/a/b/" normalizes with an empty filename
  if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path())
    abs = abs.parent_path();

  if (!follow_last && abs.has_filename() && abs != abs.root_path())
    return resolved_path(abs.parent_path(), true) / abs.filename();

  std::filesystem::path out = std::filesystem::weakly_canonical(abs, ec);
  if (ec)
    return abs;
  if (!out.has_filename() && out.has_parent_path() && out != out.root_path())
    out = out.parent_path();
  return out;
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (!p.has_parent_path())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0)
    throw std::runtime_error("read failed: " + p.string());
  auto n = static_cast<std::size_t>(end);
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
    }
  }
}

bool is_valid_utf8(std::span<const std::uint8_t> data) {
  std::size_t i = 0;
  while (i < data.size()) {
    const std::uint8_t b = data[i];
    if (b < 0x80) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((b & 0xE0) == 0xC0) {
      len = 2;
      cp = b & 0x1F;
    } else if ((b & 0xF0) == 0xE0) {
      len = 3;
      cp = b & 0x0F;
    } else if ((b & 0xF8) == 0xF0) {
      len = 4;
      cp = b & 0x07;
    } else {
      return false;
    }
    if (i + len > data.size())
      return false;
    for (std::size_t k = 1; k < len; ++k) {
      const std::uint8_t c = data[i + k];
      if ((c & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (c & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
      return false;
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
      return false;
    i += len;
  }
  return true;
}

// windowBits 15 + 16 selects the gzip wrapper
static constexpr int kGzipWindowBits = 15 + 16;

std::vector<std::uint8_t> gzip_compress(std::span<const std::uint8_t> data, std::size_t slice) {
  if (slice == 0 || slice > kMaxZlibSlice)
    slice = kMaxZlibSlice;
  z_stream zs{};
  if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK)
    throw std::runtime_error("zlib deflateInit2 failed");

  std::vector<std::uint8_t> out;
  std::vector<std::uint8_t> chunk(16384);
  std::size_t offset = 0;
  int flush = Z_NO_FLUSH;
  int rc = Z_OK;
  do {
    const std::size_t take = std::min(data.size() - offset, slice);
    zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data() + offset));
    zs.avail_in = static_cast<uInt>(take);
    offset += take;
    flush = offset == data.size() ? Z_FINISH : Z_NO_FLUSH;
    // drain until zlib stops filling whole output chunks
    do {
      zs.next_out = chunk.data();
      zs.avail_out = static_cast<uInt>(chunk.size());
      rc = deflate(&zs, flush);
      if (rc == Z_STREAM_ERROR) {
        deflateEnd(&zs);
        throw std::runtime_error("zlib gzip compress failed");
      }
      out.insert(out.end(), chunk.begin(), chunk.end() - zs.avail_out);
    } while (zs.avail_out == 0);
  } while (flush != Z_FINISH);
  deflateEnd(&zs);
  if (rc != Z_STREAM_END)
    throw std::runtime_error("zlib gzip compress failed");
  return out;
}

std::vector<std::uint8_t> gzip_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit2(&zs, kGzipWindowBits) != Z_OK)
    throw std::runtime_error("zlib inflateInit2 failed");

  std::size_t offset = 0;
  std::vector<std::uint8_t> out;
  std::vector<std::uint8_t> chunk(16384);
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.avail_in == 0 && offset < data.size()) {
      const std::size_t take = std::min(data.size() - offset, kMaxZlibSlice);
      zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data() + offset));
      zs.avail_in = static_cast<uInt>(take);
      offset += take;
    }
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib gzip decompress failed");
    }
    out.insert(out.end(), chunk.begin(), chunk.end() - zs.avail_out);
    if (rc == Z_OK && zs.avail_in == 0 && offset == data.size() && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib gzip stream truncated");
    }
  }
  inflateEnd(&zs);
  return out;
}

} // namespace mergemaster::fs
