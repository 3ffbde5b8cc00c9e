#include "mergemaster/serializer.hpp"

#include "mergemaster/fs.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::span<const std::uint8_t> bytes_of(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

// Text strictly between a block's markers, minus the blank-line padding
static std::string extract(const std::string &text, const std::string &rel) {
  const std::string rule = mergemaster::rule_line();
  const std::string start = "<--- Start-File: " + rel + " --->\n" + rule + "\n\n";
  const auto b = text.find(start);
  if (b == std::string::npos)
    return "<missing>";
  const auto body = b + start.size();
  const auto e = text.find("\n\n" + rule + "\n<--- End-File: " + rel + " --->\n", body);
  if (e == std::string::npos)
    return "<unterminated>";
  return text.substr(body, e - body);
}

int main() {
  const std::string rule(50, '=');
  if (mergemaster::rule_line() != rule) {
    std::cerr << "rule line must be 50 '='\n";
    return 1;
  }

  // exact block layout
  {
    const std::string want = "\n" + rule + "\n<--- Start-File: proj/a.txt --->\n" + rule +
                             "\n\nhello\n\n" + rule + "\n<--- End-File: proj/a.txt --->\n" + rule +
                             "\n";
    if (mergemaster::format_block("proj/a.txt", "hello") != want) {
      std::cerr << "block layout mismatch:\n" << mergemaster::format_block("proj/a.txt", "hello");
      return 1;
    }
  }

  const fs::path root =
      fs::temp_directory_path() / ("mergemaster_serializer_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const std::vector<std::pair<std::string, std::string>> samples = {
        {"p/trailing.txt", "line1\n\nline3\n"},
        {"p/empty.txt", ""},
        {"p/bare.txt", "no newline"},
        {"p/utf8.txt", "h\xc3\xa9llo \xe2\x9c\x93\r\nwindows line\r\n"},
    };
    std::vector<mergemaster::SourceFile> files;
    for (const auto &[rel, content] : samples) {
      const fs::path p = root / rel;
      write_file(p, content);
      files.push_back({.relative_path = rel, .path = p});
    }
    write_file(root / "p" / "bin.dat", std::string("\xff\xfe\x00\x01", 4));
    files.insert(files.begin() + 1,
                 mergemaster::SourceFile{.relative_path = "p/bin.dat", .path = root / "p" / "bin.dat"});
    files.push_back({.relative_path = "p/gone.txt", .path = root / "p" / "gone.txt"});

    const mergemaster::fs::LocalFilesystem fsys;
    mergemaster::Diagnostics diags;
    const auto out = mergemaster::serialize_files(files, fsys, diags);

    // content survives the round trip byte for byte
    for (const auto &[rel, content] : samples) {
      if (extract(out.text, rel) != content) {
        std::cerr << "round trip mismatch for " << rel << ": [" << extract(out.text, rel) << "]\n";
        return 1;
      }
    }

    // unreadable and non-text files are skipped and reported
    if (out.text.find("p/bin.dat") != std::string::npos ||
        out.text.find("p/gone.txt") != std::string::npos) {
      std::cerr << "skipped files leaked into output\n";
      return 1;
    }
    if (diags.size() != 2 || diags[0].kind != mergemaster::DiagnosticKind::UnreadableFile ||
        diags[1].kind != mergemaster::DiagnosticKind::UnreadableFile) {
      std::cerr << "expected two UnreadableFile diagnostics, got " << diags.size() << "\n";
      return 1;
    }

    // blocks keep the order they were given in
    const std::vector<std::string> want_order = {"p/trailing.txt", "p/empty.txt", "p/bare.txt",
                                                 "p/utf8.txt"};
    if (out.written != want_order) {
      std::cerr << "written order mismatch\n";
      return 1;
    }
    if (out.text.find("p/trailing.txt") > out.text.find("p/empty.txt")) {
      std::cerr << "block order mismatch\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "serializer test exception: " << e.what() << "\n";
    return 1;
  }

  // text validation
  using mergemaster::fs::is_valid_utf8;
  if (!is_valid_utf8(bytes_of("plain ascii")) || !is_valid_utf8(bytes_of("\xf0\x9f\x98\x80")) ||
      is_valid_utf8(bytes_of("\xc0\xaf")) || is_valid_utf8(bytes_of("\xed\xa0\x80")) ||
      is_valid_utf8(bytes_of("\xe2\x82"))) {
    std::cerr << "utf-8 validation mismatch\n";
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  std::cout << "OK\n";
  return 0;
}
