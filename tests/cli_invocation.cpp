#include "cli/invocation.hpp"
#include "cli/registry.hpp"

#include "mergemaster/fs.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path &p) {
  const auto bytes = mergemaster::fs::read_file(p);
  return {bytes.begin(), bytes.end()};
}

static int failures = 0;

static void expect(bool cond, const char *what) {
  if (!cond) {
    std::cerr << "FAILED: " << what << "\n";
    ++failures;
  }
}

// Owns argv strings for a handler call; argv[0] is the command name
struct Argv {
  std::vector<std::string> storage;
  std::vector<char *> ptrs;

  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto &s : storage)
      ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(storage.size()); }
  char **argv() { return ptrs.data(); }
};

static std::optional<mergemaster::cli::Invocation> parse(std::vector<std::string> args,
                                                         bool accepts_output = true) {
  args.insert(args.begin(), "merge");
  Argv a{std::move(args)};
  return mergemaster::cli::parse_invocation("merge", a.argc(), a.argv(), accepts_output);
}

static int run(const std::string &cmd, std::vector<std::string> args) {
  args.insert(args.begin(), cmd);
  Argv a{std::move(args)};
  const auto fn = mergemaster::cli::find_command(cmd);
  return fn ? fn(a.argc(), a.argv()) : -1;
}

static int run_captured(const std::string &cmd, std::vector<std::string> args, std::string &out) {
  std::ostringstream buf;
  auto *previous = std::cout.rdbuf(buf.rdbuf());
  const int rc = run(cmd, std::move(args));
  std::cout.rdbuf(previous);
  out = buf.str();
  return rc;
}

int main() {
  mergemaster::cli::register_all_commands();

  const fs::path base = fs::weakly_canonical(fs::temp_directory_path()) /
                        ("mergemaster_cli_" + std::to_string(std::random_device{}()));
  const fs::path proj = base / "real" / "proj";
  write_file(proj / ".gitignore", "*.log\n");
  write_file(proj / "src" / "a.ts", "let a = 1;\n");
  write_file(proj / "src" / "x.log", "noise\n");
  const std::string src = (proj / "src").string();

  try {
    // option parsing
    {
      const auto inv = parse({"--root", "/w", "--no-gitignore", "-o", "out.txt", "-q", "a", "--",
                              "-b"});
      expect(inv && inv->root == fs::path("/w"), "--root is taken");
      expect(inv && inv->respect_gitignore == false, "--no-gitignore is taken");
      expect(inv && inv->output == fs::path("out.txt"), "-o is taken");
      expect(inv && inv->quiet, "-q is taken");
      expect(inv && inv->args == std::vector<std::string>{"a", "-b"},
             "positional arguments, including after --");

      const auto later = parse({"--no-gitignore", "--gitignore", "a"});
      expect(later && later->respect_gitignore == true, "the last gitignore flag wins");
      expect(!parse({"--bogus", "a"}), "unknown option rejected");
      expect(!parse({"-o", "out.txt", "a"}, false), "-o rejected where no output is written");
      expect(!parse({"a", "--root"}), "--root without a value rejected");
    }

    // no paths: usage error before the root is even looked at
    {
      const fs::path nowhere = base / "does-not-exist";
      expect(run("merge", {"--root", nowhere.string()}) == 2, "merge without paths exits 2");
      expect(run("tree", {"--root", nowhere.string()}) == 2, "tree without paths exits 2");
      expect(!fs::exists(nowhere), "nothing created for a usage error");
    }

    // --gitignore / --no-gitignore override the config file
    {
      mergemaster::Settings off;
      off.respect_gitignore = false;
      auto inv = parse({"--root", proj.string(), src});
      const fs::path root = mergemaster::cli::resolve_root(*inv);
      expect(mergemaster::cli::run_merge(*inv, root, off).files.size() == 2,
             "config switch off keeps ignored files");

      inv = parse({"--root", proj.string(), "--gitignore", src});
      expect(mergemaster::cli::run_merge(*inv, root, off).files ==
                 std::vector<std::string>{"proj/src/a.ts"},
             "--gitignore overrides a config that disables rules");

      inv = parse({"--root", proj.string(), "--no-gitignore", src});
      expect(mergemaster::cli::run_merge(*inv, root, mergemaster::Settings{}).files.size() == 2,
             "--no-gitignore overrides the default");
    }

    // a path that does not exist is a warning, not a failure
    {
      const auto inv = parse({"--root", proj.string(), src, (proj / "nope.txt").string()});
      const auto r =
          mergemaster::cli::run_merge(*inv, mergemaster::cli::resolve_root(*inv), mergemaster::Settings{});
      expect(r.files == std::vector<std::string>{"proj/src/a.ts"}, "missing path skipped");
      expect(!r.diagnostics.empty() &&
                 r.diagnostics.front().kind == mergemaster::DiagnosticKind::UnreadableEntry,
             "missing path reported");
    }

    // root named through a symlink, selection named physically
    std::error_code ec;
    fs::create_directory_symlink(base / "real", base / "link", ec);
    const bool have_link = !ec;
    if (have_link) {
      const fs::path linked = base / "link" / "proj";
      const auto inv = parse({"--root", linked.string(), src});
      const fs::path root = mergemaster::cli::resolve_root(*inv);
      const auto r = mergemaster::cli::run_merge(*inv, root, mergemaster::Settings{});
      expect(r.files == std::vector<std::string>{"proj/src/a.ts"},
             "symlinked root keeps relative paths and ignore rules");
    }

    // -o - writes the document to stdout and nothing to disk
    {
      std::string out;
      expect(run_captured("merge", {"--root", proj.string(), "-q", "-o", "-", src}, out) == 0,
             "merge to stdout succeeds");
      const auto inv = parse({"--root", proj.string(), src});
      const auto r =
          mergemaster::cli::run_merge(*inv, mergemaster::cli::resolve_root(*inv), mergemaster::Settings{});
      expect(out == r.document, "stdout carries the document");
      expect(!fs::exists(proj / "merged_output.txt"), "stdout export leaves no file");
    }

    // the destination never merges itself, so re-runs are byte-identical
    {
      std::string ignored;
      expect(run_captured("merge", {"--root", proj.string(), "-q", proj.string()}, ignored) == 0,
             "first export succeeds");
      const std::string first = slurp(proj / "merged_output.txt");
      expect(run_captured("merge", {"--root", proj.string(), "-q", proj.string()}, ignored) == 0,
             "second export succeeds");
      expect(slurp(proj / "merged_output.txt") == first, "re-run output is identical");
      expect(first.find("merged_output.txt") == std::string::npos,
             "output file not part of its own document");

      if (have_link) {
        const fs::path dest = base / "link" / "proj" / "out.txt";
        expect(run_captured("merge", {"--root", proj.string(), "-q", "-o", dest.string(),
                                      proj.string()},
                            ignored) == 0,
               "export through a link succeeds");
        const std::string linked_first = slurp(dest);
        expect(run_captured("merge", {"--root", proj.string(), "-q", "-o", dest.string(),
                                      proj.string()},
                            ignored) == 0,
               "second export through a link succeeds");
        expect(slurp(dest) == linked_first && linked_first.find("out.txt") == std::string::npos,
               "destination named through a link is still excluded");
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "cli test exception: " << e.what() << "\n";
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  if (failures) {
    std::cerr << failures << " failure(s)\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
