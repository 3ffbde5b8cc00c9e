#include "mergemaster/output.hpp"

#include "mergemaster/consts.hpp"
#include "mergemaster/error.hpp"
#include "mergemaster/fs.hpp"
#include "mergemaster/util.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <span>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace stdfs = std::filesystem;

namespace mergemaster::output {

namespace {

bool on_path(const std::string &program) {
  const char *path = std::getenv("PATH");
  if (!path)
    return false;
  for (const auto &dir : strutil::split(path, ':')) {
    if (dir.empty())
      continue;
    const stdfs::path candidate = stdfs::path(dir) / program;
    if (::access(candidate.c_str(), X_OK) == 0)
      return true;
  }
  return false;
}

// SIGPIPE ignored for the lifetime of a clipboard pipe; a tool that exits
// early shows up as a short write instead of killing the process.
class PipeSignalGuard {
public:
  PipeSignalGuard() : previous_(std::signal(SIGPIPE, SIG_IGN)) {}
  ~PipeSignalGuard() {
    if (previous_ != SIG_ERR)
      std::signal(SIGPIPE, previous_);
  }
  PipeSignalGuard(const PipeSignalGuard &) = delete;
  PipeSignalGuard &operator=(const PipeSignalGuard &) = delete;

private:
  void (*previous_)(int);
};

bool env_set(const char *name) {
  const char *v = std::getenv(name);
  return v && *v;
}

} // namespace

void check_destination(const stdfs::path &dest) {
  if (dest.empty())
    throw MergeError(MergeErrorKind::NoDestination, "no output destination chosen");

  std::error_code ec;
  if (stdfs::is_directory(dest, ec))
    throw MergeError(MergeErrorKind::NoDestination,
                     "output destination is a directory: " + dest.string());
}

void write_document(const stdfs::path &dest, std::string_view document) {
  check_destination(dest);

  const std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t *>(document.data()),
                                            document.size());
  try {
    if (dest.string().ends_with(consts::kGzipSuffix))
      fs::write_file_atomic(dest, fs::gzip_compress(bytes));
    else
      fs::write_file_atomic(dest, bytes);
  } catch (const std::runtime_error &e) {
    throw MergeError(MergeErrorKind::NoDestination,
                     "cannot write " + dest.string() + ": " + e.what());
  }
}

std::string clipboard_command() {
  if (env_set("MERGEMASTER_CLIPBOARD"))
    return std::getenv("MERGEMASTER_CLIPBOARD");
  if (env_set("WAYLAND_DISPLAY") && on_path("wl-copy"))
    return "wl-copy";
  if (env_set("DISPLAY")) {
    if (on_path("xclip"))
      return "xclip -selection clipboard";
    if (on_path("xsel"))
      return "xsel --clipboard --input";
  }
  if (on_path("pbcopy"))
    return "pbcopy";
  return {};
}

void copy_to_clipboard(std::string_view document) {
  const std::string cmd = clipboard_command();
  if (cmd.empty())
    throw MergeError(MergeErrorKind::NoDestination,
                     "no clipboard tool found (install wl-copy, xclip or xsel, "
                     "or set MERGEMASTER_CLIPBOARD)");

  const PipeSignalGuard guard;
  FILE *pipe = ::popen(cmd.c_str(), "w");
  if (!pipe)
    throw MergeError(MergeErrorKind::NoDestination, "cannot start clipboard tool: " + cmd);

  const std::size_t n = std::fwrite(document.data(), 1, document.size(), pipe);
  const int status = ::pclose(pipe);
  if (n != document.size())
    throw MergeError(MergeErrorKind::NoDestination, "short write to clipboard tool: " + cmd);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
    throw MergeError(MergeErrorKind::NoDestination, "clipboard tool failed: " + cmd);
}

} // namespace mergemaster::output
