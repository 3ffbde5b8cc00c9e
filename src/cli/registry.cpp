#include "cli/registry.hpp"

#include <iostream>
#include <map>

namespace mergemaster::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: mergemaster <command> [options] [args]\n\n";
  std::cerr << "commands:\n";
  for (auto &[name, e] : table()) {
    std::cerr << "  " << name << "  " << e.help << "\n";
  }
  std::cerr << "\noptions:\n"
            << "  --root <dir>      workspace root (default: nearest .git/.mergemaster)\n"
            << "  --no-gitignore    do not apply <root>/.gitignore\n"
            << "  --gitignore       apply <root>/.gitignore even if disabled in config\n"
            << "  -o, --output <p>  export destination ('-' for stdout, '.gz' to compress)\n"
            << "  -q, --quiet       do not print skipped-entry warnings\n";
}

} // namespace mergemaster::cli
