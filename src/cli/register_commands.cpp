#include "cli/registry.hpp"

int cmd_merge(int argc, char **argv);
int cmd_copy(int argc, char **argv);
int cmd_tree(int, char **);
int cmd_config(int, char **);

namespace mergemaster::cli {

void register_all_commands() {
  register_command("merge", ::cmd_merge,
                   "Export selected files to one document: mergemaster merge [-o <file>] <path>...");
  register_command("copy", ::cmd_copy,
                   "Copy the merged document to the clipboard: mergemaster copy <path>...");
  register_command("tree", ::cmd_tree, "Print only the tree summary: mergemaster tree <path>...");
  register_command("config", ::cmd_config,
                   "Show or set workspace settings: mergemaster config [<key> [<value>]]");
}

} // namespace mergemaster::cli
