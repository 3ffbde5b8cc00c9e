#include "cli/invocation.hpp"

#include "mergemaster/config.hpp"
#include "mergemaster/consts.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_config(int argc, char **argv) {
  auto inv = mergemaster::cli::parse_invocation("config", argc, argv, false);
  if (!inv)
    return 2;
  if (inv->args.size() > 2) {
    std::cerr << "usage: mergemaster config [<key> [<value>]]\n";
    return 2;
  }

  try {
    const std::filesystem::path root = mergemaster::cli::resolve_root(*inv);
    auto settings = mergemaster::load_settings(root);

    if (inv->args.empty()) {
      for (const auto key : {mergemaster::consts::kKeyRespectGitignore, mergemaster::consts::kKeyOutput})
        std::cout << key << ": " << mergemaster::setting_value(settings, key) << "\n";
      return 0;
    }

    const std::string &key = inv->args[0];
    if (key != mergemaster::consts::kKeyRespectGitignore && key != mergemaster::consts::kKeyOutput) {
      std::cerr << "config: unknown key: " << key << "\n";
      return 2;
    }
    if (inv->args.size() == 1) {
      std::cout << mergemaster::setting_value(settings, key) << "\n";
      return 0;
    }
    if (!mergemaster::apply_setting(settings, key, inv->args[1])) {
      std::cerr << "config: invalid value for " << key << ": " << inv->args[1] << "\n";
      return 2;
    }
    mergemaster::save_settings(root, settings);
    std::cout << key << ": " << mergemaster::setting_value(settings, key) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 1;
  }
}
