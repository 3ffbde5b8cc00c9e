#include "mergemaster/config.hpp"

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

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("mergemaster_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // defaults when nothing is on disk
    auto s = mergemaster::load_settings(root);
    if (!s.respect_gitignore || s.output != "merged_output.txt") {
      std::cerr << "unexpected defaults\n";
      return 1;
    }

    // save + load
    s.respect_gitignore = false;
    s.output = "bundle.txt.gz";
    mergemaster::save_settings(root, s);
    const auto loaded = mergemaster::load_settings(root);
    if (loaded.respect_gitignore || loaded.output != "bundle.txt.gz") {
      std::cerr << "settings did not survive save/load\n";
      return 1;
    }

    // comments, unknown keys and bad values keep defaults
    write_file(mergemaster::settings_path(root), "# settings\n"
                                                 "colour: blue\n"
                                                 "respect-gitignore: maybe\n"
                                                 "  output :  out.txt  \r\n");
    const auto messy = mergemaster::load_settings(root);
    if (!messy.respect_gitignore || messy.output != "out.txt") {
      std::cerr << "messy config parsed wrong: " << messy.output << "\n";
      return 1;
    }

    mergemaster::Settings t;
    if (!mergemaster::apply_setting(t, "respect-gitignore", "OFF") || t.respect_gitignore) {
      std::cerr << "apply_setting bool failed\n";
      return 1;
    }
    if (mergemaster::apply_setting(t, "respect-gitignore", "sometimes") ||
        mergemaster::apply_setting(t, "nope", "x") || mergemaster::apply_setting(t, "output", "")) {
      std::cerr << "apply_setting accepted bad input\n";
      return 1;
    }
    if (mergemaster::setting_value(t, "respect-gitignore") != "false" ||
        !mergemaster::setting_value(t, "nope").empty()) {
      std::cerr << "setting_value mismatch\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "config test exception: " << e.what() << "\n";
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  std::cout << "OK\n";
  return 0;
}
