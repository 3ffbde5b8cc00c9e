#pragma once
#include "mergemaster/consts.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace mergemaster {

struct Settings {
  bool respect_gitignore = true;
  std::string output{consts::kDefaultOutput}; // export file name, relative to root
};

// <root>/.mergemaster/config
std::filesystem::path settings_path(const std::filesystem::path& root);

// Read settings from .mergemaster/config (defaults for anything missing)
Settings load_settings(const std::filesystem::path& root);

// Overwrite .mergemaster/config with the given settings
void save_settings(const std::filesystem::path& root, const Settings& settings);

// Set one key from its textual value. Returns false for an unknown key or bad value.
bool apply_setting(Settings& settings, std::string_view key, std::string_view value);

// Textual value of one key, or empty if the key is unknown
std::string setting_value(const Settings& settings, std::string_view key);

} // namespace mergemaster
