#include "mergemaster/config.hpp"

#include "mergemaster/consts.hpp"
#include "mergemaster/fs.hpp"
#include "mergemaster/util.hpp"

#include <sstream>
#include <string_view>

namespace mergemaster {

std::filesystem::path settings_path(const std::filesystem::path &root) {
  return root / consts::kConfigDir / consts::kConfigFile;
}

bool apply_setting(Settings &settings, std::string_view key, std::string_view value) {
  if (key == consts::kKeyRespectGitignore) {
    const auto b = strutil::parse_bool(value);
    if (!b)
      return false;
    settings.respect_gitignore = *b;
    return true;
  }
  if (key == consts::kKeyOutput) {
    if (value.empty())
      return false;
    settings.output = std::string(value);
    return true;
  }
  return false;
}

std::string setting_value(const Settings &settings, std::string_view key) {
  if (key == consts::kKeyRespectGitignore)
    return settings.respect_gitignore ? "true" : "false";
  if (key == consts::kKeyOutput)
    return settings.output;
  return {};
}

auto load_settings(const std::filesystem::path &root) -> Settings {
  Settings out{};
  const auto path = settings_path(root);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    // unknown keys and unparseable values keep the default
    (void)apply_setting(out, strutil::trim(sv.substr(0, colon)),
                        strutil::trim(sv.substr(colon + 1)));
  }
  return out;
}

void save_settings(const std::filesystem::path &root, const Settings &settings) {
  std::ostringstream os;
  os << consts::kKeyRespectGitignore << ": " << setting_value(settings, consts::kKeyRespectGitignore)
     << '\n'
     << consts::kKeyOutput << ": " << settings.output << '\n';

  const auto path = settings_path(root);
  const std::string s = os.str();
  const auto *data = reinterpret_cast<const std::uint8_t *>(s.data());
  fs::write_file_atomic(path, std::span(data, s.size()));
}

} // namespace mergemaster
