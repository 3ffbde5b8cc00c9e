#include "mergemaster/ignore.hpp"

#include "mergemaster/consts.hpp"
#include "mergemaster/util.hpp"

#include <fnmatch.h>
#include <memory>
#include <sstream>

namespace mergemaster {

namespace {

// One line of an ignore file -> rule; false if the line carries no rule.
bool parse_line(std::string line, IgnoreRule &out) {
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  if (line.empty() || line[0] == '#')
    return false;

  // trailing spaces are dropped unless escaped with a backslash
  while (!line.empty() && line.back() == ' ' &&
         !(line.size() >= 2 && line[line.size() - 2] == '\\'))
    line.pop_back();
  if (line.size() >= 2 && line.back() == ' ' && line[line.size() - 2] == '\\')
    line.erase(line.size() - 2, 1);

  IgnoreRule rule;
  if (line.starts_with('!')) {
    rule.negated = true;
    line.erase(0, 1);
  } else if (line.starts_with("\\!") || line.starts_with("\\#")) {
    line.erase(0, 1);
  }

  if (line.ends_with('/')) {
    rule.dir_only = true;
    while (line.ends_with('/'))
      line.pop_back();
  }
  if (line.find('/') != std::string::npos) {
    rule.anchored = true;
    while (line.starts_with('/'))
      line.erase(0, 1);
  }
  if (line.empty())
    return false;

  rule.pattern = std::move(line);
  out = std::move(rule);
  return true;
}

bool segment_matches(const std::string &pattern, const std::string &name) {
  return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

bool match_from(const std::vector<std::string> &pat, std::size_t pi,
                const std::vector<std::string> &segs, std::size_t si, std::size_t count) {
  if (pi == pat.size())
    return si == count;
  if (pat[pi] == "**") {
    // trailing "**" matches everything inside, but not the directory itself
    if (pi + 1 == pat.size())
      return si < count;
    for (std::size_t k = si; k <= count; ++k) {
      if (match_from(pat, pi + 1, segs, k, count))
        return true;
    }
    return false;
  }
  if (si == count || !segment_matches(pat[pi], segs[si]))
    return false;
  return match_from(pat, pi + 1, segs, si + 1, count);
}

// Glob match of one rule against the first `count` segments. `**` spans segments.
bool rule_matches(const IgnoreRule &rule, const std::vector<std::string> &segments,
                  std::size_t count, bool is_dir) {
  if (count == 0 || (rule.dir_only && !is_dir))
    return false;
  if (!rule.anchored)
    return segment_matches(rule.pattern, segments[count - 1]);
  return match_from(strutil::split(rule.pattern, consts::kSlash), 0, segments, 0, count);
}

} // namespace

IgnoreRuleSet IgnoreRuleSet::parse(std::string_view text) {
  std::vector<IgnoreRule> rules;
  std::istringstream iss{std::string(text)};
  std::string line;
  while (std::getline(iss, line)) {
    IgnoreRule rule;
    if (parse_line(line, rule))
      rules.push_back(std::move(rule));
  }
  return IgnoreRuleSet{std::move(rules)};
}

int IgnoreRuleSet::last_match(const std::vector<std::string> &segments, std::size_t count,
                              bool is_dir) const {
  int verdict = -1;
  for (const auto &rule : rules_) {
    if (rule_matches(rule, segments, count, is_dir))
      verdict = rule.negated ? 0 : 1;
  }
  return verdict;
}

bool IgnoreRuleSet::ignores(std::string_view relative_path, bool is_dir) const {
  if (rules_.empty() || relative_path.empty())
    return false;
  std::vector<std::string> segments;
  for (auto &seg : strutil::split(relative_path, consts::kSlash)) {
    if (!seg.empty() && seg != ".")
      segments.push_back(std::move(seg));
  }
  if (segments.empty() || segments.front() == "..")
    return false;

  // an excluded ancestor directory cannot be re-entered by a later negation
  for (std::size_t depth = 1; depth < segments.size(); ++depth) {
    if (last_match(segments, depth, true) == 1)
      return true;
  }
  return last_match(segments, segments.size(), is_dir) == 1;
}

PathPredicate build_ignore_filter(const std::filesystem::path &root, bool enabled,
                                  const fs::Filesystem &fsys, Diagnostics &diagnostics) {
  const auto accept_all = [](const std::filesystem::path &) { return true; };
  if (!enabled)
    return accept_all;

  const std::filesystem::path ignore_path = root / consts::kIgnoreFile;
  try {
    if (fsys.stat(ignore_path) != fs::EntryKind::File)
      return accept_all; // no rules is not an error

    auto rules = std::make_shared<const IgnoreRuleSet>(IgnoreRuleSet::parse(fsys.read_text(ignore_path)));
    if (rules->empty())
      return accept_all;

    const std::filesystem::path base = fs::resolved_path(root);
    return [rules, base](const std::filesystem::path &abs) {
      const std::string rel =
          fs::resolved_path(abs, false).lexically_relative(base).generic_string();
      return !rules->ignores(rel);
    };
  } catch (const std::exception &e) {
    diagnostics.push_back(Diagnostic{.kind = DiagnosticKind::IgnoreRulesUnusable,
                                     .path = ignore_path.string(),
                                     .message = std::string("ignore rules not applied: ") + e.what()});
    return accept_all;
  }
}

} // namespace mergemaster
