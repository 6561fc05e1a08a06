#include "conj_cache/config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace conj_cache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]{1,9})");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
std::string regex_escape(const std::string &s) {
  static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
  return std::regex_replace(s, special, R"(\$&)");
}
} // namespace

ToolConfig default_tool_config() {
  ToolConfig cfg;
  cfg.cache_dir = default_cache_dir();
  cfg.namespaces = known_namespaces();
  return cfg;
}

bool load_tool_config(const std::string &path, ToolConfig &cfg,
                      std::string *err) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec))
    return true;
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "cannot open config file";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  ToolConfig next = cfg;
  std::string s;
  if (extract_string(text, "cache_dir", s) && !s.empty())
    next.cache_dir = s;
  if (extract_string(text, "log_level", s)) {
    auto level = parse_log_level(s);
    if (!level) {
      if (err)
        *err = "unknown log_level '" + s + "'";
      return false;
    }
    next.log_level = *level;
  }
  for (auto &ns : next.namespaces) {
    std::uint64_t days = 0;
    if (extract_u64(text, "max_age_days\\." + regex_escape(ns.name), days))
      ns.max_age = Days{static_cast<std::int64_t>(
          std::clamp<std::uint64_t>(days, 0, 3650))};
  }
  cfg = std::move(next);
  return true;
}

void apply_overrides(ToolConfig &cfg, const ToolOverrides &ov) {
  if (!ov.cache_dir.empty())
    cfg.cache_dir = ov.cache_dir;
  if (ov.verbose)
    cfg.log_level = LogLevel::Debug;
}

CacheConfig cache_config(const ToolConfig &cfg) {
  CacheConfig c;
  c.dir = cfg.cache_dir;
  return c;
}

std::chrono::milliseconds max_age_for(const ToolConfig &cfg,
                                      const std::string &ns) {
  for (const auto &spec : cfg.namespaces)
    if (spec.name == ns)
      return spec.max_age;
  return Days{30};
}

} // namespace conj_cache
