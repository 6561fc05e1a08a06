#pragma once

#include "conj_cache/log.hpp"
#include "conj_cache/result_cache.hpp"

#include <string>
#include <vector>

namespace conj_cache {

struct ToolConfig {
  std::string cache_dir;
  LogLevel log_level{LogLevel::Warn};
  std::vector<NamespaceSpec> namespaces;
};

ToolConfig default_tool_config();

// Flat JSON object. Recognised keys: "cache_dir", "log_level" and
// "max_age_days.<namespace>". Unknown keys are ignored; values are clamped.
// A missing file leaves cfg as is and succeeds.
bool load_tool_config(const std::string &path, ToolConfig &cfg,
                      std::string *err = nullptr);

// Command-line settings. They win over the config file, so apply them after
// load_tool_config.
struct ToolOverrides {
  std::string cache_dir;
  bool verbose{false};
};

void apply_overrides(ToolConfig &cfg, const ToolOverrides &ov);

CacheConfig cache_config(const ToolConfig &cfg);
// Max age configured for a namespace, or 30 days for unknown names.
std::chrono::milliseconds max_age_for(const ToolConfig &cfg,
                                      const std::string &ns);

} // namespace conj_cache
