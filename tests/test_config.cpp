#include "conj_cache/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace conj_cache;

namespace {
std::string write_config(const std::string &name, const std::string &body) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream(path, std::ios::trunc) << body;
  return path.string();
}
} // namespace

TEST_CASE("defaults cover every known namespace", "[config]") {
  auto cfg = default_tool_config();
  CHECK(cfg.log_level == LogLevel::Warn);
  CHECK(cfg.namespaces.size() == known_namespaces().size());
  CHECK(max_age_for(cfg, "wordreference") == Days{7});
  CHECK(max_age_for(cfg, "unheard-of") == Days{30});
  CHECK_FALSE(cfg.cache_dir.empty());
}

TEST_CASE("cache dir honours the environment override", "[config]") {
  ::setenv("CONJ_CACHE_DIR", "/tmp/conj-env-dir", 1);
  CHECK(default_cache_dir() == "/tmp/conj-env-dir");
  CHECK(default_tool_config().cache_dir == "/tmp/conj-env-dir");
  ::unsetenv("CONJ_CACHE_DIR");
  CHECK(default_cache_dir() != "/tmp/conj-env-dir");
}

TEST_CASE("config file overrides and clamps values", "[config]") {
  auto cfg = default_tool_config();
  const auto path = write_config(
      "conj_cfg_ok.json",
      R"({"cache_dir":"/tmp/conj-x","log_level":"debug",
          "max_age_days.verbecc": 2, "max_age_days.larousse": 999999,
          "max_age_days.nope": 1})");
  std::string err;
  REQUIRE(load_tool_config(path, cfg, &err));
  CHECK(cfg.cache_dir == "/tmp/conj-x");
  CHECK(cfg.log_level == LogLevel::Debug);
  CHECK(max_age_for(cfg, "verbecc") == Days{2});
  CHECK(max_age_for(cfg, "larousse") == Days{3650});
  CHECK(max_age_for(cfg, "wordreference") == Days{7});
  CHECK(cache_config(cfg).dir == "/tmp/conj-x");
}

TEST_CASE("invalid config leaves settings untouched", "[config]") {
  auto cfg = default_tool_config();
  const auto before = cfg.cache_dir;
  std::string err;

  CHECK(load_tool_config("/nonexistent/conj.json", cfg, &err));
  CHECK(cfg.cache_dir == before);

  CHECK_FALSE(load_tool_config(write_config("conj_cfg_bad.json", "cache_dir"),
                               cfg, &err));
  CHECK(err == "invalid schema");

  CHECK_FALSE(load_tool_config(
      write_config("conj_cfg_lvl.json",
                   R"({"cache_dir":"/tmp/other","log_level":"loud"})"),
      cfg, &err));
  CHECK(err.find("log_level") != std::string::npos);
  CHECK(cfg.cache_dir == before);
}

TEST_CASE("command-line overrides win over the config file", "[config]") {
  auto cfg = default_tool_config();
  const auto path = write_config(
      "conj_cfg_quiet.json",
      R"({"cache_dir":"/tmp/from-file","log_level":"error"})");
  REQUIRE(load_tool_config(path, cfg));

  ToolOverrides ov;
  ov.verbose = true;
  ov.cache_dir = "/tmp/from-flag";
  apply_overrides(cfg, ov);
  CHECK(cfg.log_level == LogLevel::Debug);
  CHECK(cfg.cache_dir == "/tmp/from-flag");

  auto untouched = default_tool_config();
  REQUIRE(load_tool_config(path, untouched));
  apply_overrides(untouched, ToolOverrides{});
  CHECK(untouched.log_level == LogLevel::Error);
  CHECK(untouched.cache_dir == "/tmp/from-file");
}

TEST_CASE("log levels parse by name", "[config][log]") {
  CHECK(parse_log_level("info") == LogLevel::Info);
  CHECK(parse_log_level("error") == LogLevel::Error);
  CHECK_FALSE(parse_log_level("verbose").has_value());
}
