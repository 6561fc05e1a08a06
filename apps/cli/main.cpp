#include "conj_cache/alias_resolver.hpp"
#include "conj_cache/config.hpp"
#include "conj_cache/result_cache.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

int show_stats(const conj_cache::ToolConfig &cfg) {
  auto rows =
      conj_cache::stats_all(conj_cache::cache_config(cfg), cfg.namespaces);
  std::size_t entries = 0;
  std::size_t expired = 0;
  std::uintmax_t bytes = 0;
  std::cout << std::left << std::setw(16) << "cache" << std::setw(10)
            << "entries" << std::setw(12) << "size"
            << "expired\n";
  for (const auto &r : rows) {
    if (r.stats.total_entries == 0)
      continue;
    std::cout << std::setw(16) << r.name << std::setw(10)
              << r.stats.total_entries << std::setw(12)
              << conj_cache::format_size(r.stats.storage_bytes)
              << r.stats.expired_entries << "\n";
    entries += r.stats.total_entries;
    expired += r.stats.expired_entries;
    bytes += r.stats.storage_bytes;
  }
  if (entries == 0) {
    std::cout << "no cached data found\n";
    return 0;
  }
  std::cout << "total: " << entries << " entries, "
            << conj_cache::format_size(bytes) << "\n";
  if (expired > 0)
    std::cout << "run 'cleanup' to remove " << expired << " expired entries\n";
  return 0;
}

int show_aliases() {
  conj_cache::AliasResolver resolver;
  for (const auto &t : resolver.tenses()) {
    std::cout << std::left << std::setw(30) << t.name;
    for (std::size_t i = 1; i < t.aliases.size(); ++i)
      std::cout << (i > 1 ? ", " : "") << t.aliases[i];
    std::cout << "\n";
  }
  std::cout << "\npersons:";
  for (const auto &p : resolver.persons()) {
    std::cout << " " << conj_cache::person_name(p.person) << " (";
    for (std::size_t i = 0; i < p.aliases.size(); ++i)
      std::cout << (i ? "/" : "") << p.aliases[i];
    std::cout << ")";
  }
  std::cout << "\n";
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  auto cfg = conj_cache::default_tool_config();
  std::string command = "stats";
  std::string config_path;
  conj_cache::ToolOverrides overrides;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--dir" && i + 1 < argc)
      overrides.cache_dir = argv[++i];
    else if (a == "--verbose")
      overrides.verbose = true;
    else
      command = a;
  }

  if (!config_path.empty()) {
    std::string err;
    if (!conj_cache::load_tool_config(config_path, cfg, &err)) {
      std::cerr << "config " << config_path << ": " << err << "\n";
      return 1;
    }
  }
  conj_cache::apply_overrides(cfg, overrides);
  conj_cache::set_log_level(cfg.log_level);

  if (command == "stats")
    return show_stats(cfg);
  if (command == "aliases")
    return show_aliases();
  if (command == "clear") {
    auto n = conj_cache::clear_all(conj_cache::cache_config(cfg),
                                   cfg.namespaces);
    std::cout << (n ? "cleared " + std::to_string(n) + " cache(s)"
                    : std::string("no caches to clear"))
              << "\n";
    return 0;
  }
  if (command == "cleanup") {
    auto n = conj_cache::cleanup_expired_all(conj_cache::cache_config(cfg),
                                             cfg.namespaces);
    std::cout << (n ? "removed " + std::to_string(n) + " expired entries"
                    : std::string("no expired entries found"))
              << "\n";
    return 0;
  }
  std::cerr << "unknown command: " << command << "\n"
            << "available commands: stats, clear, cleanup, aliases\n";
  return 1;
}
