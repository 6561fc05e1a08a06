#pragma once

#include "conj_cache/backing_store.hpp"
#include "conj_cache/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conj_cache {

using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;

struct CacheConfig {
  std::string dir{"./.cache/french-tools"};
  std::chrono::milliseconds max_age{Days{30}};
  ClockFn clock{};
};

struct CacheStats {
  std::size_t total_entries{0};
  std::uintmax_t storage_bytes{0};
  std::size_t expired_entries{0};
  // Process-local counters, not persisted.
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t expirations{0};
  std::uint64_t persist_failures{0};
};

class ResultCache {
public:
  ResultCache(std::string ns, CacheConfig cfg);
  ResultCache(std::string ns, CacheConfig cfg,
              std::unique_ptr<IBackingStore> store);

  static ResultCache open(const std::string &ns,
                          std::chrono::milliseconds max_age);

  std::optional<std::vector<std::uint8_t>>
  get(const std::vector<std::string> &args);
  bool set(const std::vector<std::uint8_t> &value,
           const std::vector<std::string> &args, std::string *err = nullptr);

  void clear();
  std::size_t cleanup_expired();
  CacheStats stats() const;

  const std::string &name() const { return ns_; }
  std::chrono::milliseconds max_age() const { return cfg_.max_age; }
  std::size_t size() const { return entries_.size(); }
  // False when the backing unit could not be read on open.
  bool loaded_from_storage() const { return loaded_; }

private:
  TimePoint now() const;
  bool is_expired(const Entry &e, TimePoint now) const;
  bool persist(std::string *err = nullptr);

  std::string ns_;
  CacheConfig cfg_;
  std::unique_ptr<IBackingStore> store_;
  EntryMap entries_;
  bool loaded_{false};
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t expirations_{0};
  std::uint64_t persist_failures_{0};
};

struct NamespaceSpec {
  std::string name;
  std::chrono::milliseconds max_age;
};

struct NamespaceStats {
  std::string name;
  CacheStats stats;
};

// Every namespace the tool suite writes to, with its default max age.
const std::vector<NamespaceSpec> &known_namespaces();

std::vector<NamespaceStats>
stats_all(const CacheConfig &base,
          const std::vector<NamespaceSpec> &namespaces = known_namespaces());
// Returns how many namespaces held entries before clearing.
std::size_t
clear_all(const CacheConfig &base,
          const std::vector<NamespaceSpec> &namespaces = known_namespaces());
std::size_t cleanup_expired_all(
    const CacheConfig &base,
    const std::vector<NamespaceSpec> &namespaces = known_namespaces());

// $CONJ_CACHE_DIR, else $HOME/.cache/french-tools, else a relative fallback.
std::string default_cache_dir();

std::string format_size(std::uintmax_t bytes);

} // namespace conj_cache
