#include "conj_cache/result_cache.hpp"

#include "conj_cache/digest.hpp"
#include "conj_cache/log.hpp"

#include <cstdio>
#include <cstdlib>

namespace conj_cache {

ResultCache::ResultCache(std::string ns, CacheConfig cfg)
    : ResultCache(ns, cfg, make_file_store(cfg.dir)) {}

ResultCache::ResultCache(std::string ns, CacheConfig cfg,
                         std::unique_ptr<IBackingStore> store)
    : ns_(std::move(ns)), cfg_(std::move(cfg)), store_(std::move(store)) {
  std::string err;
  loaded_ = store_->load(ns_, &entries_, &err);
  if (!loaded_) {
    entries_.clear();
    CONJ_LOG_WARN("cache '" + ns_ + "' unreadable, starting empty: " + err);
  }
}

ResultCache ResultCache::open(const std::string &ns,
                              std::chrono::milliseconds max_age) {
  CacheConfig cfg;
  cfg.dir = default_cache_dir();
  cfg.max_age = max_age;
  return ResultCache(ns, std::move(cfg));
}

std::optional<std::vector<std::uint8_t>>
ResultCache::get(const std::vector<std::string> &args) {
  const auto digest = digest_key(args);
  if (!digest) {
    ++misses_;
    return std::nullopt;
  }
  const std::string &key = *digest;
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++misses_;
    CONJ_LOG_DEBUG("cache '" + ns_ + "' miss " + key);
    return std::nullopt;
  }
  if (is_expired(it->second, now())) {
    entries_.erase(it);
    ++expirations_;
    ++misses_;
    CONJ_LOG_DEBUG("cache '" + ns_ + "' expired " + key);
    persist();
    return std::nullopt;
  }
  ++hits_;
  CONJ_LOG_DEBUG("cache '" + ns_ + "' hit " + key);
  return it->second.value;
}

bool ResultCache::set(const std::vector<std::uint8_t> &value,
                      const std::vector<std::string> &args, std::string *err) {
  auto key = digest_key(args);
  if (!key) {
    if (err)
      *err = "cannot compute cache key";
    return false;
  }
  Entry e;
  e.value = value;
  e.stored_at = now();
  e.args = args;
  entries_[std::move(*key)] = std::move(e);
  return persist(err);
}

void ResultCache::clear() {
  entries_.clear();
  std::string err;
  if (!store_->remove(ns_, &err)) {
    ++persist_failures_;
    CONJ_LOG_WARN("could not remove cache '" + ns_ + "': " + err);
  }
}

std::size_t ResultCache::cleanup_expired() {
  const auto t = now();
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (is_expired(it->second, t)) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    expirations_ += removed;
    persist();
  }
  return removed;
}

CacheStats ResultCache::stats() const {
  CacheStats s;
  s.hits = hits_;
  s.misses = misses_;
  s.expirations = expirations_;
  s.persist_failures = persist_failures_;
  if (entries_.empty())
    return s;
  const auto t = now();
  s.total_entries = entries_.size();
  s.storage_bytes = store_->size_bytes(ns_);
  for (const auto &[_, e] : entries_)
    if (is_expired(e, t))
      ++s.expired_entries;
  return s;
}

TimePoint ResultCache::now() const {
  return cfg_.clock ? cfg_.clock() : Clock::now();
}

bool ResultCache::is_expired(const Entry &e, TimePoint now) const {
  return now - e.stored_at > cfg_.max_age;
}

bool ResultCache::persist(std::string *err) {
  std::string why;
  if (store_->save(ns_, entries_, &why))
    return true;
  ++persist_failures_;
  CONJ_LOG_WARN("could not save cache '" + ns_ + "': " + why);
  if (err)
    *err = why;
  return false;
}

const std::vector<NamespaceSpec> &known_namespaces() {
  static const std::vector<NamespaceSpec> kNamespaces{
      {"wordreference", Days{7}},
      {"conjugation", Days{30}},
      {"verbecc", Days{30}},
      {"larousse", Days{14}},
  };
  return kNamespaces;
}

namespace {
CacheConfig config_for(const CacheConfig &base, const NamespaceSpec &ns) {
  CacheConfig cfg = base;
  cfg.max_age = ns.max_age;
  return cfg;
}
} // namespace

std::vector<NamespaceStats>
stats_all(const CacheConfig &base,
          const std::vector<NamespaceSpec> &namespaces) {
  std::vector<NamespaceStats> out;
  out.reserve(namespaces.size());
  for (const auto &ns : namespaces) {
    ResultCache cache(ns.name, config_for(base, ns));
    out.push_back({ns.name, cache.stats()});
  }
  return out;
}

std::size_t clear_all(const CacheConfig &base,
                      const std::vector<NamespaceSpec> &namespaces) {
  std::size_t cleared = 0;
  for (const auto &ns : namespaces) {
    ResultCache cache(ns.name, config_for(base, ns));
    if (cache.size() > 0)
      ++cleared;
    cache.clear();
  }
  return cleared;
}

std::size_t cleanup_expired_all(const CacheConfig &base,
                                const std::vector<NamespaceSpec> &namespaces) {
  std::size_t removed = 0;
  for (const auto &ns : namespaces) {
    ResultCache cache(ns.name, config_for(base, ns));
    removed += cache.cleanup_expired();
  }
  return removed;
}

std::string default_cache_dir() {
  if (const char *dir = std::getenv("CONJ_CACHE_DIR"); dir && *dir)
    return dir;
  if (const char *home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.cache/french-tools";
  return "./.cache/french-tools";
}

std::string format_size(std::uintmax_t bytes) {
  if (bytes == 0)
    return "0 B";
  static const char *kUnits[] = {"B", "KB", "MB", "GB"};
  double size = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (size >= 1024.0 && unit < 3) {
    size /= 1024.0;
    ++unit;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", size, kUnits[unit]);
  return buf;
}

} // namespace conj_cache
