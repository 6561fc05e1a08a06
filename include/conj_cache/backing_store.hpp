#pragma once

#include "conj_cache/types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace conj_cache {

// Whole-value durable storage, one unit per namespace.
class IBackingStore {
public:
  virtual ~IBackingStore() = default;
  // A missing unit loads as empty and succeeds. Unreadable or corrupt data
  // fails with *out left empty.
  virtual bool load(const std::string &ns, EntryMap *out,
                    std::string *err = nullptr) = 0;
  virtual bool save(const std::string &ns, const EntryMap &entries,
                    std::string *err = nullptr) = 0;
  virtual bool remove(const std::string &ns, std::string *err = nullptr) = 0;
  virtual std::uintmax_t size_bytes(const std::string &ns) const = 0;
};

std::string namespace_path(const std::string &dir, const std::string &ns);

std::unique_ptr<IBackingStore> make_file_store(std::string dir);

} // namespace conj_cache
