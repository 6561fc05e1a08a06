#include "conj_cache/backing_store.hpp"

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace conj_cache {
namespace {
#pragma pack(push, 1)
struct FileHeader {
  std::uint32_t magic;
  std::uint32_t version;
  std::uint32_t count;
  std::uint32_t reserved;
};

struct RecordHeader {
  std::uint32_t magic;
  std::uint32_t checksum;
  std::int64_t stored_at_ns;
  std::uint32_t key_len;
  std::uint32_t arg_count;
  std::uint32_t args_len;
  std::uint32_t value_len;
};
#pragma pack(pop)

constexpr std::uint32_t kFileMagic = 0x314a4343; // CCJ1
constexpr std::uint32_t kRecordMagic = 0x52434a43; // CJCR
constexpr std::uint32_t kVersion = 2;

std::uint32_t checksum32(const RecordHeader &h, const char *body,
                         std::size_t body_len) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < sizeof(RecordHeader); ++i) {
    if (i >= offsetof(RecordHeader, checksum) &&
        i < offsetof(RecordHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (std::size_t i = 0; i < body_len; ++i)
    mix(static_cast<std::uint8_t>(body[i]));
  return sum;
}

void put_u32(std::string &out, std::uint32_t v) {
  out.append(reinterpret_cast<const char *>(&v), sizeof(v));
}

std::string pack_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &a : args) {
    put_u32(out, static_cast<std::uint32_t>(a.size()));
    out += a;
  }
  return out;
}

bool unpack_args(const char *p, std::size_t len, std::uint32_t count,
                 std::vector<std::string> *out) {
  std::size_t pos = 0;
  for (std::uint32_t i = 0; i < count; ++i) {
    std::uint32_t n = 0;
    if (len - pos < sizeof(n))
      return false;
    std::memcpy(&n, p + pos, sizeof(n));
    pos += sizeof(n);
    if (len - pos < n)
      return false;
    out->emplace_back(p + pos, n);
    pos += n;
  }
  return pos == len;
}

bool fsync_path(const std::string &path, int flags) {
  int fd = open(path.c_str(), flags);
  if (fd < 0)
    return false;
  bool ok = ::fsync(fd) == 0;
  close(fd);
  return ok;
}

bool parse_snapshot(const std::string &data, EntryMap *out, std::string *err) {
  auto fail = [&](const char *why) {
    if (err)
      *err = why;
    out->clear();
    return false;
  };
  FileHeader fh{};
  if (data.size() < sizeof(fh))
    return fail("truncated file header");
  std::memcpy(&fh, data.data(), sizeof(fh));
  if (fh.magic != kFileMagic)
    return fail("bad file magic");
  if (fh.version != kVersion)
    return fail("unsupported file version");

  std::size_t off = sizeof(fh);
  for (std::uint32_t i = 0; i < fh.count; ++i) {
    RecordHeader h{};
    if (data.size() - off < sizeof(h))
      return fail("truncated record header");
    std::memcpy(&h, data.data() + off, sizeof(h));
    if (h.magic != kRecordMagic)
      return fail("bad record magic");
    const std::size_t body_len = static_cast<std::size_t>(h.key_len) +
                                 h.args_len + h.value_len;
    if (data.size() - off - sizeof(h) < body_len)
      return fail("truncated record body");
    const char *body = data.data() + off + sizeof(h);
    if (checksum32(h, body, body_len) != h.checksum)
      return fail("record checksum mismatch");

    std::string key(body, h.key_len);
    Entry e;
    e.stored_at = from_epoch_ns(h.stored_at_ns);
    if (!unpack_args(body + h.key_len, h.args_len, h.arg_count, &e.args))
      return fail("malformed record arguments");
    const char *value = body + h.key_len + h.args_len;
    e.value.assign(reinterpret_cast<const std::uint8_t *>(value),
                   reinterpret_cast<const std::uint8_t *>(value) +
                       h.value_len);
    (*out)[std::move(key)] = std::move(e);
    off += sizeof(h) + body_len;
  }
  if (off != data.size())
    return fail("trailing bytes after last record");
  return true;
}

std::string build_snapshot(const EntryMap &entries) {
  std::string out;
  FileHeader fh{kFileMagic, kVersion,
                static_cast<std::uint32_t>(entries.size()), 0};
  out.append(reinterpret_cast<const char *>(&fh), sizeof(fh));
  for (const auto &[key, e] : entries) {
    const std::string args = pack_args(e.args);
    std::string body;
    body.reserve(key.size() + args.size() + e.value.size());
    body += key;
    body += args;
    body.append(reinterpret_cast<const char *>(e.value.data()),
                e.value.size());

    RecordHeader h{};
    h.magic = kRecordMagic;
    h.stored_at_ns = to_epoch_ns(e.stored_at);
    h.key_len = static_cast<std::uint32_t>(key.size());
    h.arg_count = static_cast<std::uint32_t>(e.args.size());
    h.args_len = static_cast<std::uint32_t>(args.size());
    h.value_len = static_cast<std::uint32_t>(e.value.size());
    h.checksum = checksum32(h, body.data(), body.size());
    out.append(reinterpret_cast<const char *>(&h), sizeof(h));
    out += body;
  }
  return out;
}

class FileStore final : public IBackingStore {
public:
  explicit FileStore(std::string dir) : dir_(std::move(dir)) {}

  bool load(const std::string &ns, EntryMap *out, std::string *err) override {
    out->clear();
    const std::string path = namespace_path(dir_, ns);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
      return true;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
      if (err)
        *err = "cannot open " + path;
      return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
      if (err)
        *err = "read failed for " + path;
      return false;
    }
    return parse_snapshot(ss.str(), out, err);
  }

  bool save(const std::string &ns, const EntryMap &entries,
            std::string *err) override {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
      if (err)
        *err = "cannot create " + dir_ + ": " + ec.message();
      return false;
    }
    const std::string final = namespace_path(dir_, ns);
    const std::string tmp = final + ".tmp";
    const std::string data = build_snapshot(entries);
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out.is_open()) {
        if (err)
          *err = "cannot write " + tmp;
        return false;
      }
      out.write(data.data(), static_cast<std::streamsize>(data.size()));
      out.flush();
      if (!out) {
        if (err)
          *err = "short write to " + tmp;
        return false;
      }
    }
    if (!fsync_path(tmp, O_RDONLY)) {
      if (err)
        *err = "fsync failed for " + tmp;
      return false;
    }
    if (rename(tmp.c_str(), final.c_str()) != 0) {
      if (err)
        *err = "rename failed for " + final;
      return false;
    }
    if (!fsync_path(dir_, O_RDONLY | O_DIRECTORY)) {
      if (err)
        *err = "fsync failed for " + dir_;
      return false;
    }
    return true;
  }

  bool remove(const std::string &ns, std::string *err) override {
    std::error_code ec;
    std::filesystem::remove(namespace_path(dir_, ns), ec);
    if (ec) {
      if (err)
        *err = "cannot remove cache file: " + ec.message();
      return false;
    }
    return true;
  }

  std::uintmax_t size_bytes(const std::string &ns) const override {
    std::error_code ec;
    auto n = std::filesystem::file_size(namespace_path(dir_, ns), ec);
    return ec ? 0 : n;
  }

private:
  std::string dir_;
};

} // namespace

std::string namespace_path(const std::string &dir, const std::string &ns) {
  std::string safe;
  safe.reserve(ns.size());
  for (unsigned char c : ns) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    safe.push_back(ok ? static_cast<char>(c) : '_');
  }
  return dir + "/" + safe + ".cache";
}

std::unique_ptr<IBackingStore> make_file_store(std::string dir) {
  return std::make_unique<FileStore>(std::move(dir));
}

} // namespace conj_cache
