#include "conj_cache/table_codec.hpp"

#include <cstring>

namespace conj_cache {
namespace {

// Layout: magic, verb info, moods { name, tenses { name, forms } }, checksum.
// Integers are u32 in host order, strings are u32 length + bytes.
constexpr std::uint32_t kTableMagic = 0x3154434a; // JCT1

std::uint32_t fnv1a32(const std::uint8_t *p, std::size_t n) {
  std::uint32_t h = 2166136261u;
  for (std::size_t i = 0; i < n; ++i) {
    h ^= p[i];
    h *= 16777619u;
  }
  return h;
}

class Writer {
public:
  void u32(std::uint32_t v) {
    auto *p = reinterpret_cast<const std::uint8_t *>(&v);
    out_.insert(out_.end(), p, p + sizeof(v));
  }
  void str(const std::string &s) {
    u32(static_cast<std::uint32_t>(s.size()));
    out_.insert(out_.end(), s.begin(), s.end());
  }
  std::vector<std::uint8_t> finish() {
    u32(fnv1a32(out_.data(), out_.size()));
    return std::move(out_);
  }

private:
  std::vector<std::uint8_t> out_;
};

class Reader {
public:
  Reader(const std::uint8_t *p, std::size_t n) : p_(p), n_(n) {}

  bool u32(std::uint32_t &v) {
    if (n_ - pos_ < sizeof(v))
      return false;
    std::memcpy(&v, p_ + pos_, sizeof(v));
    pos_ += sizeof(v);
    return true;
  }
  bool str(std::string &s) {
    std::uint32_t len = 0;
    if (!u32(len) || n_ - pos_ < len)
      return false;
    s.assign(reinterpret_cast<const char *>(p_ + pos_), len);
    pos_ += len;
    return true;
  }
  // Guards element counts against the bytes actually left.
  bool count(std::uint32_t &c) {
    return u32(c) && c <= (n_ - pos_) / sizeof(std::uint32_t);
  }
  bool done() const { return pos_ == n_; }

private:
  const std::uint8_t *p_;
  std::size_t n_;
  std::size_t pos_{0};
};

} // namespace

std::vector<std::uint8_t> encode_table(const ConjugationTable &table) {
  Writer w;
  w.u32(kTableMagic);
  w.str(table.verb.infinitive);
  w.str(table.verb.translation_en);
  w.u32(static_cast<std::uint32_t>(table.moods.size()));
  for (const auto &m : table.moods) {
    w.str(m.mood);
    w.u32(static_cast<std::uint32_t>(m.tenses.size()));
    for (const auto &row : m.tenses) {
      w.str(row.tense);
      w.u32(static_cast<std::uint32_t>(row.forms.size()));
      for (const auto &f : row.forms)
        w.str(f);
    }
  }
  return w.finish();
}

std::optional<ConjugationTable>
decode_table(const std::vector<std::uint8_t> &bytes, std::string *err) {
  auto fail = [&](const char *why) -> std::optional<ConjugationTable> {
    if (err)
      *err = why;
    return std::nullopt;
  };
  if (bytes.size() < 2 * sizeof(std::uint32_t))
    return fail("payload too short");
  const std::size_t body = bytes.size() - sizeof(std::uint32_t);
  std::uint32_t stored = 0;
  std::memcpy(&stored, bytes.data() + body, sizeof(stored));
  if (stored != fnv1a32(bytes.data(), body))
    return fail("payload checksum mismatch");

  Reader r(bytes.data(), body);
  std::uint32_t magic = 0;
  if (!r.u32(magic) || magic != kTableMagic)
    return fail("not a conjugation table");

  ConjugationTable t;
  std::uint32_t moods = 0;
  if (!r.str(t.verb.infinitive) || !r.str(t.verb.translation_en) ||
      !r.count(moods))
    return fail("truncated table header");
  t.moods.reserve(moods);
  for (std::uint32_t i = 0; i < moods; ++i) {
    MoodTable m;
    std::uint32_t tenses = 0;
    if (!r.str(m.mood) || !r.count(tenses))
      return fail("truncated mood");
    m.tenses.reserve(tenses);
    for (std::uint32_t j = 0; j < tenses; ++j) {
      TenseRow row;
      std::uint32_t forms = 0;
      if (!r.str(row.tense) || !r.count(forms))
        return fail("truncated tense row");
      row.forms.resize(forms);
      for (auto &f : row.forms)
        if (!r.str(f))
          return fail("truncated form");
      m.tenses.push_back(std::move(row));
    }
    t.moods.push_back(std::move(m));
  }
  if (!r.done())
    return fail("trailing bytes in payload");
  return t;
}

} // namespace conj_cache
