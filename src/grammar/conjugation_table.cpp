#include "conj_cache/conjugation.hpp"

#include <algorithm>
#include <iterator>

namespace conj_cache {

const MoodTable *ConjugationTable::find_mood(const std::string &mood) const {
  auto it = std::find_if(moods.begin(), moods.end(),
                         [&](const MoodTable &m) { return m.mood == mood; });
  return it == moods.end() ? nullptr : &*it;
}

const TenseRow *ConjugationTable::find(const std::string &mood,
                                       const std::string &tense) const {
  const MoodTable *m = find_mood(mood);
  if (!m)
    return nullptr;
  auto it = std::find_if(m->tenses.begin(), m->tenses.end(),
                         [&](const TenseRow &r) { return r.tense == tense; });
  return it == m->tenses.end() ? nullptr : &*it;
}

void ConjugationTable::add(const std::string &mood, const std::string &tense,
                           std::vector<std::string> forms) {
  auto mit = std::find_if(moods.begin(), moods.end(),
                          [&](const MoodTable &m) { return m.mood == mood; });
  if (mit == moods.end()) {
    moods.push_back({mood, {}});
    mit = std::prev(moods.end());
  }
  auto tit = std::find_if(mit->tenses.begin(), mit->tenses.end(),
                          [&](const TenseRow &r) { return r.tense == tense; });
  if (tit == mit->tenses.end())
    mit->tenses.push_back({tense, std::move(forms)});
  else
    tit->forms = std::move(forms);
}

std::size_t ConjugationTable::row_count() const {
  std::size_t n = 0;
  for (const auto &m : moods)
    n += m.tenses.size();
  return n;
}

bool operator==(const TenseRow &a, const TenseRow &b) {
  return a.tense == b.tense && a.forms == b.forms;
}

bool operator==(const MoodTable &a, const MoodTable &b) {
  return a.mood == b.mood && a.tenses == b.tenses;
}

bool operator==(const ConjugationTable &a, const ConjugationTable &b) {
  return a.verb.infinitive == b.verb.infinitive &&
         a.verb.translation_en == b.verb.translation_en && a.moods == b.moods;
}

} // namespace conj_cache
