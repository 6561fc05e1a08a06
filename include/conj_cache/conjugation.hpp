#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace conj_cache {

struct VerbInfo {
  std::string infinitive;
  std::string translation_en;
};

struct TenseRow {
  std::string tense;
  std::vector<std::string> forms;
};

struct MoodTable {
  std::string mood;
  std::vector<TenseRow> tenses;
};

// Provider payload: mood -> tense -> forms, kept in provider insertion order.
struct ConjugationTable {
  VerbInfo verb;
  std::vector<MoodTable> moods;

  const MoodTable *find_mood(const std::string &mood) const;
  const TenseRow *find(const std::string &mood, const std::string &tense) const;
  // Appends the mood and tense if absent, otherwise replaces the forms.
  void add(const std::string &mood, const std::string &tense,
           std::vector<std::string> forms);
  bool empty() const { return moods.empty(); }
  std::size_t row_count() const;
};

bool operator==(const TenseRow &a, const TenseRow &b);
bool operator==(const MoodTable &a, const MoodTable &b);
bool operator==(const ConjugationTable &a, const ConjugationTable &b);

} // namespace conj_cache
