#include "conj_cache/alias_resolver.hpp"

#include "conj_cache/log.hpp"

#include <algorithm>

namespace conj_cache {
namespace {

bool is_space(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

std::size_t full_slot(Person p) { return static_cast<std::size_t>(p); }

void warn_malformed(const std::string &mood, const TenseRow &row,
                    RowShape shape) {
  CONJ_LOG_WARN("skipping malformed row " + mood + "/" + row.tense + ": " +
                std::to_string(row.forms.size()) + " forms for " +
                row_shape_name(shape) + " shape");
}

} // namespace

std::string fold_token(const std::string &input) {
  std::size_t b = 0;
  std::size_t e = input.size();
  while (b < e && is_space(static_cast<unsigned char>(input[b])))
    ++b;
  while (e > b && is_space(static_cast<unsigned char>(input[e - 1])))
    --e;

  std::string out;
  out.reserve(e - b);
  for (std::size_t i = b; i < e; ++i) {
    const auto c = static_cast<unsigned char>(input[i]);
    if (c < 0x80) {
      out.push_back(c >= 'A' && c <= 'Z' ? static_cast<char>(c + 32)
                                         : static_cast<char>(c));
      continue;
    }
    if (c == 0xC3 && i + 1 < e) {
      // U+00C0..U+00DE, except U+00D7 (multiplication sign)
      auto n = static_cast<unsigned char>(input[i + 1]);
      if (n >= 0x80 && n <= 0x9E && n != 0x97)
        n = static_cast<unsigned char>(n + 0x20);
      out.push_back(static_cast<char>(c));
      out.push_back(static_cast<char>(n));
      ++i;
      continue;
    }
    if (c == 0xC5 && i + 1 < e) {
      // U+0152 OE ligature
      auto n = static_cast<unsigned char>(input[i + 1]);
      if (n == 0x92)
        n = 0x93;
      out.push_back(static_cast<char>(c));
      out.push_back(static_cast<char>(n));
      ++i;
      continue;
    }
    if (c == 0xE2 && i + 2 < e &&
        static_cast<unsigned char>(input[i + 1]) == 0x80 &&
        static_cast<unsigned char>(input[i + 2]) == 0x99) {
      // U+2019 typographic apostrophe, as typed in "j’"
      out.push_back('\'');
      i += 2;
      continue;
    }
    out.push_back(static_cast<char>(c));
  }
  return out;
}

const char *person_name(Person p) {
  switch (p) {
  case Person::Je:
    return "je";
  case Person::Tu:
    return "tu";
  case Person::Il:
    return "il";
  case Person::Nous:
    return "nous";
  case Person::Vous:
    return "vous";
  case Person::Ils:
    return "ils";
  }
  return "?";
}

std::optional<std::size_t> imperative_slot(Person p) {
  for (std::size_t i = 0; i < kImperativePersons.size(); ++i)
    if (kImperativePersons[i] == p)
      return i;
  return std::nullopt;
}

const char *row_shape_name(RowShape s) {
  switch (s) {
  case RowShape::Full:
    return "full";
  case RowShape::Imperative:
    return "imperative";
  case RowShape::Impersonal:
    return "impersonal";
  }
  return "?";
}

ResolverTables french_tables() {
  ResolverTables t;
  t.persons = {
      {Person::Je, {"je", "j'", "j"}},
      {Person::Tu, {"tu"}},
      {Person::Il, {"il", "elle", "on"}},
      {Person::Nous, {"nous"}},
      {Person::Vous, {"vous"}},
      {Person::Ils, {"ils", "elles"}},
  };
  t.tenses = {
      {"présent", "indicatif", "présent", {"présent", "present", "pres", "p"}},
      {"imparfait", "indicatif", "imparfait",
       {"imparfait", "imperfect", "i"}},
      {"passé simple", "indicatif", "passé-simple",
       {"passé simple", "passé-simple", "simple", "ps"}},
      {"futur simple", "indicatif", "futur-simple",
       {"futur simple", "futur-simple", "futur", "future", "fut", "f"}},
      {"passé composé", "indicatif", "passé-composé",
       {"passé composé", "passé-composé", "passe-compose", "pc"}},
      {"plus-que-parfait", "indicatif", "plus-que-parfait",
       {"plus-que-parfait", "pluperfect", "pqp"}},
      {"passé antérieur", "indicatif", "passé-antérieur",
       {"passé antérieur", "passé-antérieur", "passe-anterieur", "pa"}},
      {"futur antérieur", "indicatif", "futur-antérieur",
       {"futur antérieur", "futur-antérieur", "futur-anterieur", "fa"}},

      {"conditionnel présent", "conditionnel", "présent",
       {"conditionnel présent", "conditionnel", "conditional", "cond", "c"}},
      {"conditionnel passé", "conditionnel", "passé",
       {"conditionnel passé", "conditionnel-passe", "cond-passe", "cp"}},

      {"subjonctif présent", "subjonctif", "présent",
       {"subjonctif présent", "subjonctif", "subjunctive", "subj", "s"}},
      {"subjonctif imparfait", "subjonctif", "imparfait",
       {"subjonctif imparfait", "subj-imp", "si"}},
      {"subjonctif passé", "subjonctif", "passé",
       {"subjonctif passé", "subj-passe", "sp"}},
      {"subjonctif plus-que-parfait", "subjonctif", "plus-que-parfait",
       {"subjonctif plus-que-parfait", "subj-pqp", "spqp"}},

      {"impératif présent", "imperatif", "imperatif-présent",
       {"impératif présent", "imperatif", "imperative", "impér", "im"}},
      {"impératif passé", "imperatif", "imperatif-passé",
       {"impératif passé", "impér-passé", "imperatif-passe", "imp"}},

      {"infinitif présent", "infinitif", "infinitif-présent",
       {"infinitif présent", "infinitif", "infinitive", "inf"}},
      {"infinitif passé", "infinitif", "infinitif-passé",
       {"infinitif passé", "inf-passe", "inf-passé"}},

      {"participe présent", "participe", "participe-présent",
       {"participe présent", "part-pres", "participle", "part", "gérondif",
        "ger", "gerund"}},
      {"participe passé", "participe", "participe-passé",
       {"participe passé", "part-passe", "part-passé", "pp"}},
  };
  t.shapes = {
      {"imperatif", "", RowShape::Imperative},
      {"impératif", "", RowShape::Imperative},
      {"infinitif", "", RowShape::Impersonal},
      {"participe", "", RowShape::Impersonal},
      {"gérondif", "", RowShape::Impersonal},
  };
  return t;
}

AliasResolver::AliasResolver() : AliasResolver(french_tables()) {}

AliasResolver::AliasResolver(ResolverTables tables)
    : tables_(std::move(tables)) {
  for (std::size_t i = 0; i < tables_.persons.size(); ++i) {
    for (const auto &alias : tables_.persons[i].aliases) {
      auto [it, inserted] = person_alias_.emplace(fold_token(alias), i);
      if (!inserted && it->second != i)
        collisions_.push_back(
            "person alias '" + alias + "' claimed by " +
            person_name(tables_.persons[it->second].person) + " and " +
            person_name(tables_.persons[i].person));
    }
  }
  for (std::size_t i = 0; i < tables_.tenses.size(); ++i) {
    for (const auto &alias : tables_.tenses[i].aliases) {
      auto [it, inserted] = tense_alias_.emplace(fold_token(alias), i);
      if (!inserted && it->second != i)
        collisions_.push_back("tense alias '" + alias + "' claimed by " +
                              tables_.tenses[it->second].name + " and " +
                              tables_.tenses[i].name);
    }
  }
  for (const auto &c : collisions_)
    CONJ_LOG_WARN(c + ", first declaration wins");
}

std::optional<Person>
AliasResolver::resolve_person(const std::string &input) const {
  auto it = person_alias_.find(fold_token(input));
  if (it == person_alias_.end())
    return std::nullopt;
  return tables_.persons[it->second].person;
}

std::optional<TenseSpec>
AliasResolver::resolve_tense(const std::string &input) const {
  auto it = tense_alias_.find(fold_token(input));
  if (it == tense_alias_.end())
    return std::nullopt;
  return tables_.tenses[it->second];
}

RowShape AliasResolver::classify_row_shape(const std::string &mood,
                                           const std::string &tense) const {
  const std::string m = fold_token(mood);
  const std::string t = fold_token(tense);
  for (const auto &rule : tables_.shapes) {
    if (fold_token(rule.mood) != m)
      continue;
    if (!rule.tense.empty() && fold_token(rule.tense) != t)
      continue;
    return rule.shape;
  }
  return RowShape::Full;
}

bool AliasResolver::is_impersonal(const TenseSpec &tense) const {
  return classify_row_shape(tense.mood, tense.tense) == RowShape::Impersonal;
}

std::optional<ShapedRow> AliasResolver::shape_row(const std::string &mood,
                                                  const TenseRow &row,
                                                  LookupStatus *status) const {
  const RowShape shape = classify_row_shape(mood, row.tense);
  const auto &f = row.forms;
  bool ok = false;
  switch (shape) {
  case RowShape::Full:
    ok = f.size() == kFullPersons.size();
    break;
  case RowShape::Imperative:
    ok = f.size() == kImperativePersons.size();
    break;
  case RowShape::Impersonal:
    ok = !f.empty();
    break;
  }
  if (!ok) {
    warn_malformed(mood, row, shape);
    if (status)
      *status = LookupStatus::MalformedRow;
    return std::nullopt;
  }
  if (status)
    *status = LookupStatus::Found;
  if (shape == RowShape::Full) {
    FullRow r;
    std::copy(f.begin(), f.end(), r.forms.begin());
    return r;
  }
  if (shape == RowShape::Imperative) {
    ImperativeRow r;
    std::copy(f.begin(), f.end(), r.forms.begin());
    return r;
  }
  return ImpersonalRow{f};
}

std::optional<std::string>
AliasResolver::form_in_row(const std::string &mood, const TenseRow &row,
                           std::optional<Person> person,
                           LookupStatus *status) const {
  LookupStatus st = LookupStatus::NotFound;
  auto shaped = shape_row(mood, row, &st);
  if (!shaped) {
    if (status)
      *status = st;
    return std::nullopt;
  }
  std::optional<std::string> form;
  if (auto *imp = std::get_if<ImpersonalRow>(&*shaped)) {
    form = imp->forms.front();
  } else if (person.has_value()) {
    if (auto *full = std::get_if<FullRow>(&*shaped)) {
      form = full->forms[full_slot(*person)];
    } else if (auto slot = imperative_slot(*person)) {
      form = std::get<ImperativeRow>(*shaped).forms[*slot];
    }
  }
  if (status)
    *status = form ? LookupStatus::Found : LookupStatus::NotFound;
  return form;
}

std::optional<std::string>
AliasResolver::extract(const ConjugationTable &table, const std::string &mood,
                       const std::string &tense, std::optional<Person> person,
                       LookupStatus *status) const {
  const TenseRow *row = table.find(mood, tense);
  if (!row) {
    if (status)
      *status = LookupStatus::NotFound;
    return std::nullopt;
  }
  return form_in_row(mood, *row, person, status);
}

std::optional<std::string>
AliasResolver::extract(const ConjugationTable &table, const TenseSpec &tense,
                       std::optional<Person> person,
                       LookupStatus *status) const {
  return extract(table, tense.mood, tense.tense, person, status);
}

PersonFormView
AliasResolver::extract_all_for_person(const ConjugationTable &table,
                                      Person person) const {
  return PersonFormView(*this, table, person);
}

std::vector<RowForms> AliasResolver::extract_all(const ConjugationTable &table,
                                                 std::size_t *malformed) const {
  std::vector<RowForms> out;
  std::size_t bad = 0;
  for (const auto &m : table.moods) {
    for (const auto &row : m.tenses) {
      auto shaped = shape_row(m.mood, row);
      if (!shaped) {
        ++bad;
        continue;
      }
      RowForms rf;
      rf.mood = m.mood;
      rf.tense = row.tense;
      if (auto *full = std::get_if<FullRow>(&*shaped)) {
        rf.shape = RowShape::Full;
        for (std::size_t i = 0; i < full->forms.size(); ++i)
          rf.forms.push_back({kFullPersons[i], full->forms[i]});
      } else if (auto *imp = std::get_if<ImperativeRow>(&*shaped)) {
        rf.shape = RowShape::Imperative;
        for (std::size_t i = 0; i < imp->forms.size(); ++i)
          rf.forms.push_back({kImperativePersons[i], imp->forms[i]});
      } else {
        rf.shape = RowShape::Impersonal;
        for (const auto &f : std::get<ImpersonalRow>(*shaped).forms)
          rf.forms.push_back({std::nullopt, f});
      }
      out.push_back(std::move(rf));
    }
  }
  if (malformed)
    *malformed = bad;
  return out;
}

PersonFormView::iterator::iterator(const PersonFormView *view,
                                   std::size_t mood, std::size_t tense)
    : view_(view), mood_(mood), tense_(tense) {
  settle();
}

PersonFormView::iterator &PersonFormView::iterator::operator++() {
  ++tense_;
  settle();
  return *this;
}

PersonFormView::iterator PersonFormView::iterator::operator++(int) {
  iterator prev = *this;
  ++*this;
  return prev;
}

// Moves forward to the first row at or after the cursor that yields a form.
void PersonFormView::iterator::settle() {
  const auto &moods = view_->table_->moods;
  const AliasResolver &resolver = *view_->resolver_;
  while (mood_ < moods.size()) {
    const auto &m = moods[mood_];
    if (tense_ >= m.tenses.size()) {
      ++mood_;
      tense_ = 0;
      continue;
    }
    const auto &row = m.tenses[tense_];
    if (resolver.classify_row_shape(m.mood, row.tense) !=
        RowShape::Impersonal) {
      LookupStatus st = LookupStatus::NotFound;
      if (auto form =
              resolver.form_in_row(m.mood, row, view_->person_, &st)) {
        current_ = {m.mood, row.tense, std::move(*form)};
        return;
      }
      if (st == LookupStatus::MalformedRow)
        ++malformed_;
    }
    ++tense_;
  }
  tense_ = 0;
}

PersonFormView::iterator PersonFormView::begin() const {
  return iterator(this, 0, 0);
}

PersonFormView::iterator PersonFormView::end() const {
  return iterator(this, table_->moods.size(), 0);
}

std::vector<PersonForm>
PersonFormView::collect(std::size_t *malformed) const {
  std::vector<PersonForm> out;
  auto it = begin();
  for (const auto last = end(); it != last; ++it)
    out.push_back(*it);
  if (malformed)
    *malformed = it.malformed();
  return out;
}

} // namespace conj_cache
