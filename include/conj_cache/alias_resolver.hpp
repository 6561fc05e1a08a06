#pragma once

#include "conj_cache/conjugation.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace conj_cache {

enum class Person : std::uint8_t { Je, Tu, Il, Nous, Vous, Ils };

// Slot order of a full six-form row.
constexpr std::array<Person, 6> kFullPersons{Person::Je,   Person::Tu,
                                             Person::Il,   Person::Nous,
                                             Person::Vous, Person::Ils};
// Slot order of an imperative row.
constexpr std::array<Person, 3> kImperativePersons{Person::Tu, Person::Nous,
                                                   Person::Vous};

const char *person_name(Person p);
std::optional<std::size_t> imperative_slot(Person p);

enum class RowShape : std::uint8_t { Full, Imperative, Impersonal };

const char *row_shape_name(RowShape s);

enum class LookupStatus : std::uint8_t { Found, NotFound, MalformedRow };

struct PersonSpec {
  Person person;
  std::vector<std::string> aliases;
};

struct TenseSpec {
  std::string name;  // canonical key, e.g. "futur simple"
  std::string mood;  // provider mood identifier, e.g. "indicatif"
  std::string tense; // provider tense identifier, e.g. "futur-simple"
  std::vector<std::string> aliases;
};

// An empty tense matches every tense of the mood.
struct ShapeRule {
  std::string mood;
  std::string tense;
  RowShape shape;
};

struct ResolverTables {
  std::vector<PersonSpec> persons;
  std::vector<TenseSpec> tenses;
  std::vector<ShapeRule> shapes;
};

ResolverTables french_tables();

struct FullRow {
  std::array<std::string, 6> forms;
};
struct ImperativeRow {
  std::array<std::string, 3> forms;
};
struct ImpersonalRow {
  std::vector<std::string> forms;
};
using ShapedRow = std::variant<FullRow, ImperativeRow, ImpersonalRow>;

struct PersonForm {
  std::string mood;
  std::string tense;
  std::string form;
};

struct TaggedForm {
  std::optional<Person> person;
  std::string form;
};

struct RowForms {
  std::string mood;
  std::string tense;
  RowShape shape;
  std::vector<TaggedForm> forms;
};

class AliasResolver;

// Lazy walk over every row admitting one person, in table order. Borrows
// both the resolver and the table; each begin() restarts the walk.
class PersonFormView {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = PersonForm;
    using difference_type = std::ptrdiff_t;
    using pointer = const PersonForm *;
    using reference = const PersonForm &;

    iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator &operator++();
    iterator operator++(int);
    bool operator==(const iterator &other) const {
      return mood_ == other.mood_ && tense_ == other.tense_;
    }
    // Malformed rows skipped so far by this walk.
    std::size_t malformed() const { return malformed_; }

  private:
    friend class PersonFormView;
    iterator(const PersonFormView *view, std::size_t mood, std::size_t tense);
    void settle();

    const PersonFormView *view_{nullptr};
    std::size_t mood_{0};
    std::size_t tense_{0};
    std::size_t malformed_{0};
    PersonForm current_;
  };

  PersonFormView(const AliasResolver &resolver, const ConjugationTable &table,
                 Person person)
      : resolver_(&resolver), table_(&table), person_(person) {}
  PersonFormView(const AliasResolver &, ConjugationTable &&, Person) = delete;

  iterator begin() const;
  iterator end() const;
  // One full walk. Skipped malformed rows are counted into *malformed.
  std::vector<PersonForm> collect(std::size_t *malformed = nullptr) const;
  Person person() const { return person_; }

private:
  const AliasResolver *resolver_;
  const ConjugationTable *table_;
  Person person_;
};

class AliasResolver {
public:
  AliasResolver();
  explicit AliasResolver(ResolverTables tables);

  // Exact alias match after trimming and case folding. When an alias is
  // declared twice, the first declaration wins.
  std::optional<Person> resolve_person(const std::string &input) const;
  std::optional<TenseSpec> resolve_tense(const std::string &input) const;

  RowShape classify_row_shape(const std::string &mood,
                              const std::string &tense) const;
  bool is_impersonal(const TenseSpec &tense) const;

  std::optional<ShapedRow> shape_row(const std::string &mood,
                                     const TenseRow &row,
                                     LookupStatus *status = nullptr) const;
  // The form of one row for a person. Impersonal rows ignore the person.
  std::optional<std::string> form_in_row(const std::string &mood,
                                         const TenseRow &row,
                                         std::optional<Person> person,
                                         LookupStatus *status = nullptr) const;

  std::optional<std::string> extract(const ConjugationTable &table,
                                     const std::string &mood,
                                     const std::string &tense,
                                     std::optional<Person> person,
                                     LookupStatus *status = nullptr) const;
  std::optional<std::string> extract(const ConjugationTable &table,
                                     const TenseSpec &tense,
                                     std::optional<Person> person,
                                     LookupStatus *status = nullptr) const;

  PersonFormView extract_all_for_person(const ConjugationTable &table,
                                        Person person) const;
  PersonFormView extract_all_for_person(ConjugationTable &&table,
                                        Person person) const = delete;
  std::vector<RowForms> extract_all(const ConjugationTable &table,
                                    std::size_t *malformed = nullptr) const;

  const std::vector<PersonSpec> &persons() const { return tables_.persons; }
  const std::vector<TenseSpec> &tenses() const { return tables_.tenses; }
  // Aliases claimed by more than one canonical key, as readable messages.
  const std::vector<std::string> &alias_collisions() const {
    return collisions_;
  }

private:
  ResolverTables tables_;
  std::unordered_map<std::string, std::size_t> person_alias_;
  std::unordered_map<std::string, std::size_t> tense_alias_;
  std::vector<std::string> collisions_;
};

// Trim surrounding whitespace and lower-case ASCII and Latin-1 letters.
std::string fold_token(const std::string &input);

} // namespace conj_cache
