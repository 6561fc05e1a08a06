#pragma once

#include "conj_cache/alias_resolver.hpp"
#include "conj_cache/provider.hpp"
#include "conj_cache/result_cache.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conj_cache {

enum class QueryKind : std::uint8_t { All, Person, Specific, Impersonal };

enum class QueryStatus : std::uint8_t {
  Ok,
  UnknownPerson,
  UnknownTense,
  PersonRequired,
  ProviderFailure,
  NotFound,
};

const char *query_kind_name(QueryKind k);
const char *query_status_name(QueryStatus s);

struct QueryRequest {
  QueryKind kind{QueryKind::All};
  std::string verb;
  std::string person; // raw token, Person and Specific
  std::string tense;  // raw token, Specific and Impersonal
};

struct QueryResult {
  QueryStatus status{QueryStatus::NotFound};
  std::string detail;
  bool from_cache{false};
  VerbInfo verb;
  std::optional<Person> person;
  std::optional<TenseSpec> tense;
  std::string form;                      // Specific, Impersonal
  std::vector<PersonForm> person_forms;  // Person
  std::vector<RowForms> rows;            // All
  std::size_t malformed_rows{0};

  bool ok() const { return status == QueryStatus::Ok; }
};

// Resolves raw tokens, consults the cache, falls back to the provider and
// navigates the resulting table.
class ConjugationService {
public:
  ConjugationService(const AliasResolver &resolver, ResultCache &cache,
                     IConjugationProvider &provider)
      : resolver_(resolver), cache_(cache), provider_(provider) {}

  QueryResult run(const QueryRequest &req);

  QueryResult all(const std::string &verb);
  QueryResult for_person(const std::string &verb, const std::string &person);
  QueryResult specific(const std::string &verb, const std::string &person,
                       const std::string &tense);
  QueryResult impersonal(const std::string &verb, const std::string &tense);

  // Cache key of a query whose tokens are already canonical.
  static std::vector<std::string> cache_args(QueryKind kind,
                                             const std::string &verb,
                                             const std::string &person,
                                             const std::string &tense);

private:
  QueryResult impersonal_form(const std::string &verb, const TenseSpec &tense);
  std::optional<ConjugationTable> fetch(const std::vector<std::string> &args,
                                        const std::string &verb,
                                        QueryResult &result);

  const AliasResolver &resolver_;
  ResultCache &cache_;
  IConjugationProvider &provider_;
};

} // namespace conj_cache
