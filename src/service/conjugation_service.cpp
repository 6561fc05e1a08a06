#include "conj_cache/conjugation_service.hpp"

#include "conj_cache/log.hpp"
#include "conj_cache/table_codec.hpp"

#include <exception>

namespace conj_cache {
namespace {

QueryResult failed(QueryStatus status, std::string detail) {
  QueryResult r;
  r.status = status;
  r.detail = std::move(detail);
  return r;
}

} // namespace

const char *query_kind_name(QueryKind k) {
  switch (k) {
  case QueryKind::All:
    return "all";
  case QueryKind::Person:
    return "person";
  case QueryKind::Specific:
    return "specific";
  case QueryKind::Impersonal:
    return "impersonal";
  }
  return "?";
}

const char *query_status_name(QueryStatus s) {
  switch (s) {
  case QueryStatus::Ok:
    return "ok";
  case QueryStatus::UnknownPerson:
    return "unknown_person";
  case QueryStatus::UnknownTense:
    return "unknown_tense";
  case QueryStatus::PersonRequired:
    return "person_required";
  case QueryStatus::ProviderFailure:
    return "provider_failure";
  case QueryStatus::NotFound:
    return "not_found";
  }
  return "?";
}

std::vector<std::string> ConjugationService::cache_args(
    QueryKind kind, const std::string &verb, const std::string &person,
    const std::string &tense) {
  switch (kind) {
  case QueryKind::All:
    return {verb, "all"};
  case QueryKind::Person:
    return {verb, "person", person};
  case QueryKind::Specific:
    return {verb, "specific", person, tense};
  case QueryKind::Impersonal:
    return {verb, "impersonal", tense};
  }
  return {verb};
}

QueryResult ConjugationService::run(const QueryRequest &req) {
  switch (req.kind) {
  case QueryKind::All:
    return all(req.verb);
  case QueryKind::Person:
    return for_person(req.verb, req.person);
  case QueryKind::Specific:
    return specific(req.verb, req.person, req.tense);
  case QueryKind::Impersonal:
    return impersonal(req.verb, req.tense);
  }
  return failed(QueryStatus::NotFound, "unsupported query kind");
}

QueryResult ConjugationService::all(const std::string &verb) {
  QueryResult result;
  auto table = fetch(cache_args(QueryKind::All, verb, "", ""), verb, result);
  if (!table)
    return result;
  result.rows = resolver_.extract_all(*table, &result.malformed_rows);
  if (result.rows.empty()) {
    result.status = QueryStatus::NotFound;
    result.detail = "no conjugations found for '" + verb + "'";
    return result;
  }
  result.status = QueryStatus::Ok;
  return result;
}

QueryResult ConjugationService::for_person(const std::string &verb,
                                           const std::string &person) {
  auto p = resolver_.resolve_person(person);
  if (!p)
    return failed(QueryStatus::UnknownPerson,
                  "unknown person '" + person + "'");

  QueryResult result;
  result.person = p;
  auto table = fetch(cache_args(QueryKind::Person, verb, person_name(*p), ""),
                     verb, result);
  if (!table)
    return result;
  result.person_forms = resolver_.extract_all_for_person(*table, *p).collect(
      &result.malformed_rows);
  if (result.person_forms.empty()) {
    result.status = QueryStatus::NotFound;
    result.detail = "no conjugations found for person '" +
                    std::string(person_name(*p)) + "'";
    return result;
  }
  result.status = QueryStatus::Ok;
  return result;
}

QueryResult ConjugationService::specific(const std::string &verb,
                                         const std::string &person,
                                         const std::string &tense) {
  auto t = resolver_.resolve_tense(tense);
  if (!t)
    return failed(QueryStatus::UnknownTense, "unknown tense '" + tense + "'");
  if (resolver_.is_impersonal(*t))
    return impersonal_form(verb, *t);

  auto p = resolver_.resolve_person(person);
  if (!p)
    return failed(QueryStatus::UnknownPerson,
                  "unknown person '" + person + "'");

  QueryResult result;
  result.person = p;
  result.tense = t;
  auto table = fetch(
      cache_args(QueryKind::Specific, verb, person_name(*p), t->name), verb,
      result);
  if (!table)
    return result;
  LookupStatus st = LookupStatus::NotFound;
  auto form = resolver_.extract(*table, *t, *p, &st);
  if (!form) {
    result.status = QueryStatus::NotFound;
    result.malformed_rows = st == LookupStatus::MalformedRow ? 1 : 0;
    result.detail = "no conjugation found for '" +
                    std::string(person_name(*p)) + "' in '" + t->name + "'";
    return result;
  }
  result.form = std::move(*form);
  result.status = QueryStatus::Ok;
  return result;
}

QueryResult ConjugationService::impersonal(const std::string &verb,
                                           const std::string &tense) {
  auto t = resolver_.resolve_tense(tense);
  if (!t)
    return failed(QueryStatus::UnknownTense, "unknown tense '" + tense + "'");
  if (!resolver_.is_impersonal(*t))
    return failed(QueryStatus::PersonRequired,
                  "tense '" + t->name + "' requires a person");
  return impersonal_form(verb, *t);
}

QueryResult ConjugationService::impersonal_form(const std::string &verb,
                                                const TenseSpec &tense) {
  QueryResult result;
  result.tense = tense;
  auto table = fetch(cache_args(QueryKind::Impersonal, verb, "", tense.name),
                     verb, result);
  if (!table)
    return result;
  LookupStatus st = LookupStatus::NotFound;
  auto form = resolver_.extract(*table, tense, std::nullopt, &st);
  if (!form) {
    result.status = QueryStatus::NotFound;
    result.malformed_rows = st == LookupStatus::MalformedRow ? 1 : 0;
    result.detail = "no conjugation found for '" + tense.name + "'";
    return result;
  }
  result.form = std::move(*form);
  result.status = QueryStatus::Ok;
  return result;
}

std::optional<ConjugationTable>
ConjugationService::fetch(const std::vector<std::string> &args,
                          const std::string &verb, QueryResult &result) {
  if (auto bytes = cache_.get(args)) {
    std::string err;
    if (auto table = decode_table(*bytes, &err)) {
      result.from_cache = true;
      result.verb = table->verb;
      return table;
    }
    CONJ_LOG_WARN("ignoring undecodable cache entry for '" + verb +
                  "': " + err);
  }

  std::string err;
  std::optional<ConjugationTable> table;
  try {
    table = provider_.conjugate(verb, &err);
  } catch (const std::exception &e) {
    err = e.what();
  }
  if (!table) {
    result.status = QueryStatus::ProviderFailure;
    result.detail = "error conjugating '" + verb + "'" +
                    (err.empty() ? std::string() : ": " + err);
    CONJ_LOG_INFO(provider_.name() + ": " + result.detail);
    return std::nullopt;
  }
  if (!table->empty()) {
    std::string why;
    if (!cache_.set(encode_table(*table), args, &why))
      CONJ_LOG_DEBUG("'" + verb + "' served without a durable cache entry");
  }
  result.verb = table->verb;
  return table;
}

} // namespace conj_cache
