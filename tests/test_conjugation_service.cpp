#include "conj_cache/conjugation_service.hpp"
#include "conj_cache/table_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <stdexcept>

using namespace conj_cache;

namespace {
class FakeProvider final : public IConjugationProvider {
public:
  std::string name() const override { return "fake"; }
  std::optional<ConjugationTable> conjugate(const std::string &verb,
                                            std::string *err) override {
    ++calls;
    if (throw_next)
      throw std::runtime_error("connection reset");
    if (verb != "parler") {
      if (err)
        *err = "unknown verb";
      return std::nullopt;
    }
    ConjugationTable t;
    t.verb = {"parler", "to speak"};
    t.add("indicatif", "présent",
          {"parle", "parles", "parle", "parlons", "parlez", "parlent"});
    t.add("indicatif", "futur-simple",
          {"parlerai", "parleras", "parlera", "parlerons", "parlerez",
           "parleront"});
    t.add("imperatif", "imperatif-présent", {"parle", "parlons", "parlez"});
    t.add("participe", "participe-présent", {"parlant"});
    t.add("participe", "participe-passé", {"parlé"});
    if (short_imparfait)
      t.add("indicatif", "imparfait", {"parlais", "parlais"});
    return t;
  }
  int calls{0};
  bool throw_next{false};
  bool short_imparfait{false};
};

CacheConfig fresh_config(const std::string &name) {
  auto dir = std::filesystem::temp_directory_path() / ("conj_svc_" + name);
  std::filesystem::remove_all(dir);
  CacheConfig cfg;
  cfg.dir = dir.string();
  return cfg;
}
} // namespace

TEST_CASE("specific query resolves aliases and caches the table",
          "[service]") {
  AliasResolver resolver;
  ResultCache cache("verbecc", fresh_config("specific"));
  FakeProvider provider;
  ConjugationService svc(resolver, cache, provider);

  auto r = svc.specific("parler", "Nous", "fut");
  REQUIRE(r.ok());
  CHECK(r.form == "parlerons");
  CHECK_FALSE(r.from_cache);
  CHECK(r.verb.translation_en == "to speak");
  CHECK(r.tense->name == "futur simple");
  CHECK(provider.calls == 1);

  auto again = svc.specific("parler", "nous", "futur");
  REQUIRE(again.ok());
  CHECK(again.from_cache);
  CHECK(again.form == "parlerons");
  CHECK(provider.calls == 1);

  auto key = ConjugationService::cache_args(QueryKind::Specific, "parler",
                                            "nous", "futur simple");
  auto stored = cache.get(key);
  REQUIRE(stored.has_value());
  CHECK(decode_table(*stored).has_value());
}

TEST_CASE("person and all queries walk the table", "[service]") {
  AliasResolver resolver;
  ResultCache cache("verbecc", fresh_config("walk"));
  FakeProvider provider;
  ConjugationService svc(resolver, cache, provider);

  auto p = svc.run({QueryKind::Person, "parler", "tu", ""});
  REQUIRE(p.ok());
  REQUIRE(p.person_forms.size() == 3);
  CHECK(p.person_forms[0].form == "parles");
  CHECK(p.person_forms[2].mood == "imperatif");
  CHECK(p.person_forms[2].form == "parle");

  auto a = svc.all("parler");
  REQUIRE(a.ok());
  CHECK(a.rows.size() == 5);
  CHECK(a.malformed_rows == 0);
}

TEST_CASE("impersonal tenses ignore or forbid the person", "[service]") {
  AliasResolver resolver;
  ResultCache cache("verbecc", fresh_config("impersonal"));
  FakeProvider provider;
  ConjugationService svc(resolver, cache, provider);

  auto r = svc.impersonal("parler", "pp");
  REQUIRE(r.ok());
  CHECK(r.form == "parlé");

  auto s = svc.specific("parler", "whoever", "gérondif");
  REQUIRE(s.ok());
  CHECK(s.form == "parlant");
  CHECK_FALSE(s.person.has_value());

  auto bad = svc.impersonal("parler", "présent");
  CHECK(bad.status == QueryStatus::PersonRequired);
}

TEST_CASE("bad tokens fail before the provider is called",
          "[service][errors]") {
  AliasResolver resolver;
  ResultCache cache("verbecc", fresh_config("tokens"));
  FakeProvider provider;
  ConjugationService svc(resolver, cache, provider);

  CHECK(svc.for_person("parler", "moi").status == QueryStatus::UnknownPerson);
  CHECK(svc.specific("parler", "je", "aoriste").status ==
        QueryStatus::UnknownTense);
  CHECK(svc.specific("parler", "moi", "présent").status ==
        QueryStatus::UnknownPerson);
  CHECK(svc.impersonal("parler", "aoriste").status ==
        QueryStatus::UnknownTense);
  CHECK(provider.calls == 0);

  auto imp = svc.specific("parler", "je", "imperatif");
  CHECK(imp.status == QueryStatus::NotFound);
  CHECK(std::string(query_status_name(imp.status)) == "not_found");
}

TEST_CASE("provider failures are reported and not cached",
          "[service][errors]") {
  AliasResolver resolver;
  ResultCache cache("verbecc", fresh_config("failure"));
  FakeProvider provider;
  ConjugationService svc(resolver, cache, provider);

  auto r = svc.all("xyzzy");
  CHECK(r.status == QueryStatus::ProviderFailure);
  CHECK(r.detail.find("unknown verb") != std::string::npos);

  provider.throw_next = true;
  auto t = svc.all("parler");
  CHECK(t.status == QueryStatus::ProviderFailure);
  CHECK(t.detail.find("connection reset") != std::string::npos);
  CHECK(cache.size() == 0);

  provider.throw_next = false;
  CHECK(svc.all("parler").ok());
  CHECK(provider.calls == 3);
}

TEST_CASE("undecodable cache entries fall back to the provider",
          "[service][corruption]") {
  AliasResolver resolver;
  ResultCache cache("verbecc", fresh_config("undecodable"));
  FakeProvider provider;
  ConjugationService svc(resolver, cache, provider);

  REQUIRE(cache.set({'n', 'o', 'p', 'e'},
                    ConjugationService::cache_args(QueryKind::All, "parler",
                                                   "", "")));
  auto r = svc.all("parler");
  REQUIRE(r.ok());
  CHECK_FALSE(r.from_cache);
  CHECK(provider.calls == 1);

  CHECK(svc.all("parler").from_cache);
  CHECK(provider.calls == 1);
}

TEST_CASE("person and all queries report the same malformed rows",
          "[service][errors]") {
  AliasResolver resolver;
  ResultCache cache("verbecc", fresh_config("malformed"));
  FakeProvider provider;
  provider.short_imparfait = true;
  ConjugationService svc(resolver, cache, provider);

  auto a = svc.all("parler");
  REQUIRE(a.ok());
  CHECK(a.malformed_rows == 1);

  auto p = svc.for_person("parler", "je");
  REQUIRE(p.ok());
  CHECK(p.malformed_rows == 1);
  CHECK(p.person_forms.size() == 2);

  auto cached = svc.for_person("parler", "je");
  CHECK(cached.from_cache);
  CHECK(cached.malformed_rows == 1);
}
