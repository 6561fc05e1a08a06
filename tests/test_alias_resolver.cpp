#include "conj_cache/alias_resolver.hpp"

#include <catch2/catch_test_macros.hpp>

#include <utility>

using namespace conj_cache;

namespace {
template <typename T>
concept PersonViewable = requires(const AliasResolver &r, T &&t) {
  r.extract_all_for_person(std::forward<T>(t), Person::Je);
};

ConjugationTable sample_table() {
  ConjugationTable t;
  t.verb = {"parler", "to speak"};
  t.add("indicatif", "présent", {"a0", "b0", "c0", "d0", "e0", "f0"});
  t.add("indicatif", "futur-simple", {"a1", "b1", "c1", "d1", "e1", "f1"});
  t.add("imperatif", "imperatif-présent", {"g0", "g1", "g2"});
  t.add("participe", "participe-présent", {"h0"});
  t.add("participe", "participe-passé", {"p0", "p1", "p2", "p3"});
  return t;
}
} // namespace

TEST_CASE("every declared alias resolves to its canonical key",
          "[resolver][alias]") {
  AliasResolver r;
  CHECK(r.alias_collisions().empty());
  for (const auto &p : r.persons())
    for (const auto &a : p.aliases)
      CHECK(r.resolve_person(a) == p.person);
  for (const auto &t : r.tenses())
    for (const auto &a : t.aliases) {
      auto got = r.resolve_tense(a);
      REQUIRE(got.has_value());
      CHECK(got->name == t.name);
    }
}

TEST_CASE("tokens are trimmed and case folded", "[resolver][alias]") {
  AliasResolver r;
  CHECK(r.resolve_person("  J ") == Person::Je);
  CHECK(r.resolve_person("J\xe2\x80\x99") == Person::Je);
  CHECK(r.resolve_person("Elles") == Person::Ils);
  CHECK(r.resolve_tense("FUT")->name == "futur simple");
  CHECK(r.resolve_tense("PASSÉ COMPOSÉ")->name == "passé composé");
  CHECK(r.resolve_tense("\tImpératif Présent\n")->name == "impératif présent");
  CHECK(fold_token(" ŒUVRE ") == "œuvre");
}

TEST_CASE("unknown tokens are not resolved", "[resolver][alias]") {
  AliasResolver r;
  CHECK_FALSE(r.resolve_person("moi").has_value());
  CHECK_FALSE(r.resolve_person("").has_value());
  CHECK_FALSE(r.resolve_tense("aoriste").has_value());
  CHECK_FALSE(r.resolve_tense("futur  simple").has_value());
}

TEST_CASE("row shapes come from the mood", "[resolver][shape]") {
  AliasResolver r;
  CHECK(r.classify_row_shape("indicatif", "présent") == RowShape::Full);
  CHECK(r.classify_row_shape("imperatif", "imperatif-passé") ==
        RowShape::Imperative);
  CHECK(r.classify_row_shape("Participe", "participe-passé") ==
        RowShape::Impersonal);
  CHECK(r.is_impersonal(*r.resolve_tense("gerund")));
  CHECK_FALSE(r.is_impersonal(*r.resolve_tense("subj")));
}

TEST_CASE("extract picks the slot for a person", "[resolver][extract]") {
  AliasResolver r;
  const auto t = sample_table();
  CHECK(r.extract(t, "indicatif", "présent", Person::Tu) == "b0");
  CHECK(r.extract(t, *r.resolve_tense("fut"), Person::Ils) == "f1");
  CHECK(r.extract(t, *r.resolve_tense("imperatif"), Person::Nous) == "g1");
  CHECK(r.extract(t, *r.resolve_tense("ger"), std::nullopt) == "h0");
  CHECK(r.extract(t, *r.resolve_tense("part"), Person::Vous) == "h0");

  LookupStatus st = LookupStatus::Found;
  CHECK_FALSE(
      r.extract(t, *r.resolve_tense("imperatif"), Person::Je, &st)
          .has_value());
  CHECK(st == LookupStatus::NotFound);
  CHECK_FALSE(
      r.extract(t, *r.resolve_tense("subj"), Person::Je, &st).has_value());
  CHECK(st == LookupStatus::NotFound);
  CHECK_FALSE(
      r.extract(t, "indicatif", "présent", std::nullopt, &st).has_value());
  CHECK(st == LookupStatus::NotFound);
}

TEST_CASE("malformed rows are reported and skipped", "[resolver][extract]") {
  AliasResolver r;
  auto t = sample_table();
  t.add("indicatif", "imparfait", {"x0", "x1", "x2"});
  t.add("imperatif", "imperatif-passé", {"y0", "y1", "y2", "y3"});
  t.add("infinitif", "infinitif-présent", {});

  LookupStatus st = LookupStatus::Found;
  CHECK_FALSE(
      r.extract(t, "indicatif", "imparfait", Person::Je, &st).has_value());
  CHECK(st == LookupStatus::MalformedRow);

  std::size_t malformed = 0;
  auto rows = r.extract_all(t, &malformed);
  CHECK(malformed == 3);
  CHECK(rows.size() == 5);

  std::size_t skipped = 0;
  auto forms = r.extract_all_for_person(t, Person::Tu).collect(&skipped);
  CHECK(skipped == 2);
  REQUIRE(forms.size() == 3);
  CHECK(forms[0].form == "b0");
  CHECK(forms[1].form == "b1");
  CHECK(forms[2].form == "g0");
}

TEST_CASE("per-person view is lazy, ordered and restartable",
          "[resolver][view]") {
  AliasResolver r;
  const auto t = sample_table();
  auto view = r.extract_all_for_person(t, Person::Je);
  auto it = view.begin();
  REQUIRE(it != view.end());
  CHECK(it->mood == "indicatif");
  CHECK(it->tense == "présent");
  CHECK(it->form == "a0");
  ++it;
  CHECK(it->form == "a1");
  ++it;
  CHECK(it == view.end());

  std::size_t n = 0;
  for (const auto &f : view) {
    CHECK_FALSE(f.form.empty());
    ++n;
  }
  CHECK(n == 2);

  auto nous = r.extract_all_for_person(t, Person::Nous).collect();
  REQUIRE(nous.size() == 3);
  CHECK(nous[2].mood == "imperatif");
  CHECK(nous[2].form == "g1");
}

TEST_CASE("extract_all pairs forms with persons", "[resolver][extract]") {
  AliasResolver r;
  auto rows = r.extract_all(sample_table());
  REQUIRE(rows.size() == 5);
  CHECK(rows[0].shape == RowShape::Full);
  REQUIRE(rows[0].forms.size() == 6);
  CHECK(rows[0].forms[3].person == Person::Nous);
  CHECK(rows[0].forms[3].form == "d0");
  CHECK(rows[2].shape == RowShape::Imperative);
  CHECK(rows[2].forms[0].person == Person::Tu);
  CHECK(rows[2].forms[2].person == Person::Vous);
  CHECK(rows[4].shape == RowShape::Impersonal);
  CHECK(rows[4].forms.size() == 4);
  CHECK_FALSE(rows[4].forms[0].person.has_value());
}

TEST_CASE("alias collisions keep the first declaration",
          "[resolver][alias]") {
  ResolverTables tables;
  tables.persons = {{Person::Je, {"je", "x"}}, {Person::Tu, {"tu", "X"}}};
  tables.tenses = {{"présent", "indicatif", "présent", {"présent", "p"}},
                   {"passé", "indicatif", "passé", {"passé", "P"}}};
  AliasResolver r(tables);
  CHECK(r.alias_collisions().size() == 2);
  CHECK(r.resolve_person("x") == Person::Je);
  CHECK(r.resolve_tense("p")->name == "présent");
  CHECK(r.classify_row_shape("imperatif", "x") == RowShape::Full);
}

TEST_CASE("per-person view reports malformed rows once per walk",
          "[resolver][view]") {
  AliasResolver r;
  auto t = sample_table();
  t.add("indicatif", "imparfait", {"x0", "x1"});
  auto view = r.extract_all_for_person(t, Person::Je);

  auto it = view.begin();
  CHECK(it.malformed() == 0);
  ++it;
  CHECK(it->form == "a1");
  ++it;
  CHECK(it == view.end());
  CHECK(it.malformed() == 1);

  std::size_t skipped = 0;
  CHECK(view.collect(&skipped).size() == 2);
  CHECK(skipped == 1);
  CHECK(view.collect(&skipped).size() == 2);
  CHECK(skipped == 1);
}

TEST_CASE("per-person view only binds to tables that outlive it",
          "[resolver][view]") {
  STATIC_REQUIRE(PersonViewable<ConjugationTable &>);
  STATIC_REQUIRE(PersonViewable<const ConjugationTable &>);
  STATIC_REQUIRE_FALSE(PersonViewable<ConjugationTable>);
}
