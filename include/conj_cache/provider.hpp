#pragma once

#include "conj_cache/conjugation.hpp"

#include <optional>
#include <string>

namespace conj_cache {

// Source of conjugation tables (a conjugator library, a scraper, ...).
class IConjugationProvider {
public:
  virtual ~IConjugationProvider() = default;
  virtual std::string name() const = 0;
  // Unknown verbs and transport errors both come back as nullopt with *err
  // describing the failure.
  virtual std::optional<ConjugationTable>
  conjugate(const std::string &verb, std::string *err = nullptr) = 0;
};

} // namespace conj_cache
