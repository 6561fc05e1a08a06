#pragma once

#include "conj_cache/conjugation.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conj_cache {

std::vector<std::uint8_t> encode_table(const ConjugationTable &table);
std::optional<ConjugationTable>
decode_table(const std::vector<std::uint8_t> &bytes,
             std::string *err = nullptr);

} // namespace conj_cache
