#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace conj_cache {

constexpr std::size_t kDigestHexLen = 64;

// SHA-256 over the ordered argument tuple. Each argument is length-prefixed,
// so ("ab", "c") and ("a", "bc") never share an encoding. nullopt when
// libcrypto cannot produce a digest.
std::optional<std::string> digest_key(const std::vector<std::string> &args);

std::string encode_args(const std::vector<std::string> &args);

} // namespace conj_cache
