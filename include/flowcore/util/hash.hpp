#pragma once

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace flowcore::util {

// MurmurHash3 64-bit finalizer
[[nodiscard]] inline constexpr auto murmur3_mix64(std::uint64_t h) noexcept
    -> std::uint64_t {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

// Stable owner shard for a string key; the extra mix spreads ids that share
// a timestamp prefix.
[[nodiscard]] inline auto shard_of(std::string_view key,
                                   unsigned shard_count) noexcept -> unsigned {
  if (shard_count == 0) {
    return 0;
  }
  const auto h = murmur3_mix64(std::hash<std::string_view>{}(key));
  return static_cast<unsigned>(h % shard_count);
}

} // namespace flowcore::util

namespace flowcore {

// Transparent hasher for string-keyed unordered_dense maps.
struct StringHash {
  using is_transparent = void;
  using is_avalanching = void;
  auto operator()(std::string_view s) const noexcept -> std::uint64_t {
    return ankerl::unordered_dense::hash<std::string_view>{}(s);
  }
};

} // namespace flowcore
