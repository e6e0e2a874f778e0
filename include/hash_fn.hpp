#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

// Maps a byte window to a hash. When both last_hash and last_char are set,
// last_hash is the hash of the previous window (same length, shifted left by
// one byte) and last_char is the byte that slid out of its front. The result
// must equal a from-scratch hash over the same window.
using HashFn = std::function<uint64_t(const uint8_t* data, size_t n,
                                      std::optional<uint64_t> last_hash,
                                      std::optional<uint8_t> last_char)>;

inline constexpr std::array<uint64_t, 3> kDefaultPrimes{11, 17, 23};

// Rabin fingerprint with base `prime`:
//   hash = sum b[i] * prime^(n-1-i)
// Arithmetic wraps modulo 2^64 on both the full and the rolling path.
HashFn make_polynomial_hash_fn(uint64_t prime);

// One polynomial hash per entry of kDefaultPrimes, in order.
std::vector<HashFn> default_hash_fns();

// base^exp mod 2^64
uint64_t pow_u64(uint64_t base, uint64_t exp);
