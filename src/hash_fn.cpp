#include "hash_fn.hpp"

uint64_t pow_u64(uint64_t base, uint64_t exp) {
    uint64_t result = 1;
    while (exp) {
        if (exp & 1) result *= base;
        base *= base;
        exp >>= 1;
    }
    return result;
}

HashFn make_polynomial_hash_fn(uint64_t prime) {
    return [prime](const uint8_t* data, size_t n,
                   std::optional<uint64_t> last_hash,
                   std::optional<uint8_t> last_char) -> uint64_t {
        if (n == 0) return 0;

        if (last_hash && last_char) {
            // drop the leading term, shift up one power, append the new byte
            const uint64_t lead = static_cast<uint64_t>(*last_char) * pow_u64(prime, n - 1);
            return (*last_hash - lead) * prime + data[n - 1];
        }

        uint64_t h = 0;
        for (size_t i = 0; i < n; ++i) {
            h = h * prime + data[i];
        }
        return h;
    };
}

std::vector<HashFn> default_hash_fns() {
    std::vector<HashFn> fns;
    fns.reserve(kDefaultPrimes.size());
    for (uint64_t p : kDefaultPrimes) {
        fns.push_back(make_polynomial_hash_fn(p));
    }
    return fns;
}
