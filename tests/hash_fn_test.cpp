#include "hash_fn.hpp"
#include <cassert>
#include <random>
#include <string>
#include <vector>

static uint64_t full(const HashFn& h, const std::vector<uint8_t>& v, size_t off, size_t n) {
    return h(v.data() + off, n, std::nullopt, std::nullopt);
}

int main() {
    // h([0]) with base 2 is 0
    {
        HashFn h = make_polynomial_hash_fn(2);
        const uint8_t zero = 0;
        assert(h(&zero, 1, std::nullopt, std::nullopt) == 0);
        assert(h(nullptr, 0, std::nullopt, std::nullopt) == 0);
    }

    // Positional polynomial: "abr" base 11 = 97*121 + 98*11 + 114
    {
        HashFn h = make_polynomial_hash_fn(11);
        const std::string s = "abr";
        const auto* p = reinterpret_cast<const uint8_t*>(s.data());
        assert(h(p, 3, std::nullopt, std::nullopt) == 97u * 121u + 98u * 11u + 114u);
    }

    assert(pow_u64(23, 0) == 1);
    assert(pow_u64(23, 4) == 279841u);
    assert(pow_u64(2, 64) == 0);

    // Rolling update matches a from-scratch hash on every window, including
    // windows long enough to wrap 64 bits.
    {
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> byte(0, 255);
        std::vector<uint8_t> data(400);
        for (auto& b : data) b = static_cast<uint8_t>(byte(rng));

        for (uint64_t prime : {11ull, 17ull, 23ull, 1000003ull}) {
            HashFn h = make_polynomial_hash_fn(prime);
            for (size_t window : {1u, 5u, 32u, 150u}) {
                uint64_t rolling = full(h, data, 0, window);
                for (size_t i = 1; i + window <= data.size(); i++) {
                    rolling = h(data.data() + i, window, rolling, data[i - 1]);
                    assert(rolling == full(h, data, i, window));
                }
            }
        }
    }

    // Only one rolling parameter means a full recompute
    {
        HashFn h = make_polynomial_hash_fn(17);
        const std::vector<uint8_t> v{1, 2, 3, 4};
        assert(h(v.data(), v.size(), 999u, std::nullopt) == full(h, v, 0, v.size()));
        assert(h(v.data(), v.size(), std::nullopt, uint8_t{9}) == full(h, v, 0, v.size()));
    }

    // Default family
    {
        std::vector<HashFn> fns = default_hash_fns();
        assert(fns.size() == kDefaultPrimes.size());
        const uint8_t x = 7;
        const uint8_t xy[2] = {1, 2};
        for (size_t i = 0; i < fns.size(); i++) {
            assert(fns[i](&x, 1, std::nullopt, std::nullopt) == 7);
            assert(fns[i](xy, 2, std::nullopt, std::nullopt) == kDefaultPrimes[i] + 2);
        }
    }

    return 0;
}
