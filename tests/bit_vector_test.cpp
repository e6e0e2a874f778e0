#include "bit_vector.hpp"
#include <cassert>
#include <vector>

int main() {
    // Zeroed buffer reads false everywhere
    {
        std::vector<uint8_t> a(10, 0);
        for (uint64_t i = 0; i < 80; i++) assert(!is_bit_set(a, i));
    }

    // First bit, last bit, then a bit in a later byte
    {
        std::vector<uint8_t> a(10, 0);
        set_bit(a, 0);
        assert(is_bit_set(a, 0));
        assert(a[0] == 0x01);

        assert(!is_bit_set(a, 7));
        set_bit(a, 7);
        assert(is_bit_set(a, 7));
        for (uint64_t i = 1; i < 7; i++) assert(!is_bit_set(a, i));
        assert(a[0] == 0x81);

        assert(!is_bit_set(a, 9));
        set_bit(a, 9);
        assert(is_bit_set(a, 9));
        assert(!is_bit_set(a, 8));
        assert(!is_bit_set(a, 10));
        assert(!is_bit_set(a, 1));
        assert(a[1] == 0x02);

        // setting twice is a no-op
        set_bit(a, 9);
        assert(a[1] == 0x02);
    }

    // Each position in isolation touches only itself
    for (uint64_t pos = 0; pos < 24; pos++) {
        std::vector<uint8_t> a(3, 0);
        set_bit(a, pos);
        for (uint64_t j = 0; j < 24; j++) assert(is_bit_set(a, j) == (j == pos));
    }

    // Owned vector
    {
        BitVector bv(13);
        assert(bv.bit_count() == 13);
        assert(bv.bytes().size() == 2);
        assert(bv.count_set_bits() == 0);
        bv.set_bit(12);
        bv.set_bit(3);
        bv.set_bit(3);
        assert(bv.is_bit_set(12));
        assert(bv.is_bit_set(3));
        assert(!bv.is_bit_set(11));
        assert(bv.count_set_bits() == 2);

        BitVector restored(bv.bytes());
        assert(restored.bit_count() == 16);
        assert(restored.is_bit_set(12));
        assert(restored.count_set_bits() == 2);
    }

    return 0;
}
