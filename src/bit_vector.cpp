#include "bit_vector.hpp"

void set_bit(std::vector<uint8_t>& buffer, uint64_t pos) {
    buffer[pos / 8] |= static_cast<uint8_t>(1u << (pos % 8));
}

bool is_bit_set(const std::vector<uint8_t>& buffer, uint64_t pos) {
    return (buffer[pos / 8] & static_cast<uint8_t>(1u << (pos % 8))) != 0;
}

BitVector::BitVector(uint64_t bit_count)
    : bit_count_(bit_count), bytes_(static_cast<size_t>((bit_count + 7) / 8), 0) {}

BitVector::BitVector(const std::vector<uint8_t>& bytes)
    : bit_count_(static_cast<uint64_t>(bytes.size()) * 8), bytes_(bytes) {}

uint64_t BitVector::count_set_bits() const {
    uint64_t total = 0;
    for (uint8_t b : bytes_) {
        // clear lowest set bit until empty
        while (b) {
            b = static_cast<uint8_t>(b & (b - 1));
            ++total;
        }
    }
    return total;
}
