#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Bit i lives in byte i/8 at offset i%8 (bit 0 is the LSB of byte 0).
// Positions are not range checked; callers reduce them into [0, bit_count).
void set_bit(std::vector<uint8_t>& buffer, uint64_t pos);
bool is_bit_set(const std::vector<uint8_t>& buffer, uint64_t pos);

class BitVector {
public:
    BitVector() = default;

    // Zero-filled, ceil(bit_count/8) bytes
    explicit BitVector(uint64_t bit_count);

    // Copies the buffer; bit_count becomes size*8
    explicit BitVector(const std::vector<uint8_t>& bytes);

    void set_bit(uint64_t pos) { ::set_bit(bytes_, pos); }
    bool is_bit_set(uint64_t pos) const { return ::is_bit_set(bytes_, pos); }

    uint64_t count_set_bits() const;

    uint64_t bit_count() const { return bit_count_; }
    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    uint64_t bit_count_{0};
    std::vector<uint8_t> bytes_;
};
