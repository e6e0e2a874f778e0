#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bit_vector.hpp"
#include "hash_fn.hpp"

// Thrown when constructor arguments cannot describe a filter.
class InvalidConstructorArguments : public std::invalid_argument {
public:
    explicit InvalidConstructorArguments(const std::string& what)
        : std::invalid_argument(what) {}
};

// One byte per character.
std::vector<uint8_t> to_char_code_array(const std::string& str);
// Keeps the low byte of each UTF-16 code unit.
std::vector<uint8_t> to_char_code_array(const std::u16string& str);

// Probabilistic set of byte strings. exists() never reports a false negative;
// there is deliberately no remove().
//
// Not thread-safe for writers: concurrent add() calls, or add() racing a query,
// must be serialized by the caller.
class BloomFilter {
public:
    static constexpr uint32_t kDefaultBitsPerElement = 10;   // ~1% false positives
    static constexpr uint32_t kDefaultEstimatedElements = 50000;

    // Sized filter of bits_per_element * estimated_elements bits.
    // hash_fns defaults to default_hash_fns() when not given.
    explicit BloomFilter(uint32_t bits_per_element = kDefaultBitsPerElement,
                         uint32_t estimated_elements = kDefaultEstimatedElements,
                         std::optional<std::vector<HashFn>> hash_fns = std::nullopt);

    // Restores from a buffer produced by to_bytes(). The buffer is copied and
    // bit_count() becomes buffer.size() * 8. hash_fns must match the filter
    // that produced the buffer (count, order and behavior) or answers are
    // meaningless; nothing here can check that.
    explicit BloomFilter(const std::vector<uint8_t>& buffer,
                         std::optional<std::vector<HashFn>> hash_fns = std::nullopt);

    static BloomFilter from(const std::vector<uint8_t>& buffer,
                            std::optional<std::vector<HashFn>> hash_fns = std::nullopt);

    // std::string is hashed as raw bytes; std::u16string keeps the low byte
    // of each code unit, as to_char_code_array() does.
    void add(const std::string& data);
    void add(const std::u16string& data);
    void add(const std::vector<uint8_t>& data);
    void add(const uint8_t* data, size_t n);

    bool exists(const std::string& data) const;
    bool exists(const std::u16string& data) const;
    bool exists(const std::vector<uint8_t>& data) const;
    bool exists(const uint8_t* data, size_t n) const;

    // True if any window of exactly substring_length bytes tests positive.
    // False when substring_length is longer than the data. A length of 0
    // tests the empty window at every offset, like exists("").
    bool substring_exists(const std::string& data, size_t substring_length) const;
    bool substring_exists(const std::u16string& data, size_t substring_length) const;
    bool substring_exists(const std::vector<uint8_t>& data, size_t substring_length) const;
    bool substring_exists(const uint8_t* data, size_t n, size_t substring_length) const;

    // One bit position per hash function, already reduced modulo bit_count().
    std::vector<uint64_t> get_locations_for_char_codes(const uint8_t* data, size_t n) const;

    // Unreduced hashes. last_hashes/last_char enable the rolling update;
    // last_hashes must then hold one entry per hash function, otherwise
    // std::invalid_argument is thrown.
    std::vector<uint64_t> get_hashes_for_char_codes(
        const uint8_t* data, size_t n,
        const std::vector<uint64_t>* last_hashes = nullptr,
        std::optional<uint8_t> last_char = std::nullopt) const;

    // Serialized form: an identity copy of the bit buffer, no framing.
    std::vector<uint8_t> to_bytes() const { return bits_.bytes(); }

    // Raw buffer file, written and read verbatim.
    void save(const std::string& path) const;
    static std::optional<BloomFilter> load(const std::string& path,
                                           std::optional<std::vector<HashFn>> hash_fns = std::nullopt);

    void print(std::ostream& out) const;

    uint64_t bit_count() const { return bits_.bit_count(); }
    size_t hash_count() const { return hash_fns_.size(); }
    const std::vector<uint8_t>& bytes() const { return bits_.bytes(); }
    double load_factor() const;

private:
    BitVector bits_;
    std::vector<HashFn> hash_fns_;

    static std::vector<HashFn> resolve_hash_fns(std::optional<std::vector<HashFn>> hash_fns);
    bool all_set(const std::vector<uint64_t>& hashes) const;
};
