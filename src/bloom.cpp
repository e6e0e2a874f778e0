#include "bloom.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>
#include <stdexcept>
#include <utility>

std::vector<uint8_t> to_char_code_array(const std::string& str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

std::vector<uint8_t> to_char_code_array(const std::u16string& str) {
    std::vector<uint8_t> out;
    out.reserve(str.size());
    for (char16_t c : str) {
        out.push_back(static_cast<uint8_t>(c & 0xFF));
    }
    return out;
}

std::vector<HashFn> BloomFilter::resolve_hash_fns(std::optional<std::vector<HashFn>> hash_fns) {
    if (!hash_fns) return default_hash_fns();
    if (hash_fns->empty()) {
        throw InvalidConstructorArguments("hash function list must not be empty");
    }
    return std::move(*hash_fns);
}

BloomFilter::BloomFilter(uint32_t bits_per_element, uint32_t estimated_elements,
                         std::optional<std::vector<HashFn>> hash_fns)
    : hash_fns_(resolve_hash_fns(std::move(hash_fns))) {
    const uint64_t bit_count = static_cast<uint64_t>(bits_per_element) * estimated_elements;
    if (bit_count == 0) {
        throw InvalidConstructorArguments(
            "bits_per_element and estimated_elements must both be non-zero");
    }
    bits_ = BitVector(bit_count);
}

BloomFilter::BloomFilter(const std::vector<uint8_t>& buffer,
                         std::optional<std::vector<HashFn>> hash_fns)
    : hash_fns_(resolve_hash_fns(std::move(hash_fns))) {
    if (buffer.empty()) {
        throw InvalidConstructorArguments("cannot restore a filter from an empty buffer");
    }
    bits_ = BitVector(buffer);
}

BloomFilter BloomFilter::from(const std::vector<uint8_t>& buffer,
                              std::optional<std::vector<HashFn>> hash_fns) {
    return BloomFilter(buffer, std::move(hash_fns));
}

std::vector<uint64_t> BloomFilter::get_hashes_for_char_codes(
    const uint8_t* data, size_t n,
    const std::vector<uint64_t>* last_hashes,
    std::optional<uint8_t> last_char) const {
    if (last_hashes && last_hashes->size() != hash_fns_.size()) {
        throw std::invalid_argument("last_hashes must hold one hash per hash function");
    }

    std::vector<uint64_t> hashes;
    hashes.reserve(hash_fns_.size());
    for (size_t i = 0; i < hash_fns_.size(); ++i) {
        std::optional<uint64_t> last;
        if (last_hashes) last = (*last_hashes)[i];
        hashes.push_back(hash_fns_[i](data, n, last, last_char));
    }
    return hashes;
}

std::vector<uint64_t> BloomFilter::get_locations_for_char_codes(const uint8_t* data, size_t n) const {
    std::vector<uint64_t> locations = get_hashes_for_char_codes(data, n);
    for (uint64_t& loc : locations) {
        loc %= bits_.bit_count();
    }
    return locations;
}

bool BloomFilter::all_set(const std::vector<uint64_t>& hashes) const {
    for (uint64_t h : hashes) {
        if (!bits_.is_bit_set(h % bits_.bit_count())) return false;
    }
    return true;
}

void BloomFilter::add(const uint8_t* data, size_t n) {
    for (uint64_t loc : get_locations_for_char_codes(data, n)) {
        bits_.set_bit(loc);
    }
}

void BloomFilter::add(const std::vector<uint8_t>& data) {
    add(data.data(), data.size());
}

void BloomFilter::add(const std::string& data) {
    add(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void BloomFilter::add(const std::u16string& data) {
    add(to_char_code_array(data));
}

bool BloomFilter::exists(const uint8_t* data, size_t n) const {
    return all_set(get_hashes_for_char_codes(data, n));
}

bool BloomFilter::exists(const std::vector<uint8_t>& data) const {
    return exists(data.data(), data.size());
}

bool BloomFilter::exists(const std::string& data) const {
    return exists(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

bool BloomFilter::exists(const std::u16string& data) const {
    return exists(to_char_code_array(data));
}

bool BloomFilter::substring_exists(const uint8_t* data, size_t n, size_t substring_length) const {
    if (substring_length > n) return false;

    // Hashes stay unreduced between windows so the rolling update is exact;
    // they are only reduced when the bits are tested.
    std::vector<uint64_t> hashes = get_hashes_for_char_codes(data, substring_length);
    if (all_set(hashes)) return true;

    for (size_t i = 1; i + substring_length <= n; ++i) {
        hashes = get_hashes_for_char_codes(data + i, substring_length, &hashes, data[i - 1]);
        if (all_set(hashes)) return true;
    }
    return false;
}

bool BloomFilter::substring_exists(const std::vector<uint8_t>& data, size_t substring_length) const {
    return substring_exists(data.data(), data.size(), substring_length);
}

bool BloomFilter::substring_exists(const std::string& data, size_t substring_length) const {
    return substring_exists(reinterpret_cast<const uint8_t*>(data.data()), data.size(),
                            substring_length);
}

bool BloomFilter::substring_exists(const std::u16string& data, size_t substring_length) const {
    return substring_exists(to_char_code_array(data), substring_length);
}

double BloomFilter::load_factor() const {
    return static_cast<double>(bits_.count_set_bits()) / static_cast<double>(bits_.bit_count());
}

void BloomFilter::print(std::ostream& out) const {
    const std::vector<uint8_t>& buf = bits_.bytes();
    for (size_t i = 0; i < buf.size(); ++i) {
        if (i) out << ' ';
        out << static_cast<unsigned>(buf[i]);
    }
    out << "\n";
}

void BloomFilter::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to open bloom file: " + path);

    const std::vector<uint8_t>& buf = bits_.bytes();
    out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    out.flush();
    if (!out) throw std::runtime_error("Failed to write bloom file: " + path);
}

std::optional<BloomFilter> BloomFilter::load(const std::string& path,
                                             std::optional<std::vector<HashFn>> hash_fns) {
    std::error_code ec;
    const auto sz = std::filesystem::file_size(path, ec);
    if (ec || sz == 0) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;

    // a short read would silently shrink bit_count
    std::vector<uint8_t> buf(static_cast<size_t>(sz));
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (!in) return std::nullopt;

    return BloomFilter(buf, std::move(hash_fns));
}
