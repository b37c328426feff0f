//! # Structural Hashing Implementation

#include "tplid/common/hash.hpp"

#include <algorithm>

namespace tplid {

namespace {

constexpr char HEX[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

// ============================================================================
// Hash128
// ============================================================================

std::string Hash128::to_hex() const {
    char buf[33];
    uint64_t vals[2] = {high, low};
    for (int v = 0; v < 2; ++v) {
        uint64_t val = vals[v];
        for (int i = 15; i >= 0; --i) {
            buf[v * 16 + i] = HEX[val & 0xF];
            val >>= 4;
        }
    }
    buf[32] = '\0';
    return std::string(buf);
}

Hash128 Hash128::from_hex(std::string_view hex) {
    if (hex.size() != 32) {
        return {};
    }
    uint64_t vals[2] = {0, 0};
    for (size_t i = 0; i < 32; ++i) {
        int d = hex_value(hex[i]);
        if (d < 0) {
            return {};
        }
        vals[i / 16] = (vals[i / 16] << 4) | static_cast<uint64_t>(d);
    }
    return {vals[0], vals[1]};
}

// ============================================================================
// Hasher
// ============================================================================

void Hasher::update(const void* data, size_t size) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < size; ++i) {
        fnv_ = (fnv_ ^ bytes[i]) * FNV_PRIME;
        crc_ = detail::CRC32C_TABLE[(crc_ ^ bytes[i]) & 0xFF] ^ (crc_ >> 8);
    }
    length_ += size;
}

Hash128 Hasher::finish() const {
    uint32_t crc = crc_ ^ 0xFFFFFFFF;
    uint64_t lo = (static_cast<uint64_t>(crc) << 32) | (length_ & 0xFFFFFFFFULL);
    return {fnv_, lo};
}

// ============================================================================
// Helpers
// ============================================================================

Hash128 hash_string(std::string_view str, HashDomain domain) {
    Hasher h;
    h.update(static_cast<uint8_t>(domain));
    h.update(str);
    return h.finish();
}

Hash128 hash_unordered(std::vector<Hash128> values, HashDomain domain) {
    std::sort(values.begin(), values.end());
    return hash_ordered(values, domain);
}

Hash128 hash_ordered(const std::vector<Hash128>& values, HashDomain domain) {
    Hasher h;
    h.update(static_cast<uint8_t>(domain));
    h.update(static_cast<uint64_t>(values.size()));
    for (const auto& v : values) {
        h.update(v);
    }
    return h.finish();
}

} // namespace tplid
