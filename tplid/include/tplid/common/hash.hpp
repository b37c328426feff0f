//! # Structural Hashing
//!
//! 128-bit hashes used for class content hashes, package node hashes and
//! subtree hashes, plus the incremental `Hasher` that produces them.
//!
//! The high half is FNV-1a (64-bit) over the fed bytes; the low half packs the
//! CRC32C (Castagnoli) of the same bytes with the number of fed bytes. Both
//! halves are pure functions of the byte stream, so hashes are stable across
//! runs, platforms of the same endianness, and thread schedules.
//!
//! ## Usage
//!
//! ```cpp
//! Hasher h;
//! h.update(std::string_view("M:(X)V"));
//! Hash128 sig = h.finish();
//!
//! // Order-independent digest of a set of hashes
//! Hash128 node = hash_unordered({a, b, c}, HashDomain::Node);
//! ```

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tplid {

// ============================================================================
// Hash128
// ============================================================================

/// A 128-bit structural hash.
struct Hash128 {
    uint64_t high = 0;
    uint64_t low = 0;

    bool operator==(const Hash128& other) const = default;
    auto operator<=>(const Hash128& other) const = default;

    /// Returns true if the hash was never computed.
    [[nodiscard]] bool is_zero() const {
        return high == 0 && low == 0;
    }

    /// Returns a 32-character lowercase hex representation.
    [[nodiscard]] std::string to_hex() const;

    /// Parses a 32-character hex string. Returns a zero hash on malformed input.
    [[nodiscard]] static Hash128 from_hex(std::string_view hex);
};

// ============================================================================
// CRC32C
// ============================================================================

namespace detail {

constexpr uint32_t CRC32C_POLY_REFLECTED = 0x82F63B78;

constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1) ? (CRC32C_POLY_REFLECTED ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

inline constexpr auto CRC32C_TABLE = make_crc32c_table();

} // namespace detail

/// Computes the CRC32C of a byte range.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = detail::CRC32C_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

// ============================================================================
// Hasher
// ============================================================================

/// Domain tags keep hashes of different node kinds apart, so that a package
/// holding one class never collides with that class's own content hash.
enum class HashDomain : uint8_t {
    Member = 1,
    Class = 2,
    Node = 3,
    Subtree = 4,
};

/// Incremental 128-bit hasher.
class Hasher {
public:
    Hasher() = default;

    void update(const void* data, size_t size);

    void update(uint8_t value) {
        update(&value, 1);
    }

    void update(uint32_t value) {
        update(&value, sizeof(value));
    }

    void update(uint64_t value) {
        update(&value, sizeof(value));
    }

    /// Feeds a length-prefixed string so that concatenations never collide.
    void update(std::string_view str) {
        update(static_cast<uint64_t>(str.size()));
        update(str.data(), str.size());
    }

    void update(const Hash128& value) {
        update(value.high);
        update(value.low);
    }

    [[nodiscard]] Hash128 finish() const;

    /// Returns only the FNV-1a half (used for file content hashes).
    [[nodiscard]] uint64_t finish64() const {
        return fnv_;
    }

private:
    static constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
    static constexpr uint64_t FNV_PRIME = 1099511628211ULL;

    uint64_t fnv_ = FNV_OFFSET;
    uint32_t crc_ = 0xFFFFFFFF;
    uint64_t length_ = 0;
};

/// Hashes a single string within a domain.
[[nodiscard]] Hash128 hash_string(std::string_view str, HashDomain domain);

/// Hashes a collection of hashes after sorting them, so the result does not
/// depend on the order of `values`.
[[nodiscard]] Hash128 hash_unordered(std::vector<Hash128> values, HashDomain domain);

/// Hashes a sequence of hashes in the given order.
[[nodiscard]] Hash128 hash_ordered(const std::vector<Hash128>& values, HashDomain domain);

} // namespace tplid

template <> struct std::hash<tplid::Hash128> {
    size_t operator()(const tplid::Hash128& h) const noexcept {
        return static_cast<size_t>(h.high ^ (h.low * 0x9E3779B97F4A7C15ULL));
    }
};
