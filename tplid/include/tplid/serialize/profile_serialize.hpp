//! # Profile Serialization
//!
//! Reading and writing library fingerprints as `.lib` profile files, a text
//! dump for inspection, and loading a directory of profiles into a corpus.
//!
//! ## Binary Format
//!
//! ```text
//! +----------------+------------------+
//! | Header (16B)   | Profile Data     |
//! +----------------+------------------+
//!
//! Header:
//!   [0..4)   magic: u32 = 0x42494C54 ("TLIB")
//!   [4..6)   version_major: u16
//!   [6..8)   version_minor: u16
//!   [8..16)  content_hash: u64
//!
//! Profile Data:
//!   - description: name, version, category u8, release_date, comment
//!   - child_order: u8
//!   - package nodes: count + [segment, children[u32], classes[...]]
//!   - hash tree roots: count + [node index u32, root path string]
//! ```
//!
//! Strings are `u32 length` + bytes. Each class is stored as simple name,
//! kind byte and its member signatures; content hashes are not stored.
//!
//! ## Verification
//!
//! The reader rebuilds the package tree and the hash trees from the stored
//! classes, then checks them against the stored roots and the header content
//! hash. Any mismatch makes the profile unreadable, so a profile that loads
//! always reproduces the subtree hashes it was written with.
//!
//! ## Profile Location
//!
//! ```text
//! <profiles-dir>/<Category>/<name-with-dashes>_<version>.lib
//! ```
//!
//! ## Thread Safety
//!
//! - Writers and readers are single-stream, not thread-safe
//! - Hash functions are pure and thread-safe

#pragma once

#include "tplid/common.hpp"
#include "tplid/match/corpus.hpp"
#include "tplid/model/fingerprint.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace tplid::serialize {

// ============================================================================
// Binary Format Constants
// ============================================================================

/// Magic number for profile files; reads "TLIB" in little-endian byte order.
constexpr uint32_t PROFILE_MAGIC = 0x42494C54;

/// Files with a different major version are rejected.
constexpr uint16_t PROFILE_VERSION_MAJOR = 1;

constexpr uint16_t PROFILE_VERSION_MINOR = 0;

/// File extension of profile files.
constexpr const char* PROFILE_EXTENSION = ".lib";

/// Upper bound on any stored string, to reject corrupt length fields early.
constexpr uint32_t MAX_STRING_LENGTH = 1u << 20;

using ContentHash = uint64_t;

/// FNV-1a hash over every field of the profile payload.
auto compute_profile_hash(const model::LibraryFingerprint& fingerprint) -> ContentHash;

// ============================================================================
// Binary Writer
// ============================================================================

/// Writes fingerprints in the binary profile format.
///
/// Write errors are propagated through the stream; check `out.good()`.
class ProfileBinaryWriter {
public:
    explicit ProfileBinaryWriter(std::ostream& out);

    void write_profile(const model::LibraryFingerprint& fingerprint);

    [[nodiscard]] auto content_hash() const -> ContentHash {
        return content_hash_;
    }

private:
    std::ostream& out_;
    ContentHash content_hash_ = 0;

    void write_header(ContentHash hash);

    void write_u8(uint8_t value);
    void write_u16(uint16_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_string(const std::string& str);

    void write_description(const model::LibraryDescription& desc);
    void write_class(const model::ClassDescriptor& cls);
    void write_package_tree(const model::PackageTree& tree);
    void write_hash_trees(const model::LibraryFingerprint& fingerprint);
};

// ============================================================================
// Binary Reader
// ============================================================================

/// Reads fingerprints from the binary profile format.
///
/// Soft error model: the first error is recorded and reading stops;
/// `read_profile()` then returns `std::nullopt`.
///
/// ```cpp
/// ProfileBinaryReader reader(file);
/// auto fp = reader.read_profile();
/// if (!fp) {
///     std::cerr << reader.error_message() << "\n";
/// }
/// ```
class ProfileBinaryReader {
public:
    explicit ProfileBinaryReader(std::istream& in);

    auto read_profile() -> std::optional<model::LibraryFingerprint>;

    [[nodiscard]] auto has_error() const -> bool {
        return has_error_;
    }

    [[nodiscard]] auto error_message() const -> std::string {
        return error_;
    }

    /// Content hash from the file header.
    [[nodiscard]] auto content_hash() const -> ContentHash {
        return content_hash_;
    }

private:
    struct StoredClass {
        std::string simple_name;
        model::ClassKind kind = model::ClassKind::TopLevel;
        std::set<std::string> signatures;
    };

    struct StoredNode {
        std::string segment;
        std::vector<uint32_t> children;
        std::vector<StoredClass> classes;
    };

    struct StoredRoot {
        uint32_t node = 0;
        std::string path;
    };

    std::istream& in_;
    bool has_error_ = false;
    std::string error_;
    ContentHash content_hash_ = 0;

    void set_error(const std::string& msg);
    auto verify_header() -> bool;

    auto read_u8() -> uint8_t;
    auto read_u16() -> uint16_t;
    auto read_u32() -> uint32_t;
    auto read_u64() -> uint64_t;
    auto read_string() -> std::string;

    auto read_description() -> model::LibraryDescription;
    auto read_class() -> StoredClass;
    auto read_node() -> StoredNode;

    auto rebuild_classes(const std::vector<StoredNode>& nodes)
        -> std::optional<std::vector<model::ClassDescriptor>>;
};

// ============================================================================
// Text Writer (Inspection)
// ============================================================================

/// Writes a human-readable dump of a fingerprint. Not readable back.
///
/// ```text
/// ; tplid profile: OkHttp 3.12.0
/// ; category: Utilities
/// ; root: okhttp3
///
/// okhttp3 (12/140)
///   class Call interface 4f1c... 3 members
/// ```
class ProfileTextWriter {
public:
    explicit ProfileTextWriter(std::ostream& out, bool include_signatures = false);

    void write_profile(const model::LibraryFingerprint& fingerprint);

private:
    std::ostream& out_;
    bool include_signatures_;

    void write_layout(const model::RootLayout& layout);
    void write_package_node(const model::PackageTree& tree, model::NodeId id);
};

// ============================================================================
// Convenience Functions
// ============================================================================

auto serialize_profile_binary(const model::LibraryFingerprint& fingerprint)
    -> std::vector<uint8_t>;

auto deserialize_profile_binary(const std::vector<uint8_t>& data)
    -> Result<model::LibraryFingerprint, std::string>;

auto serialize_profile_text(const model::LibraryFingerprint& fingerprint,
                            bool include_signatures = false) -> std::string;

/// Writes a profile, creating parent directories as needed.
auto write_profile_file(const model::LibraryFingerprint& fingerprint,
                        const std::filesystem::path& path) -> bool;

auto read_profile_file(const std::filesystem::path& path)
    -> Result<model::LibraryFingerprint, std::string>;

/// `<Category>/<name-with-dashes>_<version>.lib`. Spaces, path separators,
/// control characters and leading dots in the name become `-`.
auto profile_relative_path(const model::LibraryDescription& desc) -> std::filesystem::path;

// ============================================================================
// Profile Store
// ============================================================================

/// Outcome of loading a profile directory.
struct CorpusLoad {
    match::CorpusSnapshot corpus;
    size_t loaded = 0;
    size_t skipped = 0;
};

/// Loads every `.lib` file below `dir` (recursively, in path order).
///
/// Unreadable profiles are logged and left out of the corpus.
auto load_corpus(const std::filesystem::path& dir) -> CorpusLoad;

} // namespace tplid::serialize
