//! # Profile Serialization Utilities
//!
//! Content hashing, in-memory conversions and file I/O for profiles.
//!
//! | Function                       | Description            |
//! |--------------------------------|------------------------|
//! | `compute_profile_hash()`       | Fingerprint → u64      |
//! | `serialize_profile_binary()`   | Fingerprint → bytes    |
//! | `deserialize_profile_binary()` | bytes → Fingerprint    |
//! | `serialize_profile_text()`     | Fingerprint → string   |
//! | `write_profile_file()`         | Fingerprint → file     |
//! | `read_profile_file()`          | file → Fingerprint     |

#include "tplid/common/hash.hpp"
#include "tplid/log/log.hpp"
#include "tplid/serialize/profile_serialize.hpp"

#include <fstream>
#include <sstream>

namespace tplid::serialize {

// ============================================================================
// Content Hashing
// ============================================================================

namespace {

void hash_class(Hasher& h, const model::ClassDescriptor& cls) {
    h.update(std::string_view(cls.simple_name));
    h.update(static_cast<uint8_t>(cls.kind));
    h.update(static_cast<uint32_t>(cls.member_signatures.size()));
    for (const auto& sig : cls.member_signatures) {
        h.update(std::string_view(sig));
    }
}

} // namespace

auto compute_profile_hash(const model::LibraryFingerprint& fingerprint) -> ContentHash {
    Hasher h;

    const auto& desc = fingerprint.description();
    h.update(std::string_view(desc.name));
    h.update(std::string_view(desc.version));
    h.update(static_cast<uint8_t>(desc.category));
    h.update(std::string_view(desc.release_date));
    h.update(std::string_view(desc.comment));
    h.update(static_cast<uint8_t>(fingerprint.child_order()));

    const auto& tree = fingerprint.package_tree();
    h.update(static_cast<uint32_t>(tree.node_count()));
    for (const auto& node : tree.nodes()) {
        h.update(std::string_view(node.segment));
        h.update(static_cast<uint32_t>(node.children.size()));
        for (const auto& [_, child] : node.children) {
            h.update(child);
        }
        h.update(static_cast<uint32_t>(node.classes.size()));
        for (const auto& cls : node.classes) {
            hash_class(h, cls);
        }
    }

    h.update(static_cast<uint32_t>(fingerprint.hash_trees().size()));
    for (const auto& hash_tree : fingerprint.hash_trees()) {
        h.update(std::string_view(join_path(hash_tree.root_path())));
        h.update(hash_tree.root_hash());
    }

    return h.finish64();
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto serialize_profile_binary(const model::LibraryFingerprint& fingerprint)
    -> std::vector<uint8_t> {
    std::ostringstream oss(std::ios::binary);
    ProfileBinaryWriter writer(oss);
    writer.write_profile(fingerprint);

    std::string str = oss.str();
    return std::vector<uint8_t>(str.begin(), str.end());
}

auto deserialize_profile_binary(const std::vector<uint8_t>& data)
    -> Result<model::LibraryFingerprint, std::string> {
    std::string str(data.begin(), data.end());
    std::istringstream iss(str, std::ios::binary);
    ProfileBinaryReader reader(iss);
    auto fingerprint = reader.read_profile();
    if (!fingerprint) {
        return reader.error_message();
    }
    return std::move(*fingerprint);
}

auto serialize_profile_text(const model::LibraryFingerprint& fingerprint, bool include_signatures)
    -> std::string {
    std::ostringstream oss;
    ProfileTextWriter writer(oss, include_signatures);
    writer.write_profile(fingerprint);
    return oss.str();
}

auto write_profile_file(const model::LibraryFingerprint& fingerprint,
                        const std::filesystem::path& path) -> bool {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            TPLID_LOG_ERROR("serialize", "Cannot create directory " << path.parent_path().string()
                                                                    << ": " << ec.message());
            return false;
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        TPLID_LOG_ERROR("serialize", "Cannot open " << path.string() << " for writing");
        return false;
    }

    ProfileBinaryWriter writer(file);
    writer.write_profile(fingerprint);
    file.flush();

    if (!file.good()) {
        TPLID_LOG_ERROR("serialize", "Write failed for " << path.string());
        return false;
    }
    TPLID_LOG_DEBUG("serialize", "Wrote " << path.string() << " (hash " << std::hex
                                          << writer.content_hash() << std::dec << ")");
    return true;
}

auto read_profile_file(const std::filesystem::path& path)
    -> Result<model::LibraryFingerprint, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::string("cannot open " + path.string());
    }

    ProfileBinaryReader reader(file);
    auto fingerprint = reader.read_profile();
    if (!fingerprint) {
        return path.string() + ": " + reader.error_message();
    }
    TPLID_LOG_TRACE("serialize", "Read " << path.string() << " ("
                                         << fingerprint->description().to_string() << ")");
    return std::move(*fingerprint);
}

namespace {

// Keeps the profile file name a single component under its category directory
void sanitize_file_name(std::string& name) {
    for (auto& c : name) {
        if (c == ' ' || c == '/' || c == '\\' || static_cast<unsigned char>(c) < 0x20) {
            c = '-';
        }
    }
    for (size_t i = 0; i < name.size() && name[i] == '.'; ++i) {
        name[i] = '-';
    }
}

} // namespace

auto profile_relative_path(const model::LibraryDescription& desc) -> std::filesystem::path {
    std::string file_name = desc.name + "_" + desc.version;
    sanitize_file_name(file_name);
    file_name += PROFILE_EXTENSION;
    return std::filesystem::path(model::category_name(desc.category)) / file_name;
}

} // namespace tplid::serialize
