//! # Profile Binary Writer
//!
//! Writes a fingerprint in the order `binary_reader.cpp` reads it:
//!
//! ```text
//! 1. write_header()        - Magic, version, content hash
//! 2. write_description()   - Library identity and metadata
//! 3. child order byte
//! 4. write_package_tree()  - Nodes in arena order with their classes
//! 5. write_hash_trees()    - Root node index and path per hash tree
//! ```

#include "tplid/serialize/profile_serialize.hpp"

namespace tplid::serialize {

ProfileBinaryWriter::ProfileBinaryWriter(std::ostream& out) : out_(out) {}

void ProfileBinaryWriter::write_profile(const model::LibraryFingerprint& fingerprint) {
    content_hash_ = compute_profile_hash(fingerprint);
    write_header(content_hash_);

    write_description(fingerprint.description());
    write_u8(static_cast<uint8_t>(fingerprint.child_order()));
    write_package_tree(fingerprint.package_tree());
    write_hash_trees(fingerprint);
}

// ============================================================================
// Header Writing
// ============================================================================

void ProfileBinaryWriter::write_header(ContentHash hash) {
    write_u32(PROFILE_MAGIC);
    write_u16(PROFILE_VERSION_MAJOR);
    write_u16(PROFILE_VERSION_MINOR);
    write_u64(hash);
}

// ============================================================================
// Primitive Type Writing
// ============================================================================
// Native byte order, little-endian on every supported platform.

void ProfileBinaryWriter::write_u8(uint8_t value) {
    out_.write(reinterpret_cast<const char*>(&value), 1);
}

void ProfileBinaryWriter::write_u16(uint16_t value) {
    out_.write(reinterpret_cast<const char*>(&value), 2);
}

void ProfileBinaryWriter::write_u32(uint32_t value) {
    out_.write(reinterpret_cast<const char*>(&value), 4);
}

void ProfileBinaryWriter::write_u64(uint64_t value) {
    out_.write(reinterpret_cast<const char*>(&value), 8);
}

void ProfileBinaryWriter::write_string(const std::string& str) {
    write_u32(static_cast<uint32_t>(str.size()));
    out_.write(str.data(), static_cast<std::streamsize>(str.size()));
}

// ============================================================================
// Profile Sections
// ============================================================================

void ProfileBinaryWriter::write_description(const model::LibraryDescription& desc) {
    write_string(desc.name);
    write_string(desc.version);
    write_u8(static_cast<uint8_t>(desc.category));
    write_string(desc.release_date);
    write_string(desc.comment);
}

void ProfileBinaryWriter::write_class(const model::ClassDescriptor& cls) {
    write_string(cls.simple_name);
    write_u8(static_cast<uint8_t>(cls.kind));
    write_u32(static_cast<uint32_t>(cls.member_signatures.size()));
    for (const auto& sig : cls.member_signatures) {
        write_string(sig);
    }
}

void ProfileBinaryWriter::write_package_tree(const model::PackageTree& tree) {
    write_u32(static_cast<uint32_t>(tree.node_count()));
    for (const auto& node : tree.nodes()) {
        write_string(node.segment);

        write_u32(static_cast<uint32_t>(node.children.size()));
        for (const auto& [_, child] : node.children) {
            write_u32(child);
        }

        write_u32(static_cast<uint32_t>(node.classes.size()));
        for (const auto& cls : node.classes) {
            write_class(cls);
        }
    }
}

void ProfileBinaryWriter::write_hash_trees(const model::LibraryFingerprint& fingerprint) {
    const auto& roots = fingerprint.package_tree().root_nodes();
    write_u32(static_cast<uint32_t>(fingerprint.hash_trees().size()));
    for (size_t i = 0; i < fingerprint.hash_trees().size(); ++i) {
        const auto& tree = fingerprint.hash_trees()[i];
        write_u32(i < roots.size() ? roots[i] : model::INVALID_NODE);
        write_string(join_path(tree.root_path()));
    }
}

} // namespace tplid::serialize
