//! # Profile Binary Reader
//!
//! Reads the format produced by `ProfileBinaryWriter` and rebuilds the full
//! fingerprint from the stored classes.
//!
//! ## Reading Process
//!
//! ```text
//! 1. verify_header()     - Magic, major version, content hash
//! 2. read_description()  - Library identity and metadata
//! 3. child order byte
//! 4. read_node() x N     - Stored package nodes
//! 5. stored roots        - Node index and path per hash tree
//! 6. rebuild_classes()   - Package paths from the stored child links
//! 7. rebuild trees       - PackageTree::build, HashTreeBuilder::build_roots
//! 8. verify              - Roots and content hash must match the file
//! ```
//!
//! ## Error Handling
//!
//! Soft error model: `set_error()` records the first failure and every later
//! read becomes a no-op. Truncated input is detected through the stream
//! state after each primitive read.

#include "tplid/serialize/profile_serialize.hpp"

#include <algorithm>

namespace tplid::serialize {

ProfileBinaryReader::ProfileBinaryReader(std::istream& in) : in_(in) {}

auto ProfileBinaryReader::read_profile() -> std::optional<model::LibraryFingerprint> {
    if (!verify_header()) {
        return std::nullopt;
    }

    auto description = read_description();

    uint8_t order_byte = read_u8();
    if (!has_error_ && order_byte > static_cast<uint8_t>(model::ChildOrder::SegmentName)) {
        set_error("Unknown child order " + std::to_string(order_byte));
    }
    auto child_order = static_cast<model::ChildOrder>(order_byte);

    uint32_t node_count = read_u32();
    if (!has_error_ && node_count == 0) {
        set_error("Profile has no package nodes");
    }
    std::vector<StoredNode> nodes;
    nodes.reserve(std::min<uint32_t>(node_count, 4096));
    for (uint32_t i = 0; i < node_count && !has_error_; ++i) {
        nodes.push_back(read_node());
    }

    uint32_t root_count = read_u32();
    std::vector<StoredRoot> roots;
    for (uint32_t i = 0; i < root_count && !has_error_; ++i) {
        StoredRoot root;
        root.node = read_u32();
        root.path = read_string();
        roots.push_back(std::move(root));
    }

    if (has_error_) {
        return std::nullopt;
    }

    auto classes = rebuild_classes(nodes);
    if (!classes) {
        return std::nullopt;
    }

    std::string library = description.name;
    auto tree_result = model::PackageTree::build(std::move(*classes));
    if (is_err(tree_result)) {
        set_error("Invalid package tree: " + model::error_message(unwrap_err(tree_result)));
        return std::nullopt;
    }
    auto& package_tree = unwrap(tree_result);
    if (package_tree.node_count() != nodes.size()) {
        set_error("Package tree has dangling nodes");
        return std::nullopt;
    }

    model::HashTreeBuilder builder({.child_order = child_order, .parallel = false});
    auto trees_result = builder.build_roots(package_tree);
    if (is_err(trees_result)) {
        set_error("Invalid hash trees: " + model::error_message(unwrap_err(trees_result)));
        return std::nullopt;
    }
    auto& hash_trees = unwrap(trees_result);

    const auto& root_nodes = package_tree.root_nodes();
    if (roots.size() != hash_trees.size()) {
        set_error("Stored hash tree count does not match the package tree");
        return std::nullopt;
    }
    for (size_t i = 0; i < roots.size(); ++i) {
        if (roots[i].node != root_nodes[i] ||
            roots[i].path != join_path(hash_trees[i].root_path())) {
            set_error("Stored hash tree root " + roots[i].path + " does not match");
            return std::nullopt;
        }
    }

    model::LibraryFingerprint fingerprint(std::move(description), std::move(package_tree),
                                          std::move(hash_trees));
    if (compute_profile_hash(fingerprint) != content_hash_) {
        set_error("Content hash mismatch for " + library);
        return std::nullopt;
    }
    return fingerprint;
}

// ============================================================================
// Header Verification
// ============================================================================

auto ProfileBinaryReader::verify_header() -> bool {
    uint32_t magic = read_u32();
    if (has_error_ || magic != PROFILE_MAGIC) {
        set_error("Invalid profile magic number");
        return false;
    }

    uint16_t major = read_u16();
    uint16_t minor = read_u16();
    if (major != PROFILE_VERSION_MAJOR) {
        set_error("Incompatible profile version: " + std::to_string(major) + "." +
                  std::to_string(minor));
        return false;
    }

    content_hash_ = read_u64();
    return !has_error_;
}

void ProfileBinaryReader::set_error(const std::string& msg) {
    if (has_error_) {
        return;
    }
    has_error_ = true;
    error_ = msg;
}

// ============================================================================
// Primitive Type Reading
// ============================================================================

auto ProfileBinaryReader::read_u8() -> uint8_t {
    uint8_t value = 0;
    if (!has_error_ && !in_.read(reinterpret_cast<char*>(&value), 1)) {
        set_error("Unexpected end of profile");
    }
    return value;
}

auto ProfileBinaryReader::read_u16() -> uint16_t {
    uint16_t value = 0;
    if (!has_error_ && !in_.read(reinterpret_cast<char*>(&value), 2)) {
        set_error("Unexpected end of profile");
    }
    return value;
}

auto ProfileBinaryReader::read_u32() -> uint32_t {
    uint32_t value = 0;
    if (!has_error_ && !in_.read(reinterpret_cast<char*>(&value), 4)) {
        set_error("Unexpected end of profile");
    }
    return value;
}

auto ProfileBinaryReader::read_u64() -> uint64_t {
    uint64_t value = 0;
    if (!has_error_ && !in_.read(reinterpret_cast<char*>(&value), 8)) {
        set_error("Unexpected end of profile");
    }
    return value;
}

auto ProfileBinaryReader::read_string() -> std::string {
    uint32_t len = read_u32();
    if (has_error_) {
        return {};
    }
    if (len > MAX_STRING_LENGTH) {
        set_error("String length " + std::to_string(len) + " exceeds limit");
        return {};
    }
    std::string str(len, '\0');
    if (len > 0 && !in_.read(str.data(), len)) {
        set_error("Unexpected end of profile");
        return {};
    }
    return str;
}

// ============================================================================
// Profile Sections
// ============================================================================

auto ProfileBinaryReader::read_description() -> model::LibraryDescription {
    model::LibraryDescription desc;
    desc.name = read_string();
    desc.version = read_string();

    uint8_t category = read_u8();
    if (!has_error_ && category >= model::LIBRARY_CATEGORY_COUNT) {
        set_error("Unknown library category " + std::to_string(category));
    }
    desc.category = static_cast<model::LibraryCategory>(category);

    desc.release_date = read_string();
    desc.comment = read_string();
    return desc;
}

auto ProfileBinaryReader::read_class() -> StoredClass {
    StoredClass cls;
    cls.simple_name = read_string();

    auto kind = model::class_kind_from_u8(read_u8());
    if (!has_error_ && !kind) {
        set_error("Unknown class kind for " + cls.simple_name);
    }
    cls.kind = kind.value_or(model::ClassKind::TopLevel);

    uint32_t sig_count = read_u32();
    for (uint32_t i = 0; i < sig_count && !has_error_; ++i) {
        cls.signatures.insert(read_string());
    }
    return cls;
}

auto ProfileBinaryReader::read_node() -> StoredNode {
    StoredNode node;
    node.segment = read_string();

    uint32_t child_count = read_u32();
    for (uint32_t i = 0; i < child_count && !has_error_; ++i) {
        node.children.push_back(read_u32());
    }

    uint32_t class_count = read_u32();
    for (uint32_t i = 0; i < class_count && !has_error_; ++i) {
        node.classes.push_back(read_class());
    }
    return node;
}

// ============================================================================
// Reconstruction
// ============================================================================

/// Recovers every class's package path from the stored child links.
///
/// Children must come after their parent and every node must be reached
/// exactly once from node 0.
auto ProfileBinaryReader::rebuild_classes(const std::vector<StoredNode>& nodes)
    -> std::optional<std::vector<model::ClassDescriptor>> {
    if (!nodes.front().segment.empty()) {
        set_error("Root package node has a segment");
        return std::nullopt;
    }

    std::vector<std::optional<PackagePath>> paths(nodes.size());
    paths[0] = PackagePath{};

    std::vector<model::ClassDescriptor> classes;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (!paths[i]) {
            set_error("Package node " + std::to_string(i) + " is unreachable");
            return std::nullopt;
        }
        for (uint32_t child : nodes[i].children) {
            if (child <= i || child >= nodes.size() || paths[child]) {
                set_error("Invalid child link " + std::to_string(i) + " -> " +
                          std::to_string(child));
                return std::nullopt;
            }
            PackagePath child_path = *paths[i];
            child_path.push_back(nodes[child].segment);
            paths[child] = std::move(child_path);
        }
        for (const auto& cls : nodes[i].classes) {
            classes.push_back(
                model::ClassDescriptor::make(*paths[i], cls.simple_name, cls.signatures, cls.kind));
        }
    }
    return classes;
}

} // namespace tplid::serialize
