//! # Hash Tree
//!
//! Mirrors a package tree with two hashes per node:
//!
//! | Hash           | Input                                                  |
//! |----------------|--------------------------------------------------------|
//! | `node_hash`    | Content hashes of the node's direct classes, sorted    |
//! | `subtree_hash` | `node_hash` then the children's `subtree_hash` values  |
//! |                | in canonical child order                               |
//!
//! Package and class names never enter either hash. With the default
//! `ChildOrder::SubtreeHash` the children are ordered by their own hash
//! values, so renaming any package leaves every hash unchanged.
//!
//! ## Example
//!
//! ```cpp
//! HashTreeBuilder builder({.child_order = ChildOrder::SubtreeHash});
//! auto result = builder.build(package_tree);
//! if (is_ok(result)) {
//!     Hash128 id = unwrap(result).root_hash();
//! }
//! ```

#pragma once

#include "tplid/common.hpp"
#include "tplid/common/hash.hpp"
#include "tplid/model/errors.hpp"
#include "tplid/model/package_tree.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tplid::model {

// ============================================================================
// Child Order
// ============================================================================

/// Canonical order in which children are combined into a subtree hash.
enum class ChildOrder : uint8_t {
    SubtreeHash = 0, ///< By child subtree hash value (rename-invariant)
    SegmentName = 1, ///< Lexicographic by segment name
};

[[nodiscard]] auto child_order_name(ChildOrder order) -> const char*;

/// Parses "subtree-hash" or "segment-name".
[[nodiscard]] auto parse_child_order(std::string_view name) -> std::optional<ChildOrder>;

// ============================================================================
// HashTree
// ============================================================================

using HashNodeId = uint32_t;

/// One node of a hash tree.
struct HashNode {
    std::string segment; ///< Kept for reports only, never hashed
    Hash128 node_hash;
    Hash128 subtree_hash;
    uint32_t class_count = 0;        ///< Classes in the subtree
    uint32_t direct_class_count = 0; ///< Classes in this package

    /// Content hashes of the direct classes, sorted.
    std::vector<Hash128> class_hashes;

    /// Children in canonical order.
    std::vector<HashNodeId> children;

    /// Source node in the package tree.
    NodeId package_node = INVALID_NODE;
};

/// Immutable hash tree. Node 0 is the root.
class HashTree {
public:
    [[nodiscard]] auto root() const -> HashNodeId {
        return 0;
    }

    [[nodiscard]] auto node(HashNodeId id) const -> const HashNode& {
        return nodes_[id];
    }

    [[nodiscard]] auto nodes() const -> const std::vector<HashNode>& {
        return nodes_;
    }

    [[nodiscard]] auto node_count() const -> size_t {
        return nodes_.size();
    }

    /// Subtree hash of the root; identifies the whole tree.
    [[nodiscard]] auto root_hash() const -> const Hash128& {
        return nodes_.front().subtree_hash;
    }

    [[nodiscard]] auto class_count() const -> uint32_t {
        return nodes_.front().class_count;
    }

    /// Package path of the root node in the source package tree.
    [[nodiscard]] auto root_path() const -> const PackagePath& {
        return root_path_;
    }

    [[nodiscard]] auto child_order() const -> ChildOrder {
        return child_order_;
    }

    /// Package path of any node, relative paths joined onto `root_path()`.
    [[nodiscard]] auto path_of(HashNodeId id) const -> PackagePath;

    /// Indented dump with node and subtree hashes.
    [[nodiscard]] auto to_string() const -> std::string;

private:
    friend class HashTreeBuilder;

    std::vector<HashNode> nodes_;
    std::vector<HashNodeId> parents_;
    PackagePath root_path_;
    ChildOrder child_order_ = ChildOrder::SubtreeHash;
};

// ============================================================================
// HashTreeBuilder
// ============================================================================

/// Options for hash tree construction.
struct HashTreeOptions {
    ChildOrder child_order = ChildOrder::SubtreeHash;

    /// Hash the root's child subtrees on separate threads.
    bool parallel = false;
};

/// Builds hash trees from package trees in one post-order pass.
class HashTreeBuilder {
public:
    HashTreeBuilder() = default;
    explicit HashTreeBuilder(HashTreeOptions options) : options_(options) {}

    /// Hash tree over the whole package tree, rooted at the empty prefix.
    [[nodiscard]] auto build(const PackageTree& tree) const -> Result<HashTree, FingerprintError>;

    /// Hash tree over the subtree rooted at `start`.
    ///
    /// Fails with `EmptyFingerprintError` if the subtree holds no classes.
    [[nodiscard]] auto build_subtree(const PackageTree& tree, NodeId start) const
        -> Result<HashTree, FingerprintError>;

    /// One hash tree per root package (see `PackageTree::root_nodes`).
    [[nodiscard]] auto build_roots(const PackageTree& tree) const
        -> Result<std::vector<HashTree>, FingerprintError>;

    [[nodiscard]] auto options() const -> const HashTreeOptions& {
        return options_;
    }

private:
    void layout(const PackageTree& tree, NodeId id, std::vector<HashNode>& out) const;
    void hash_node(std::vector<HashNode>& nodes, HashNodeId id) const;
    auto build_fragment(const PackageTree& tree, NodeId start) const -> std::vector<HashNode>;

    HashTreeOptions options_;
};

} // namespace tplid::model
