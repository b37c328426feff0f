//! # Package Tree
//!
//! An ordered tree keyed by package path segments. Every node stands for one
//! package prefix and holds the classes declared directly in that package.
//!
//! ## Layout
//!
//! Nodes live in an arena and refer to each other by `NodeId`. Node 0 is the
//! empty prefix. Since classes are inserted in sorted order, node ids follow a
//! pre-order walk with children visited by segment name, so two trees built
//! from the same classes are identical down to their ids.
//!
//! ```text
//! <root> (0)
//! └── com (1)
//!     └── example (2)        <- dominant root
//!         ├── net (3)        Client, Request
//!         └── util (4)       Strings
//! ```
//!
//! ## Roots
//!
//! The dominant root is found by descending from the empty prefix while a node
//! has exactly one child and no classes of its own. If the empty prefix has
//! several children and no classes, the library has multiple roots; each
//! top-level child is descended the same way and a `MultipleRootsWarning` is
//! recorded.

#pragma once

#include "tplid/common.hpp"
#include "tplid/model/class_descriptor.hpp"
#include "tplid/model/errors.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tplid::model {

/// Index of a node inside its tree's arena.
using NodeId = uint32_t;

/// Marks the parent of the root node.
constexpr NodeId INVALID_NODE = UINT32_MAX;

/// One package prefix.
struct PackageNode {
    std::string segment;          ///< Last path segment (empty for the root)
    uint32_t depth = 0;           ///< Number of segments in the prefix
    NodeId parent = INVALID_NODE; ///< Parent node, INVALID_NODE for the root

    /// Child nodes keyed by their segment.
    std::map<std::string, NodeId> children;

    /// Classes declared directly in this package, sorted by
    /// (content hash, simple name).
    std::vector<ClassDescriptor> classes;

    /// Total number of classes in this node's subtree.
    uint32_t class_count = 0;
};

/// The library has one root package.
struct SingleRoot {
    PackagePath path;
};

/// The library's classes do not share a root package.
struct MultipleRoots {
    std::vector<PackagePath> roots;
};

/// Closed variant describing where a library's classes are rooted.
using RootLayout = std::variant<SingleRoot, MultipleRoots>;

/// Package tree over a set of class descriptors.
class PackageTree {
public:
    /// Builds a tree from classes in any order.
    ///
    /// Fails with `MalformedPathError` on an empty segment or a segment
    /// containing `.`, `/` or whitespace. An empty input yields a tree with a
    /// lone root and no classes.
    [[nodiscard]] static auto build(std::vector<ClassDescriptor> classes)
        -> Result<PackageTree, FingerprintError>;

    /// The empty-prefix node.
    [[nodiscard]] auto root() const -> NodeId {
        return 0;
    }

    [[nodiscard]] auto node(NodeId id) const -> const PackageNode& {
        return nodes_[id];
    }

    [[nodiscard]] auto nodes() const -> const std::vector<PackageNode>& {
        return nodes_;
    }

    [[nodiscard]] auto node_count() const -> size_t {
        return nodes_.size();
    }

    /// Total number of classes in the tree.
    [[nodiscard]] auto class_count() const -> uint32_t {
        return nodes_.front().class_count;
    }

    /// Returns the node addressed by `path`, if it exists.
    [[nodiscard]] auto find(const PackagePath& path) const -> std::optional<NodeId>;

    /// Returns the full package path of a node.
    [[nodiscard]] auto path_of(NodeId id) const -> PackagePath;

    [[nodiscard]] auto root_layout() const -> const RootLayout& {
        return layout_;
    }

    /// Nodes the per-root hash trees are built from: the dominant root, or
    /// one node per disjoint root package.
    [[nodiscard]] auto root_nodes() const -> const std::vector<NodeId>& {
        return root_nodes_;
    }

    [[nodiscard]] auto has_multiple_roots() const -> bool {
        return std::holds_alternative<MultipleRoots>(layout_);
    }

    [[nodiscard]] auto warnings() const -> const std::vector<FingerprintWarning>& {
        return warnings_;
    }

    /// All classes in pre-order of their packages.
    [[nodiscard]] auto all_classes() const -> std::vector<const ClassDescriptor*>;

    /// Renders the tree with one package per line and its class count.
    [[nodiscard]] auto to_string() const -> std::string;

private:
    PackageTree() = default;

    auto get_or_create_child(NodeId parent, const std::string& segment) -> NodeId;
    auto descend_to_dominant(NodeId start) const -> NodeId;
    void compute_counts();
    void detect_roots();

    std::vector<PackageNode> nodes_;
    RootLayout layout_ = SingleRoot{};
    std::vector<NodeId> root_nodes_;
    std::vector<FingerprintWarning> warnings_;
};

/// Checks a single segment. Returns the reason it is invalid, or nullopt.
[[nodiscard]] auto validate_segment(std::string_view segment) -> std::optional<std::string>;

} // namespace tplid::model
