//! # Hash Tree Construction
//!
//! Nodes are laid out in pre-order first, so every child has a larger id than
//! its parent. Hashing then walks the arena backwards, which visits children
//! before parents without recursion.

#include "tplid/model/hash_tree.hpp"

#include <algorithm>
#include <future>
#include <sstream>

namespace tplid::model {

auto child_order_name(ChildOrder order) -> const char* {
    switch (order) {
    case ChildOrder::SubtreeHash:
        return "subtree-hash";
    case ChildOrder::SegmentName:
        return "segment-name";
    }
    return "unknown";
}

auto parse_child_order(std::string_view name) -> std::optional<ChildOrder> {
    if (name == "subtree-hash") {
        return ChildOrder::SubtreeHash;
    }
    if (name == "segment-name") {
        return ChildOrder::SegmentName;
    }
    return std::nullopt;
}

// ============================================================================
// HashTree
// ============================================================================

auto HashTree::path_of(HashNodeId id) const -> PackagePath {
    PackagePath relative;
    for (HashNodeId current = id; current != root(); current = parents_[current]) {
        relative.push_back(nodes_[current].segment);
    }
    PackagePath path = root_path_;
    path.insert(path.end(), relative.rbegin(), relative.rend());
    return path;
}

auto HashTree::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "hash tree " << join_path(root_path_) << " (" << child_order_name(child_order_)
        << ", " << nodes_.size() << " nodes, " << class_count() << " classes)\n";

    std::vector<std::pair<HashNodeId, size_t>> stack{{root(), 0}};
    while (!stack.empty()) {
        auto [id, depth] = stack.back();
        stack.pop_back();
        const auto& node = nodes_[id];

        oss << std::string(depth * 2, ' ') << (id == root() ? join_path(root_path_) : node.segment)
            << " node=" << node.node_hash.to_hex() << " subtree=" << node.subtree_hash.to_hex()
            << " classes=" << node.direct_class_count << "/" << node.class_count << "\n";

        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.emplace_back(*it, depth + 1);
        }
    }
    return oss.str();
}

// ============================================================================
// HashTreeBuilder
// ============================================================================

void HashTreeBuilder::layout(const PackageTree& tree, NodeId id,
                             std::vector<HashNode>& out) const {
    const auto& pkg = tree.node(id);
    auto local = static_cast<HashNodeId>(out.size());

    HashNode node;
    node.segment = pkg.segment;
    node.class_count = pkg.class_count;
    node.direct_class_count = static_cast<uint32_t>(pkg.classes.size());
    node.package_node = id;
    node.class_hashes.reserve(pkg.classes.size());
    for (const auto& cls : pkg.classes) {
        node.class_hashes.push_back(cls.content_hash);
    }
    std::sort(node.class_hashes.begin(), node.class_hashes.end());
    out.push_back(std::move(node));

    for (const auto& [_, child] : pkg.children) {
        out[local].children.push_back(static_cast<HashNodeId>(out.size()));
        layout(tree, child, out);
    }
}

void HashTreeBuilder::hash_node(std::vector<HashNode>& nodes, HashNodeId id) const {
    auto& node = nodes[id];
    node.node_hash = hash_unordered(node.class_hashes, HashDomain::Node);

    if (options_.child_order == ChildOrder::SubtreeHash) {
        std::sort(node.children.begin(), node.children.end(), [&](HashNodeId a, HashNodeId b) {
            if (nodes[a].subtree_hash != nodes[b].subtree_hash) {
                return nodes[a].subtree_hash < nodes[b].subtree_hash;
            }
            return nodes[a].segment < nodes[b].segment;
        });
    }

    std::vector<Hash128> parts;
    parts.reserve(node.children.size() + 1);
    parts.push_back(node.node_hash);
    for (HashNodeId child : node.children) {
        parts.push_back(nodes[child].subtree_hash);
    }
    node.subtree_hash = hash_ordered(parts, HashDomain::Subtree);
}

auto HashTreeBuilder::build_fragment(const PackageTree& tree, NodeId start) const
    -> std::vector<HashNode> {
    std::vector<HashNode> nodes;
    layout(tree, start, nodes);
    for (size_t i = nodes.size(); i-- > 0;) {
        hash_node(nodes, static_cast<HashNodeId>(i));
    }
    return nodes;
}

auto HashTreeBuilder::build(const PackageTree& tree) const -> Result<HashTree, FingerprintError> {
    return build_subtree(tree, tree.root());
}

auto HashTreeBuilder::build_subtree(const PackageTree& tree, NodeId start) const
    -> Result<HashTree, FingerprintError> {
    if (tree.node(start).class_count == 0) {
        return FingerprintError{EmptyFingerprintError{}};
    }

    HashTree result;
    result.root_path_ = tree.path_of(start);
    result.child_order_ = options_.child_order;

    const auto& start_node = tree.node(start);
    if (!options_.parallel || start_node.children.size() < 2) {
        result.nodes_ = build_fragment(tree, start);
    } else {
        std::vector<std::future<std::vector<HashNode>>> futures;
        futures.reserve(start_node.children.size());
        for (const auto& [_, child] : start_node.children) {
            futures.push_back(std::async(std::launch::async, [this, &tree, child = child]() {
                return build_fragment(tree, child);
            }));
        }

        // Root alone, then each child fragment spliced in with shifted ids
        auto& nodes = result.nodes_;
        HashNode root;
        root.segment = start_node.segment;
        root.class_count = start_node.class_count;
        root.direct_class_count = static_cast<uint32_t>(start_node.classes.size());
        root.package_node = start;
        for (const auto& cls : start_node.classes) {
            root.class_hashes.push_back(cls.content_hash);
        }
        std::sort(root.class_hashes.begin(), root.class_hashes.end());
        nodes.push_back(std::move(root));

        for (auto& future : futures) {
            auto fragment = future.get();
            auto offset = static_cast<HashNodeId>(nodes.size());
            nodes.front().children.push_back(offset);
            for (auto& node : fragment) {
                for (auto& child : node.children) {
                    child += offset;
                }
                nodes.push_back(std::move(node));
            }
        }
        hash_node(nodes, 0);
    }

    result.parents_.assign(result.nodes_.size(), 0);
    for (size_t i = 0; i < result.nodes_.size(); ++i) {
        for (HashNodeId child : result.nodes_[i].children) {
            result.parents_[child] = static_cast<HashNodeId>(i);
        }
    }
    return result;
}

auto HashTreeBuilder::build_roots(const PackageTree& tree) const
    -> Result<std::vector<HashTree>, FingerprintError> {
    std::vector<HashTree> trees;
    for (NodeId root : tree.root_nodes()) {
        auto result = build_subtree(tree, root);
        if (is_err(result)) {
            return unwrap_err(result);
        }
        trees.push_back(std::move(unwrap(result)));
    }
    return trees;
}

} // namespace tplid::model
