//! # Package Tree Construction
//!
//! Builds the arena in three passes: validate and sort the input, insert
//! every class along its path, then roll class counts up and detect roots.

#include "tplid/model/package_tree.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tplid::model {

auto validate_segment(std::string_view segment) -> std::optional<std::string> {
    if (segment.empty()) {
        return "is empty";
    }
    for (char c : segment) {
        if (c == '.' || c == '/') {
            return std::string("contains separator '") + c + "'";
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            return "contains whitespace";
        }
    }
    return std::nullopt;
}

// ============================================================================
// Build
// ============================================================================

auto PackageTree::build(std::vector<ClassDescriptor> classes)
    -> Result<PackageTree, FingerprintError> {
    std::sort(classes.begin(), classes.end(),
              [](const ClassDescriptor& a, const ClassDescriptor& b) {
                  if (a.package_path != b.package_path) {
                      return a.package_path < b.package_path;
                  }
                  if (a.content_hash != b.content_hash) {
                      return a.content_hash < b.content_hash;
                  }
                  return a.simple_name < b.simple_name;
              });

    for (const auto& cls : classes) {
        for (size_t i = 0; i < cls.package_path.size(); ++i) {
            if (auto reason = validate_segment(cls.package_path[i])) {
                return FingerprintError{MalformedPathError::make(
                    cls.qualified_name(), cls.package_path, i, std::move(*reason))};
            }
        }
    }

    PackageTree tree;
    tree.nodes_.emplace_back();

    for (auto& cls : classes) {
        NodeId current = tree.root();
        for (const auto& segment : cls.package_path) {
            current = tree.get_or_create_child(current, segment);
        }
        tree.nodes_[current].classes.push_back(std::move(cls));
    }

    tree.compute_counts();
    tree.detect_roots();
    return tree;
}

auto PackageTree::get_or_create_child(NodeId parent, const std::string& segment) -> NodeId {
    auto it = nodes_[parent].children.find(segment);
    if (it != nodes_[parent].children.end()) {
        return it->second;
    }

    auto id = static_cast<NodeId>(nodes_.size());
    PackageNode child;
    child.segment = segment;
    child.depth = nodes_[parent].depth + 1;
    child.parent = parent;
    nodes_.push_back(std::move(child));
    nodes_[parent].children.emplace(segment, id);
    return id;
}

void PackageTree::compute_counts() {
    // Children always have larger ids than their parent
    for (size_t i = nodes_.size(); i-- > 0;) {
        auto& node = nodes_[i];
        node.class_count = static_cast<uint32_t>(node.classes.size());
        for (const auto& [_, child] : node.children) {
            node.class_count += nodes_[child].class_count;
        }
    }
}

auto PackageTree::descend_to_dominant(NodeId start) const -> NodeId {
    NodeId current = start;
    while (nodes_[current].classes.empty() && nodes_[current].children.size() == 1) {
        current = nodes_[current].children.begin()->second;
    }
    return current;
}

void PackageTree::detect_roots() {
    const auto& top = nodes_[root()];
    root_nodes_.clear();

    if (top.classes.empty() && top.children.size() > 1) {
        MultipleRoots multi;
        for (const auto& [_, child] : top.children) {
            NodeId dominant = descend_to_dominant(child);
            root_nodes_.push_back(dominant);
            multi.roots.push_back(path_of(dominant));
        }
        warnings_.emplace_back(MultipleRootsWarning{multi.roots});
        layout_ = std::move(multi);
        return;
    }

    NodeId dominant = descend_to_dominant(root());
    root_nodes_.push_back(dominant);
    layout_ = SingleRoot{path_of(dominant)};
}

// ============================================================================
// Queries
// ============================================================================

auto PackageTree::find(const PackagePath& path) const -> std::optional<NodeId> {
    NodeId current = root();
    for (const auto& segment : path) {
        auto it = nodes_[current].children.find(segment);
        if (it == nodes_[current].children.end()) {
            return std::nullopt;
        }
        current = it->second;
    }
    return current;
}

auto PackageTree::path_of(NodeId id) const -> PackagePath {
    PackagePath path;
    for (NodeId current = id; current != root(); current = nodes_[current].parent) {
        path.push_back(nodes_[current].segment);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

auto PackageTree::all_classes() const -> std::vector<const ClassDescriptor*> {
    std::vector<const ClassDescriptor*> out;
    out.reserve(class_count());
    for (const auto& node : nodes_) {
        for (const auto& cls : node.classes) {
            out.push_back(&cls);
        }
    }
    return out;
}

auto PackageTree::to_string() const -> std::string {
    std::ostringstream oss;
    std::vector<NodeId> stack{root()};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        const auto& node = nodes_[id];

        oss << std::string(node.depth * 2, ' ') << (id == root() ? "<root>" : node.segment)
            << " (" << node.classes.size() << "/" << node.class_count << ")\n";

        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.push_back(it->second);
        }
    }
    return oss.str();
}

} // namespace tplid::model
