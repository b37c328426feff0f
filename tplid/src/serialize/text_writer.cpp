//! # Profile Text Writer
//!
//! Human-readable dump used by `tplid dump`. Lines starting with `;` carry
//! metadata, then the package tree follows with one package per line and
//! its classes indented below it, then the hash trees.

#include "tplid/serialize/profile_serialize.hpp"

#include <type_traits>

namespace tplid::serialize {

ProfileTextWriter::ProfileTextWriter(std::ostream& out, bool include_signatures)
    : out_(out), include_signatures_(include_signatures) {}

void ProfileTextWriter::write_profile(const model::LibraryFingerprint& fingerprint) {
    const auto& desc = fingerprint.description();
    out_ << "; tplid profile: " << desc.to_string() << "\n";
    out_ << "; category: " << model::category_name(desc.category) << "\n";
    if (!desc.release_date.empty()) {
        out_ << "; release date: " << desc.release_date << "\n";
    }
    if (!desc.comment.empty()) {
        out_ << "; comment: " << desc.comment << "\n";
    }
    out_ << "; classes: " << fingerprint.class_count() << "\n";
    out_ << "; child order: " << model::child_order_name(fingerprint.child_order()) << "\n";
    write_layout(fingerprint.root_layout());
    out_ << "\n";

    const auto& tree = fingerprint.package_tree();
    write_package_node(tree, tree.root());

    for (const auto& hash_tree : fingerprint.hash_trees()) {
        out_ << "\n" << hash_tree.to_string();
    }
}

void ProfileTextWriter::write_layout(const model::RootLayout& layout) {
    std::visit(
        [this](const auto& l) {
            using T = std::decay_t<decltype(l)>;
            if constexpr (std::is_same_v<T, model::SingleRoot>) {
                out_ << "; root: " << join_path(l.path) << "\n";
            } else {
                out_ << "; roots (multiple):";
                for (const auto& root : l.roots) {
                    out_ << " " << join_path(root);
                }
                out_ << "\n";
            }
        },
        layout);
}

void ProfileTextWriter::write_package_node(const model::PackageTree& tree, model::NodeId id) {
    const auto& node = tree.node(id);
    std::string indent(node.depth * 2, ' ');

    out_ << indent << (id == tree.root() ? "<root>" : node.segment) << " ("
         << node.classes.size() << "/" << node.class_count << ")\n";

    for (const auto& cls : node.classes) {
        out_ << indent << "  class " << cls.simple_name << " " << model::class_kind_name(cls.kind)
             << " " << cls.content_hash.to_hex() << " " << cls.member_signatures.size()
             << " members\n";
        if (include_signatures_) {
            for (const auto& sig : cls.member_signatures) {
                out_ << indent << "    " << sig << "\n";
            }
        }
    }

    for (const auto& [_, child] : node.children) {
        write_package_node(tree, child);
    }
}

} // namespace tplid::serialize
