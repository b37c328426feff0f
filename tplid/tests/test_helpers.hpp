//! # Test Helpers
//!
//! Builders for synthetic class sets shared by the model, matcher and
//! serializer tests.

#pragma once

#include "tplid/model/fingerprint.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

namespace tplid::test {

/// Builds a class from a dotted qualified name (`com.example.Foo`).
inline auto make_class(const std::string& qualified, std::set<std::string> signatures,
                       model::ClassKind kind = model::ClassKind::TopLevel)
    -> model::ClassDescriptor {
    auto parts = split_path(qualified);
    std::string name = parts.back();
    parts.pop_back();
    return model::ClassDescriptor::make(std::move(parts), std::move(name), std::move(signatures),
                                        kind);
}

/// `count` classes in `package`, each with a member set unique to
/// (`seed`, index).
inline auto make_classes(const std::string& package, const std::string& seed, int count)
    -> std::vector<model::ClassDescriptor> {
    std::vector<model::ClassDescriptor> out;
    for (int i = 0; i < count; ++i) {
        std::string tag = seed + std::to_string(i);
        out.push_back(make_class(package + ".C" + std::to_string(i),
                                 {"M:()V", "M:(I)Ljava/lang/String;", "F:[" + tag,
                                  "M:(X)" + tag}));
    }
    return out;
}

inline void append(std::vector<model::ClassDescriptor>& out,
                   std::vector<model::ClassDescriptor> more) {
    for (auto& c : more) {
        out.push_back(std::move(c));
    }
}

/// Replaces every package segment and simple name, keeping members.
inline auto rename_all(std::vector<model::ClassDescriptor> classes, const std::string& prefix)
    -> std::vector<model::ClassDescriptor> {
    for (auto& c : classes) {
        for (auto& segment : c.package_path) {
            segment = prefix + segment;
        }
        c.simple_name = prefix + c.simple_name;
    }
    return classes;
}

inline auto fingerprint_of(const std::string& name, const std::string& version,
                           std::vector<model::ClassDescriptor> classes,
                           model::HashTreeOptions options = {}) -> model::LibraryFingerprint {
    model::LibraryDescription desc;
    desc.name = name;
    desc.version = version;
    desc.category = model::LibraryCategory::Utilities;
    auto result = model::make_fingerprint(desc, std::move(classes), options);
    EXPECT_TRUE(is_ok(result));
    return std::move(unwrap(result).fingerprint);
}

inline auto query_of(std::vector<model::ClassDescriptor> classes,
                     model::HashTreeOptions options = {}) -> model::HashTree {
    auto result = model::make_query_tree(std::move(classes), options);
    EXPECT_TRUE(is_ok(result));
    return std::move(unwrap(result));
}

/// Sorted node and subtree hashes of a tree.
inline auto hash_bag(const model::HashTree& tree) -> std::vector<Hash128> {
    std::vector<Hash128> bag;
    for (const auto& node : tree.nodes()) {
        bag.push_back(node.node_hash);
        bag.push_back(node.subtree_hash);
    }
    std::sort(bag.begin(), bag.end());
    return bag;
}

} // namespace tplid::test
