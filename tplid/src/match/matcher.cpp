//! # Matcher Implementation
//!
//! Scoring runs in three stages per reference: exact subtree lookup, the
//! path-agnostic multiset comparison, and the optional path-aware alignment.

#include "tplid/match/matcher.hpp"

#include <algorithm>

namespace tplid::match {

using model::HashNode;
using model::HashNodeId;
using model::HashTree;
using model::LibraryFingerprint;

auto strategy_name(MatchStrategy strategy) -> const char* {
    switch (strategy) {
    case MatchStrategy::Exact:
        return "exact";
    case MatchStrategy::Partial:
        return "partial";
    }
    return "unknown";
}

// ============================================================================
// QueryIndex
// ============================================================================

QueryIndex::QueryIndex(const HashTree& query) : query_(query) {
    for (size_t i = 0; i < query.node_count(); ++i) {
        auto id = static_cast<HashNodeId>(i);
        const auto& node = query.node(id);
        by_subtree_[node.subtree_hash].push_back(id);
        if (node.direct_class_count > 0) {
            by_node_[node.node_hash].push_back(id);
        }
        for (const auto& h : node.class_hashes) {
            ++class_counts_[h];
        }
    }
}

auto QueryIndex::nodes_with_subtree(const Hash128& hash) const
    -> const std::vector<HashNodeId>* {
    auto it = by_subtree_.find(hash);
    return it == by_subtree_.end() ? nullptr : &it->second;
}

auto QueryIndex::nodes_with_node_hash(const Hash128& hash) const
    -> const std::vector<HashNodeId>* {
    auto it = by_node_.find(hash);
    return it == by_node_.end() ? nullptr : &it->second;
}

auto QueryIndex::class_occurrences(const Hash128& hash) const -> uint32_t {
    auto it = class_counts_.find(hash);
    return it == class_counts_.end() ? 0 : it->second;
}

// ============================================================================
// Path-Aware Alignment
// ============================================================================

namespace {

/// Memoized structural alignment of one reference tree against the query.
class Aligner {
public:
    Aligner(const HashTree& reference, const HashTree& query)
        : reference_(reference), query_(query) {}

    /// Reference classes accounted for when `r` is laid over `q`.
    auto align(HashNodeId r, HashNodeId q) -> uint32_t {
        const auto& rn = reference_.node(r);
        const auto& qn = query_.node(q);
        if (rn.subtree_hash == qn.subtree_hash) {
            return rn.class_count;
        }

        uint64_t key = (static_cast<uint64_t>(r) << 32) | q;
        if (auto it = memo_.find(key); it != memo_.end()) {
            return it->second;
        }

        uint32_t total = 0;
        if (rn.direct_class_count > 0 && rn.node_hash == qn.node_hash) {
            total += rn.direct_class_count;
        }
        if (!rn.children.empty() && !qn.children.empty()) {
            total += align_children(rn, qn);
        }

        memo_.emplace(key, total);
        return total;
    }

private:
    struct Pairing {
        uint32_t score;
        bool same_segment;
        size_t ref_index;
        size_t query_index;
    };

    auto align_children(const HashNode& rn, const HashNode& qn) -> uint32_t {
        std::vector<Pairing> pairings;
        for (size_t i = 0; i < rn.children.size(); ++i) {
            for (size_t j = 0; j < qn.children.size(); ++j) {
                uint32_t s = align(rn.children[i], qn.children[j]);
                if (s > 0) {
                    bool same = reference_.node(rn.children[i]).segment ==
                                query_.node(qn.children[j]).segment;
                    pairings.push_back({s, same, i, j});
                }
            }
        }

        std::sort(pairings.begin(), pairings.end(), [](const Pairing& a, const Pairing& b) {
            if (a.score != b.score) {
                return a.score > b.score;
            }
            if (a.same_segment != b.same_segment) {
                return a.same_segment;
            }
            if (a.ref_index != b.ref_index) {
                return a.ref_index < b.ref_index;
            }
            return a.query_index < b.query_index;
        });

        std::vector<bool> ref_used(rn.children.size(), false);
        std::vector<bool> query_used(qn.children.size(), false);
        uint32_t total = 0;
        for (const auto& p : pairings) {
            if (ref_used[p.ref_index] || query_used[p.query_index]) {
                continue;
            }
            ref_used[p.ref_index] = true;
            query_used[p.query_index] = true;
            total += p.score;
        }
        return total;
    }

    const HashTree& reference_;
    const HashTree& query_;
    std::unordered_map<uint64_t, uint32_t> memo_;
};

} // namespace

// ============================================================================
// Matcher
// ============================================================================

auto Matcher::try_exact(const QueryIndex& index, const LibraryFingerprint& reference,
                        MatchResult& result) const -> bool {
    std::optional<HashNodeId> first_anchor;
    for (const auto& tree : reference.hash_trees()) {
        const auto* hits = index.nodes_with_subtree(tree.root_hash());
        if (!hits) {
            return false;
        }
        if (!first_anchor) {
            first_anchor = hits->front();
        }
    }
    if (!first_anchor) {
        return false;
    }

    result.strategy = MatchStrategy::Exact;
    result.score = 1.0;
    result.path_agnostic_score = 1.0;
    result.path_aware_score = 1.0;
    result.matched_class_count = reference.class_count();
    result.anchor = index.tree().path_of(*first_anchor);
    return true;
}

auto Matcher::path_agnostic(const QueryIndex& index, const LibraryFingerprint& reference,
                            uint32_t& matched) const -> double {
    std::unordered_map<Hash128, uint32_t> used_nodes;
    std::unordered_map<Hash128, uint32_t> consumed_classes;
    std::unordered_map<Hash128, uint32_t> leftover_classes;
    uint32_t node_classes = 0;

    for (const auto& tree : reference.hash_trees()) {
        for (const auto& node : tree.nodes()) {
            if (node.direct_class_count == 0) {
                continue;
            }
            const auto* hits = index.nodes_with_node_hash(node.node_hash);
            auto& used = used_nodes[node.node_hash];
            if (hits && used < hits->size()) {
                ++used;
                node_classes += node.direct_class_count;
                for (const auto& h : node.class_hashes) {
                    ++consumed_classes[h];
                }
            } else {
                for (const auto& h : node.class_hashes) {
                    ++leftover_classes[h];
                }
            }
        }
    }

    // Multiset intersection of leftover reference classes with query classes
    // not already consumed by a node match
    uint32_t class_matches = 0;
    for (const auto& [hash, wanted] : leftover_classes) {
        uint32_t available = index.class_occurrences(hash);
        if (auto it = consumed_classes.find(hash); it != consumed_classes.end()) {
            available = available > it->second ? available - it->second : 0;
        }
        class_matches += std::min(wanted, available);
    }

    matched = node_classes + class_matches;
    uint32_t total = reference.class_count();
    if (total == 0) {
        return 0.0;
    }
    return (static_cast<double>(node_classes) +
            config_.partial_class_weight * static_cast<double>(class_matches)) /
           static_cast<double>(total);
}

auto Matcher::path_aware(const QueryIndex& index, const LibraryFingerprint& reference,
                         std::optional<PackagePath>& anchor) const -> double {
    const auto& query = index.tree();
    uint32_t aligned = 0;
    uint32_t anchor_tree_classes = 0;

    for (const auto& tree : reference.hash_trees()) {
        Aligner aligner(tree, query);
        uint32_t best = 0;
        std::optional<HashNodeId> best_anchor;
        uint32_t root_classes = tree.node(tree.root()).class_count;

        for (size_t i = 0; i < query.node_count(); ++i) {
            auto q = static_cast<HashNodeId>(i);
            // Node hashes can only match where the query has classes
            if (std::min(root_classes, query.node(q).class_count) <= best) {
                continue;
            }
            uint32_t s = aligner.align(tree.root(), q);
            if (s > best) {
                best = s;
                best_anchor = q;
            }
            if (best == root_classes) {
                break;
            }
        }

        aligned += best;
        if (best_anchor && root_classes > anchor_tree_classes) {
            anchor_tree_classes = root_classes;
            anchor = query.path_of(*best_anchor);
        }
    }

    uint32_t total = reference.class_count();
    return total == 0 ? 0.0 : static_cast<double>(aligned) / static_cast<double>(total);
}

auto Matcher::score(const QueryIndex& index, const LibraryFingerprint& reference) const
    -> MatchResult {
    MatchResult result;
    result.library = reference.description();
    result.library_class_count = reference.class_count();

    if (try_exact(index, reference, result)) {
        return result;
    }

    result.strategy = MatchStrategy::Partial;
    result.path_agnostic_score = path_agnostic(index, reference, result.matched_class_count);
    if (result.matched_class_count == 0) {
        return result;
    }

    if (!config_.path_aware) {
        result.score = result.path_agnostic_score;
        return result;
    }

    double w = config_.path_aware_weight;
    // The alignment is only worth computing if the result can still pass
    double best_possible = (1.0 - w) * result.path_agnostic_score + w;
    if (best_possible >= config_.min_score) {
        result.path_aware_score = path_aware(index, reference, result.anchor);
    }
    result.score = (1.0 - w) * result.path_agnostic_score + w * result.path_aware_score;
    return result;
}

auto Matcher::match(const HashTree& query, const Corpus& corpus) const
    -> std::vector<MatchResult> {
    return match(query, corpus.fingerprints());
}

auto Matcher::match(const HashTree& query, const std::vector<LibraryFingerprint>& references) const
    -> std::vector<MatchResult> {
    QueryIndex index(query);
    std::vector<MatchResult> results;

    for (const auto& reference : references) {
        auto result = score(index, reference);
        if (result.matched_class_count > 0 && result.score >= config_.min_score) {
            results.push_back(std::move(result));
        }
    }

    std::sort(results.begin(), results.end(), rank_before);
    return results;
}

auto rank_before(const MatchResult& a, const MatchResult& b) -> bool {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.path_aware_score != b.path_aware_score) {
        return a.path_aware_score > b.path_aware_score;
    }
    if (a.library_class_count != b.library_class_count) {
        return a.library_class_count > b.library_class_count;
    }
    if (a.library.name != b.library.name) {
        return a.library.name < b.library.name;
    }
    return a.library.version < b.library.version;
}

} // namespace tplid::match
