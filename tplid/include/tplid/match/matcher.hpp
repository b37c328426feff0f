//! # Matcher
//!
//! Scores a query hash tree against reference fingerprints.
//!
//! ## Strategies
//!
//! | Strategy | Evidence                                                       |
//! |----------|----------------------------------------------------------------|
//! | Exact    | Every reference root's subtree hash occurs in the query        |
//! | Partial  | Node hashes matched as a multiset, then class hashes of the    |
//! |          | leftover nodes, optionally blended with a path-aware alignment |
//!
//! ## Scoring
//!
//! ```text
//! path_agnostic = (exact_node_classes + partial_class_weight * class_matches)
//!                 / library_classes
//! path_aware    = sum over reference roots of max over query anchors of
//!                 align(root, anchor), divided by library_classes
//! score         = (1 - w) * path_agnostic + w * path_aware
//! ```
//!
//! Results below `min_score` are dropped. The rest are ranked by score, then
//! path-aware score, then library class count, then name and version.
//!
//! The matcher holds no state between queries and never mutates the corpus,
//! so one instance may serve any number of threads.

#pragma once

#include "tplid/common.hpp"
#include "tplid/match/corpus.hpp"
#include "tplid/model/fingerprint.hpp"
#include "tplid/model/hash_tree.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace tplid::match {

/// How a match was established.
enum class MatchStrategy : uint8_t {
    Exact,
    Partial,
};

[[nodiscard]] auto strategy_name(MatchStrategy strategy) -> const char*;

/// Matching policy.
struct MatchConfig {
    /// Minimum combined score for a result to be reported.
    double min_score = 0.5;

    /// Compute the path-aware alignment score.
    bool path_aware = true;

    /// Weight of the path-aware score in the combined score.
    double path_aware_weight = 0.0;

    /// Credit for a class matched by content hash outside a matching node.
    double partial_class_weight = 0.5;
};

/// One reported library.
struct MatchResult {
    model::LibraryDescription library;
    double score = 0.0;
    double path_agnostic_score = 0.0;
    double path_aware_score = 0.0;
    uint32_t matched_class_count = 0;
    uint32_t library_class_count = 0;
    MatchStrategy strategy = MatchStrategy::Partial;

    /// Query package where the library was found, if it could be located.
    std::optional<PackagePath> anchor;
};

/// Per-query lookup tables, built once and shared across all references.
class QueryIndex {
public:
    explicit QueryIndex(const model::HashTree& query);

    [[nodiscard]] auto tree() const -> const model::HashTree& {
        return query_;
    }

    /// Query nodes with the given subtree hash, in node order.
    [[nodiscard]] auto nodes_with_subtree(const Hash128& hash) const
        -> const std::vector<model::HashNodeId>*;

    /// Query nodes with direct classes and the given node hash, in node order.
    [[nodiscard]] auto nodes_with_node_hash(const Hash128& hash) const
        -> const std::vector<model::HashNodeId>*;

    /// Occurrences of a class content hash anywhere in the query.
    [[nodiscard]] auto class_occurrences(const Hash128& hash) const -> uint32_t;

private:
    const model::HashTree& query_;
    std::unordered_map<Hash128, std::vector<model::HashNodeId>> by_subtree_;
    std::unordered_map<Hash128, std::vector<model::HashNodeId>> by_node_;
    std::unordered_map<Hash128, uint32_t> class_counts_;
};

class Matcher {
public:
    Matcher() = default;
    explicit Matcher(MatchConfig config) : config_(config) {}

    /// Ranked matches of `query` against every fingerprint of the corpus.
    ///
    /// Returns an empty vector when nothing reaches `min_score`.
    [[nodiscard]] auto match(const model::HashTree& query, const Corpus& corpus) const
        -> std::vector<MatchResult>;

    [[nodiscard]] auto match(const model::HashTree& query,
                             const std::vector<model::LibraryFingerprint>& references) const
        -> std::vector<MatchResult>;

    /// Scores a single reference, without threshold.
    [[nodiscard]] auto score(const QueryIndex& index,
                             const model::LibraryFingerprint& reference) const -> MatchResult;

    [[nodiscard]] auto config() const -> const MatchConfig& {
        return config_;
    }

private:
    auto try_exact(const QueryIndex& index, const model::LibraryFingerprint& reference,
                   MatchResult& result) const -> bool;
    auto path_agnostic(const QueryIndex& index, const model::LibraryFingerprint& reference,
                       uint32_t& matched) const -> double;
    auto path_aware(const QueryIndex& index, const model::LibraryFingerprint& reference,
                    std::optional<PackagePath>& anchor) const -> double;

    MatchConfig config_;
};

/// Orders results best first.
[[nodiscard]] auto rank_before(const MatchResult& a, const MatchResult& b) -> bool;

} // namespace tplid::match
