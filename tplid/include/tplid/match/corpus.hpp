//! # Reference Corpus
//!
//! An immutable snapshot of reference fingerprints. Queries share a snapshot
//! through `std::shared_ptr<const Corpus>`; adding fingerprints produces a new
//! snapshot and leaves the old one untouched for queries still running on it.

#pragma once

#include "tplid/common.hpp"
#include "tplid/model/fingerprint.hpp"

#include <memory>
#include <vector>

namespace tplid::match {

class Corpus {
public:
    Corpus() = default;
    explicit Corpus(std::vector<model::LibraryFingerprint> fingerprints)
        : fingerprints_(std::move(fingerprints)) {}

    [[nodiscard]] auto fingerprints() const -> const std::vector<model::LibraryFingerprint>& {
        return fingerprints_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return fingerprints_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return fingerprints_.empty();
    }

    /// Returns a new snapshot holding this corpus plus `added`.
    [[nodiscard]] auto with(std::vector<model::LibraryFingerprint> added) const
        -> std::shared_ptr<const Corpus>;

private:
    std::vector<model::LibraryFingerprint> fingerprints_;
};

using CorpusSnapshot = std::shared_ptr<const Corpus>;

} // namespace tplid::match
