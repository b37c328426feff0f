#include "tplid/match/corpus.hpp"

namespace tplid::match {

auto Corpus::with(std::vector<model::LibraryFingerprint> added) const
    -> std::shared_ptr<const Corpus> {
    std::vector<model::LibraryFingerprint> all = fingerprints_;
    all.reserve(all.size() + added.size());
    for (auto& fp : added) {
        all.push_back(std::move(fp));
    }
    return std::make_shared<const Corpus>(std::move(all));
}

} // namespace tplid::match
