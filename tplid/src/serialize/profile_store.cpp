//! # Profile Store
//!
//! Loads a profile directory into an immutable corpus snapshot. A profile
//! that cannot be read is reported once and left out; the load itself never
//! fails on bad entries.

#include "tplid/log/log.hpp"
#include "tplid/serialize/profile_serialize.hpp"

#include <algorithm>

namespace tplid::serialize {

namespace fs = std::filesystem;

auto load_corpus(const fs::path& dir) -> CorpusLoad {
    CorpusLoad load;
    std::vector<model::LibraryFingerprint> fingerprints;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        TPLID_LOG_ERROR("corpus", "Profile directory not found: " << dir.string());
        load.corpus = std::make_shared<const match::Corpus>();
        return load;
    }

    std::vector<fs::path> files;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == PROFILE_EXTENSION) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        TPLID_LOG_WARN("corpus", "Directory scan of " << dir.string()
                                                      << " stopped early: " << ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        auto result = read_profile_file(file);
        if (is_err(result)) {
            TPLID_LOG_WARN("corpus", "Skipping unreadable profile " << unwrap_err(result));
            ++load.skipped;
            continue;
        }
        fingerprints.push_back(std::move(unwrap(result)));
        ++load.loaded;
    }

    TPLID_LOG_INFO("corpus", "Loaded " << load.loaded << " profiles from " << dir.string()
                                       << " (" << load.skipped << " skipped)");
    load.corpus = std::make_shared<const match::Corpus>(std::move(fingerprints));
    return load;
}

} // namespace tplid::serialize
