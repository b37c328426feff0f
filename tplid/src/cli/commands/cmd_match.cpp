//! # Match Command
//!
//! This file implements `tplid match`. Each application directory is loaded
//! and turned into a query hash tree; all queries then run as one batch
//! against a single corpus snapshot.
//!
//! ## Options
//!
//! | Option                      | Description                          |
//! |-----------------------------|--------------------------------------|
//! | `--profiles=<dir>`          | Profile directory (required)         |
//! | `--min-score=<0..1>`        | Report threshold                     |
//! | `--no-path-aware`           | Skip path-aware alignment            |
//! | `--path-aware-weight=<0..1>`| Weight of the path-aware score       |
//! | `--format=text\|json`       | Report format                        |
//! | `--threads=<n>`             | Worker threads (0 = hardware)        |

#include "cmd_match.hpp"

#include "cli/report.hpp"
#include "cli/utils.hpp"
#include "tplid/loader/class_loader.hpp"
#include "tplid/log/log.hpp"
#include "tplid/match/batch_matcher.hpp"
#include "tplid/model/fingerprint.hpp"
#include "tplid/serialize/profile_serialize.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace tplid::cli {

namespace {

void print_match_usage() {
    std::cerr << "Usage: tplid match <app-dir>... --profiles=<dir> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --profiles=<dir>           Directory of .lib profiles\n";
    std::cerr << "  --min-score=<0..1>         Minimum score to report\n";
    std::cerr << "  --no-path-aware            Disable path-aware alignment\n";
    std::cerr << "  --path-aware-weight=<0..1> Weight of the path-aware score\n";
    std::cerr << "  --format=text|json         Report format (default: text)\n";
    std::cerr << "  --threads=<n>              Worker threads (default: hardware)\n";
    std::cerr << "  --config=<file>            Configuration file\n";
}

} // namespace

int run_match(int argc, char* argv[]) {
    std::vector<std::string> inputs;
    std::string profiles_dir;
    std::string config_file;
    std::optional<double> min_score;
    std::optional<double> path_aware_weight;
    bool no_path_aware = false;
    ReportFormat format = ReportFormat::Text;
    int threads = 0;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--profiles=")) {
            profiles_dir = arg.substr(11);
        } else if (arg.starts_with("--config=")) {
            config_file = arg.substr(9);
        } else if (arg.starts_with("--min-score=")) {
            min_score = parse_score(arg.substr(12));
            if (!min_score) {
                std::cerr << "error: --min-score expects a number between 0 and 1\n";
                return 1;
            }
        } else if (arg.starts_with("--path-aware-weight=")) {
            path_aware_weight = parse_score(arg.substr(20));
            if (!path_aware_weight) {
                std::cerr << "error: --path-aware-weight expects a number between 0 and 1\n";
                return 1;
            }
        } else if (arg == "--no-path-aware") {
            no_path_aware = true;
        } else if (arg.starts_with("--format=")) {
            std::string fmt = arg.substr(9);
            if (fmt == "json") {
                format = ReportFormat::JSON;
            } else if (fmt == "text") {
                format = ReportFormat::Text;
            } else {
                std::cerr << "error: unknown report format '" << fmt << "'\n";
                return 1;
            }
        } else if (arg.starts_with("--threads=")) {
            auto count = parse_count(arg.substr(10));
            if (!count) {
                std::cerr << "error: --threads expects a non-negative integer\n";
                return 1;
            }
            threads = *count;
        } else if (arg.starts_with("-")) {
            if (!is_log_option(arg)) {
                std::cerr << "error: unknown option '" << arg << "'\n";
                print_match_usage();
                return 1;
            }
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.empty() || profiles_dir.empty()) {
        print_match_usage();
        return 1;
    }

    auto settings = load_config(config_file);
    if (!settings) {
        return 1;
    }
    if (min_score)
        settings->matching.min_score = *min_score;
    if (path_aware_weight)
        settings->matching.path_aware_weight = *path_aware_weight;
    if (no_path_aware)
        settings->matching.path_aware = false;

    auto corpus_load = serialize::load_corpus(profiles_dir);
    if (corpus_load.corpus->empty()) {
        TPLID_LOG_ERROR("match", "No library profiles loaded from " << profiles_dir);
        return 1;
    }

    match::BatchMatcher batch(corpus_load.corpus, settings->matching, threads);
    loader::ClassHierarchyLoader class_loader(settings->profile.member_policy);
    int failures = 0;

    for (const auto& input : inputs) {
        auto loaded = class_loader.load_directory(input);
        auto query = model::make_query_tree(std::move(loaded.classes),
                                            settings->profile.hash_tree_options());
        if (is_err(query)) {
            TPLID_LOG_ERROR("match", input << ": " << model::error_message(unwrap_err(query)));
            ++failures;
            continue;
        }
        TPLID_LOG_DEBUG("match", "Query " << input << ": " << unwrap(query).class_count()
                                          << " classes, " << unwrap(query).node_count()
                                          << " packages");
        batch.add_query(input, std::move(unwrap(query)));
    }

    auto results = batch.run();
    TPLID_LOG_INFO("match", "Matched " << results.size() << " applications against "
                                       << corpus_load.corpus->size() << " profiles on "
                                       << batch.thread_count() << " threads");

    write_report(std::cout, results, format);
    return failures > 0 ? 1 : 0;
}

} // namespace tplid::cli
