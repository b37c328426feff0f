//! # Batch Matching
//!
//! Runs many queries against one corpus snapshot on a pool of worker threads.
//!
//! ## Components
//!
//! | Class          | Description                                 |
//! |----------------|---------------------------------------------|
//! | `MatchJob`     | One query and, once done, its results       |
//! | `MatchQueue`   | Thread-safe work queue                      |
//! | `BatchStats`   | Atomic progress counters                    |
//! | `BatchMatcher` | Owns the jobs and the worker threads        |
//!
//! Every worker holds the same `std::shared_ptr<const Corpus>`, so the
//! snapshot stays alive until the last query finishes even if the caller
//! has moved on to a newer one. Results come back in submission order.

#pragma once

#include "tplid/match/corpus.hpp"
#include "tplid/match/matcher.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace tplid::match {

/// A single query of a batch.
struct MatchJob {
    size_t index = 0;
    std::string label;
    model::HashTree query;
    std::vector<MatchResult> results;
};

/// Results of one query, tagged with the label it was submitted under.
struct BatchResult {
    std::string label;
    std::vector<MatchResult> matches;
};

/// Progress counters, safe to read while a batch runs.
struct BatchStats {
    std::atomic<int> total{0};
    std::atomic<int> completed{0};

    void reset() {
        total = 0;
        completed = 0;
    }
};

/// Thread-safe FIFO of pending jobs.
class MatchQueue {
public:
    void push(std::shared_ptr<MatchJob> job);

    /// Returns the next job, or nullptr once the queue is stopped and empty.
    std::shared_ptr<MatchJob> pop();

    /// Wakes all waiting workers; no more jobs will be pushed.
    void stop();

private:
    std::queue<std::shared_ptr<MatchJob>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

class BatchMatcher {
public:
    /// `num_threads == 0` picks the hardware concurrency.
    explicit BatchMatcher(CorpusSnapshot corpus, MatchConfig config = {}, int num_threads = 0);

    void add_query(std::string label, model::HashTree query);

    /// Matches every added query and clears the job list.
    std::vector<BatchResult> run();

    const BatchStats& stats() const {
        return stats_;
    }

    int thread_count() const {
        return num_threads_;
    }

private:
    void worker_thread();

    CorpusSnapshot corpus_;
    Matcher matcher_;
    int num_threads_;
    std::vector<std::shared_ptr<MatchJob>> jobs_;
    MatchQueue queue_;
    BatchStats stats_;
};

} // namespace tplid::match
