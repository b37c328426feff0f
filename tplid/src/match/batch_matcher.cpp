#include "tplid/match/batch_matcher.hpp"

#include <algorithm>
#include <thread>

namespace tplid::match {

// ============================================================================
// MatchQueue
// ============================================================================

void MatchQueue::push(std::shared_ptr<MatchJob> job) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(job));
    cv_.notify_one();
}

std::shared_ptr<MatchJob> MatchQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || stopped_; });

    if (queue_.empty()) {
        return nullptr;
    }

    auto job = std::move(queue_.front());
    queue_.pop();
    return job;
}

void MatchQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    cv_.notify_all();
}

// ============================================================================
// BatchMatcher
// ============================================================================

BatchMatcher::BatchMatcher(CorpusSnapshot corpus, MatchConfig config, int num_threads)
    : corpus_(std::move(corpus)), matcher_(config), num_threads_(num_threads) {
    if (num_threads_ <= 0) {
        num_threads_ = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads_ <= 0) {
            num_threads_ = 4;
        }
    }
    if (!corpus_) {
        corpus_ = std::make_shared<const Corpus>();
    }
}

void BatchMatcher::add_query(std::string label, model::HashTree query) {
    auto job = std::make_shared<MatchJob>();
    job->index = jobs_.size();
    job->label = std::move(label);
    job->query = std::move(query);
    jobs_.push_back(std::move(job));
}

std::vector<BatchResult> BatchMatcher::run() {
    stats_.reset();
    stats_.total = static_cast<int>(jobs_.size());

    for (const auto& job : jobs_) {
        queue_.push(job);
    }
    queue_.stop();

    std::vector<std::thread> workers;
    int actual_threads = std::min(static_cast<int>(jobs_.size()), num_threads_);
    for (int i = 0; i < actual_threads; ++i) {
        workers.emplace_back(&BatchMatcher::worker_thread, this);
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::vector<BatchResult> results;
    results.reserve(jobs_.size());
    for (auto& job : jobs_) {
        results.push_back(BatchResult{std::move(job->label), std::move(job->results)});
    }
    jobs_.clear();
    return results;
}

void BatchMatcher::worker_thread() {
    while (auto job = queue_.pop()) {
        job->results = matcher_.match(job->query, *corpus_);
        stats_.completed++;
    }
}

} // namespace tplid::match
