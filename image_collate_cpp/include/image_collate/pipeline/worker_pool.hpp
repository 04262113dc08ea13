#pragma once

#include "image_collate/core/types.hpp"
#include "image_collate/features/feature_extractor.hpp"
#include "image_collate/ledger/duplicate_ledger.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace image_collate::pipeline {

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Blocks while full. Returns false once finish() was called.
    bool push(T item) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_push_.wait(lk, [&] { return q_.size() < capacity_ || done_; });
        if (done_) return false;
        q_.push(std::move(item));
        cv_pop_.notify_one();
        return true;
    }

    // Blocks while empty. Returns false when finished and drained.
    bool pop(T& item) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_pop_.wait(lk, [&] { return !q_.empty() || done_; });
        if (q_.empty()) return false;
        item = std::move(q_.front());
        q_.pop();
        cv_push_.notify_one();
        return true;
    }

    void finish() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            done_ = true;
        }
        cv_pop_.notify_all();
        cv_push_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return q_.size();
    }

private:
    std::queue<T> q_;
    mutable std::mutex mtx_;
    std::condition_variable cv_push_, cv_pop_;
    size_t capacity_;
    bool done_ = false;
};

struct ExtractionTask {
    size_t seq = 0;
    fs::path path;
};

enum class ExtractionStatus { Candidate, Duplicate, Failed };

struct ExtractionResult {
    size_t seq = 0;
    std::string filename;
    ExtractionStatus status = ExtractionStatus::Failed;
    ImageRecord record;  // valid for Candidate
    std::string error;   // set for Failed
};

// min(requested or hardware concurrency, tasks), at least 1.
int compute_worker_count(int requested, size_t tasks);

/**
 * Fixed set of extraction workers fed through a bounded queue.
 * Workers decode, compute features and consult the shared ledger;
 * they never write files.
 */
class ExtractionPool {
public:
    ExtractionPool(const features::FeatureExtractor& extractor, ledger::DuplicateLedger& ledger,
                   int workers, size_t queue_capacity);
    ~ExtractionPool();

    ExtractionPool(const ExtractionPool&) = delete;
    ExtractionPool& operator=(const ExtractionPool&) = delete;

    // Extracts every path and blocks until all results are in.
    // Results are returned in input order regardless of completion order.
    std::vector<ExtractionResult> run_cycle(const std::vector<fs::path>& paths);

    int worker_count() const { return static_cast<int>(threads_.size()); }

private:
    void worker_loop();

    const features::FeatureExtractor& extractor_;
    ledger::DuplicateLedger& ledger_;
    BoundedQueue<ExtractionTask> queue_;
    std::vector<std::thread> threads_;

    std::mutex results_mutex_;
    std::condition_variable results_cv_;
    std::vector<ExtractionResult> results_;
};

} // namespace image_collate::pipeline
