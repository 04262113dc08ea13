#include "image_collate/pipeline/worker_pool.hpp"
#include "image_collate/core/errors.hpp"

#include <algorithm>
#include <exception>

namespace image_collate::pipeline {

int compute_worker_count(int requested, size_t tasks) {
    int n = requested;
    if (n <= 0) {
        const unsigned hw = std::thread::hardware_concurrency();
        n = hw > 0 ? static_cast<int>(hw) : 1;
    }
    if (tasks > 0 && static_cast<size_t>(n) > tasks) {
        n = static_cast<int>(tasks);
    }
    return std::max(1, n);
}

ExtractionPool::ExtractionPool(const features::FeatureExtractor& extractor,
                               ledger::DuplicateLedger& ledger, int workers,
                               size_t queue_capacity)
    : extractor_(extractor), ledger_(ledger), queue_(queue_capacity) {
    const int n = std::max(1, workers);
    threads_.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
}

ExtractionPool::~ExtractionPool() {
    queue_.finish();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void ExtractionPool::worker_loop() {
    ExtractionTask task;
    while (queue_.pop(task)) {
        ExtractionResult res;
        res.seq = task.seq;
        res.filename = task.path.filename().string();
        try {
            ImageRecord rec = extractor_.extract(task.path);
            if (ledger_.check_and_mark(rec.fingerprint)) {
                res.status = ExtractionStatus::Duplicate;
                res.record.filename = rec.filename;
                res.record.fingerprint = rec.fingerprint;
            } else {
                res.status = ExtractionStatus::Candidate;
                res.record = std::move(rec);
            }
        } catch (const std::exception& e) {
            res.status = ExtractionStatus::Failed;
            res.error = e.what();
        }

        {
            std::lock_guard<std::mutex> lock(results_mutex_);
            results_.push_back(std::move(res));
        }
        results_cv_.notify_all();
    }
}

std::vector<ExtractionResult> ExtractionPool::run_cycle(const std::vector<fs::path>& paths) {
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_.clear();
    }

    for (size_t i = 0; i < paths.size(); ++i) {
        if (!queue_.push(ExtractionTask{i, paths[i]})) {
            throw ImageCollateError("extraction pool is shut down");
        }
    }

    std::vector<ExtractionResult> out;
    {
        std::unique_lock<std::mutex> lock(results_mutex_);
        results_cv_.wait(lock, [&] { return results_.size() >= paths.size(); });
        out.swap(results_);
    }

    std::sort(out.begin(), out.end(),
              [](const ExtractionResult& a, const ExtractionResult& b) { return a.seq < b.seq; });
    return out;
}

} // namespace image_collate::pipeline
