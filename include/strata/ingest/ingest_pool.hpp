//! # Parallel Ingestion
//!
//! File discovery and the worker pool that ingests files in parallel.
//!
//! ## Components
//!
//! | Class        | Description                                         |
//! |--------------|-----------------------------------------------------|
//! | `Channel<T>` | Thread-safe FIFO with close semantics               |
//! | `IngestStats`| Atomic progress counters                            |
//! | `IngestPool` | Worker threads pulling file indices, pushing facts  |
//!
//! ## Data Flow
//!
//! ```text
//! work channel (indices) → worker ×N → SourceIngestor → result channel (owned FileFacts)
//!                                                             ↓
//!                                                    join (barrier) → ordered facts
//! ```
//!
//! Workers share no mutable facts. Each result is moved through the result
//! channel, so the only locks are the two channel mutexes.

#ifndef STRATA_INGEST_INGEST_POOL_HPP
#define STRATA_INGEST_INGEST_POOL_HPP

#include "strata/deadline.hpp"
#include "strata/ingest/file_facts.hpp"
#include "strata/ingest/source_ingestor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace strata::ingest {

/**
 * Thread-safe FIFO channel
 */
template <typename T> class Channel {
public:
    void push(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(value));
        cv_.notify_one();
    }

    /// Pops a value, waiting up to `timeout_ms`. Returns nullopt when the
    /// channel is empty after the wait.
    std::optional<T> pop(int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                         [this] { return !queue_.empty() || closed_; });
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /// No more values will be pushed; wakes all waiters.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    bool is_closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// Removes and returns everything queued.
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(queue_.size());
        for (auto& v : queue_) {
            out.push_back(std::move(v));
        }
        queue_.clear();
        return out;
    }

private:
    std::deque<T> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

/**
 * Ingestion statistics for reporting
 */
struct IngestStats {
    std::atomic<int> scheduled{0};
    std::atomic<int> ingested{0};
    std::atomic<int> failed{0};
    std::chrono::steady_clock::time_point start_time;

    void reset() {
        scheduled = 0;
        ingested = 0;
        failed = 0;
        start_time = std::chrono::steady_clock::now();
    }

    int64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

/**
 * Parallel ingestion orchestrator
 */
class IngestPool {
public:
    /// `num_threads` 0 selects the hardware concurrency.
    IngestPool(const SourceIngestor& ingestor, int num_threads = 0);

    /// Ingests `files` (root-relative) and returns their facts in input order.
    ///
    /// Throws `DeadlineExceeded` if the deadline passes before every file is
    /// ingested; unscheduled files are abandoned and in-flight results dropped.
    std::vector<FileFacts> run(const fs::path& root, const std::vector<std::string>& files,
                               const Deadline& deadline);

    const IngestStats& get_stats() const {
        return stats;
    }

    int thread_count() const {
        return num_threads;
    }

private:
    const SourceIngestor& ingestor;
    int num_threads;
    IngestStats stats;

    struct Ingested {
        size_t index;
        FileFacts facts;
    };

    void worker_thread(const fs::path& root, const std::vector<std::string>& files,
                       Channel<size_t>& work, Channel<Ingested>& results, const Deadline& deadline,
                       std::atomic<bool>& abandoned);
};

/// Finds every file under `root` with a known language, skipping paths that
/// match an ignore glob. Returns sorted root-relative paths.
///
/// Malformed ignore globs are rejected earlier, by configuration validation.
std::vector<std::string> discover_sources(const fs::path& root,
                                          const std::vector<std::string>& ignore);

} // namespace strata::ingest

#endif // STRATA_INGEST_INGEST_POOL_HPP
