//! # Parallel Ingestion Implementation
//!
//! ## Worker Loop
//!
//! 1. `run()` fills the work channel with every file index and closes it
//! 2. Workers pop an index, check the deadline, ingest, push the result
//! 3. `run()` joins all workers (the barrier) and restores input order
//!
//! A worker that sees an expired deadline raises the shared `abandoned` flag;
//! the others stop at their next pop. Exceptions escaping the ingestor are
//! captured per worker and rethrown on the calling thread after the join.

#include "strata/ingest/ingest_pool.hpp"

#include "strata/common.hpp"
#include "strata/log/log.hpp"

#include <algorithm>
#include <exception>
#include <thread>

namespace strata::ingest {

IngestPool::IngestPool(const SourceIngestor& ingestor, int num_threads)
    : ingestor(ingestor), num_threads(num_threads) {
    if (this->num_threads <= 0) {
        this->num_threads = static_cast<int>(std::thread::hardware_concurrency());
        if (this->num_threads == 0) {
            this->num_threads = 4;
        }
    }
}

std::vector<FileFacts> IngestPool::run(const fs::path& root, const std::vector<std::string>& files,
                                       const Deadline& deadline) {
    stats.reset();
    stats.scheduled = static_cast<int>(files.size());

    deadline.check("ingestion");
    if (files.empty()) {
        return {};
    }

    Channel<size_t> work;
    for (size_t i = 0; i < files.size(); ++i) {
        work.push(i);
    }
    work.close();

    Channel<Ingested> results;
    std::atomic<bool> abandoned{false};

    int actual_threads = std::min(static_cast<int>(files.size()), num_threads);
    STRATA_LOG_DEBUG("ingest",
                     "Ingesting " << files.size() << " files with " << actual_threads << " threads");

    std::vector<std::exception_ptr> errors(static_cast<size_t>(actual_threads));
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(actual_threads));
    for (int i = 0; i < actual_threads; ++i) {
        workers.emplace_back([&, i] {
            try {
                worker_thread(root, files, work, results, deadline, abandoned);
            } catch (...) {
                errors[static_cast<size_t>(i)] = std::current_exception();
                abandoned = true;
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    if (abandoned) {
        STRATA_LOG_WARN("ingest", "Deadline passed after " << stats.ingested << " of "
                                                           << files.size() << " files");
        throw DeadlineExceeded("ingestion");
    }

    auto collected = results.drain();
    if (collected.size() != files.size()) {
        throw InternalError("ingestion collected " + std::to_string(collected.size()) +
                            " results for " + std::to_string(files.size()) + " files");
    }
    std::sort(collected.begin(), collected.end(),
              [](const Ingested& a, const Ingested& b) { return a.index < b.index; });

    std::vector<FileFacts> facts;
    facts.reserve(collected.size());
    for (auto& r : collected) {
        facts.push_back(std::move(r.facts));
    }

    STRATA_LOG_DEBUG("ingest", "Ingested " << stats.ingested << " files (" << stats.failed
                                           << " with parse failures) in " << stats.elapsed_ms()
                                           << "ms");
    return facts;
}

void IngestPool::worker_thread(const fs::path& root, const std::vector<std::string>& files,
                               Channel<size_t>& work, Channel<Ingested>& results,
                               const Deadline& deadline, std::atomic<bool>& abandoned) {
    while (!abandoned) {
        auto index = work.pop(0);
        if (!index) {
            break;
        }
        if (deadline.expired()) {
            abandoned = true;
            break;
        }

        auto facts = ingestor.ingest_file(root, files[*index]);
        if (!facts.parse_ok) {
            stats.failed++;
        }
        stats.ingested++;
        results.push(Ingested{*index, std::move(facts)});
    }
}

} // namespace strata::ingest
