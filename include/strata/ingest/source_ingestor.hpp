//! # Source Ingestor
//!
//! Turns one file into an immutable `FileFacts` record. Ingestion is a pure
//! transform of bytes to facts with no shared state, so any number of
//! ingestors may run in parallel.
//!
//! ## Pipeline
//!
//! ```text
//! bytes → binary check → SourceScanner::scan → tokenize
//!       → imports → exports → call sites → empty handlers → FileFacts
//! ```
//!
//! ## Failure Handling
//!
//! Ingestion never throws on bad input. Binary content, unreadable files and
//! malformed literals or brackets produce `parse_ok = false` with a reason in
//! `parse_error`; in the last case the extracted facts are still kept.

#ifndef STRATA_INGEST_SOURCE_INGESTOR_HPP
#define STRATA_INGEST_SOURCE_INGESTOR_HPP

#include "strata/ingest/file_facts.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace strata::ingest {

/// Options shared by every ingestion of a run.
struct IngestOptions {
    /// Call-site wildcard patterns denoting I/O primitives, per language.
    std::map<Language, std::vector<std::string>> io_deny_calls;
};

class SourceIngestor {
public:
    explicit SourceIngestor(IngestOptions options) : options_(std::move(options)) {}

    /// Extracts facts from in-memory content. `path` is the root-relative path.
    [[nodiscard]] auto ingest(const std::string& path, std::string_view content) const
        -> FileFacts;

    /// Reads `root / rel_path` and ingests it. A read failure yields a
    /// `parse_ok = false` record.
    [[nodiscard]] auto ingest_file(const std::filesystem::path& root,
                                   const std::string& rel_path) const -> FileFacts;

    [[nodiscard]] auto options() const -> const IngestOptions& {
        return options_;
    }

private:
    IngestOptions options_;
};

} // namespace strata::ingest

#endif // STRATA_INGEST_SOURCE_INGESTOR_HPP
