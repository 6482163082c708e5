//! # Source Discovery
//!
//! Walks the analyzed root and collects files with a known language.
//!
//! ## Discovery Rules
//!
//! - Regular files whose extension maps to a `Language`
//! - Paths matching any ignore glob are skipped
//! - An ignored directory is pruned without descending into it
//! - Unreadable directories are logged and skipped

#include "strata/ingest/ingest_pool.hpp"
#include "strata/log/log.hpp"
#include "strata/policy/glob.hpp"

#include <algorithm>
#include <system_error>

namespace strata::ingest {

namespace {

auto is_ignored(const std::vector<policy::Glob>& globs, const std::string& rel) -> bool {
    return std::any_of(globs.begin(), globs.end(),
                       [&](const policy::Glob& g) { return g.matches(rel); });
}

} // namespace

std::vector<std::string> discover_sources(const fs::path& root,
                                          const std::vector<std::string>& ignore) {
    std::vector<policy::Glob> globs;
    for (const auto& pattern : ignore) {
        auto glob = policy::Glob::compile(pattern);
        if (is_ok(glob)) {
            globs.push_back(std::move(unwrap(glob)));
        }
    }

    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        STRATA_LOG_WARN("ingest", "Not a directory: " << root.string());
        return files;
    }

    auto it = fs::recursive_directory_iterator(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        STRATA_LOG_WARN("ingest", "Cannot access " << root.string() << ": " << ec.message());
        return files;
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            STRATA_LOG_WARN("ingest", "Cannot access entry under " << root.string() << ": "
                                                                  << ec.message());
            ec.clear();
            continue;
        }
        const auto& entry = *it;
        auto rel = entry.path().lexically_relative(root).generic_string();

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            // A probe child lets `dir/**` style globs prune the directory itself
            if (is_ignored(globs, rel) || is_ignored(globs, rel + "/_")) {
                STRATA_LOG_TRACE("ingest", "Pruning " << rel);
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(type_ec) || !language_from_path(rel)) {
            continue;
        }
        if (is_ignored(globs, rel)) {
            STRATA_LOG_TRACE("ingest", "Ignoring " << rel);
            continue;
        }
        files.push_back(std::move(rel));
    }

    std::sort(files.begin(), files.end());
    STRATA_LOG_DEBUG("ingest", "Discovered " << files.size() << " source files under "
                                             << root.string());
    return files;
}

} // namespace strata::ingest
