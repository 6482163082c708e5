//! # Source Ingestor Implementation
//!
//! Drives the scanner and the per-language extractors, and hosts the token
//! helpers they share.

#include "strata/ingest/source_ingestor.hpp"

#include "ingest/extract_internal.hpp"
#include "strata/ingest/source_scanner.hpp"
#include "strata/log/log.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace strata::ingest {

namespace detail {

auto Extraction::at(size_t i) const -> const Token& {
    static const Token END{TokenKind::Punct, "", 0, 0, 0, 0, false, nullptr};
    return i < tokens.size() ? tokens[i] : END;
}

auto find_matching(const Extraction& ex, size_t open) -> size_t {
    const auto& tok = ex.at(open);
    std::string_view close;
    if (tok.is_punct("(")) {
        close = ")";
    } else if (tok.is_punct("[")) {
        close = "]";
    } else if (tok.is_punct("{")) {
        close = "}";
    } else {
        return NPOS;
    }
    int depth = 0;
    for (size_t k = open; k < ex.size(); ++k) {
        const auto& t = ex.at(k);
        if (t.kind != TokenKind::Punct) {
            continue;
        }
        if (t.text == tok.text) {
            ++depth;
        } else if (t.text == close && --depth == 0) {
            return k;
        }
    }
    return NPOS;
}

auto dotted_to_slash(std::string_view dotted) -> std::string {
    std::string out(dotted);
    for (auto& c : out) {
        if (c == '.') {
            c = '/';
        }
    }
    return out;
}

auto starts_upper(std::string_view name) -> bool {
    return !name.empty() && std::isupper(static_cast<unsigned char>(name.front()));
}

} // namespace detail

auto SourceIngestor::ingest(const std::string& path, std::string_view content) const -> FileFacts {
    FileFacts facts;
    facts.path = path;

    auto lang = language_from_path(path);
    if (!lang) {
        facts.parse_ok = false;
        facts.parse_error = "unsupported file type";
        return facts;
    }
    facts.language = *lang;

    if (content.find('\0') != std::string_view::npos) {
        facts.parse_ok = false;
        facts.parse_error = "binary content";
        STRATA_LOG_DEBUG("ingest", "Skipping binary file " << path);
        return facts;
    }

    SourceScanner scanner(facts.language);
    auto scan = scanner.scan(content);
    auto tokens = SourceScanner::tokenize(scan);
    if (!scan.ok) {
        facts.parse_ok = false;
        facts.parse_error = scan.error;
    }

    detail::Extraction ex{facts.path, facts.language, scan, tokens};
    detail::extract_imports(ex, facts);
    detail::extract_exports(ex, facts);

    static const std::vector<std::string> NO_PATTERNS;
    auto deny = options_.io_deny_calls.find(facts.language);
    detail::extract_calls(ex, deny != options_.io_deny_calls.end() ? deny->second : NO_PATTERNS,
                          facts);
    detail::extract_empty_handlers(ex, facts);

    STRATA_LOG_TRACE("ingest", path << ": " << facts.imports.size() << " imports, "
                                    << facts.exports.size() << " exports, "
                                    << facts.call_site_count << " calls, "
                                    << facts.io_call_sites.size() << " I/O calls"
                                    << (facts.parse_ok ? "" : " (parse error: " +
                                                                  facts.parse_error + ")"));
    return facts;
}

auto SourceIngestor::ingest_file(const std::filesystem::path& root,
                                 const std::string& rel_path) const -> FileFacts {
    std::ifstream file(root / rel_path, std::ios::binary);
    if (!file) {
        FileFacts facts;
        facts.path = rel_path;
        facts.language = language_from_path(rel_path).value_or(Language::Cpp);
        facts.parse_ok = false;
        facts.parse_error = "cannot read file";
        STRATA_LOG_WARN("ingest", "Cannot read " << (root / rel_path).string());
        return facts;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return ingest(rel_path, buffer.str());
}

} // namespace strata::ingest
