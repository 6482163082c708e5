//! # Module Graph Builder
//!
//! Resolves every `ImportRef` of the fact set into edges or external
//! dependencies, then hands the arena to `ModuleGraph::assemble`.
//!
//! ## Lookup Tables
//!
//! | Table     | Key                                   | Used for                 |
//! |-----------|---------------------------------------|--------------------------|
//! | `exact`   | module path                           | `#include "a/b.h"`       |
//! | `by_stem` | path without extension                | `./util`, `a/b/C`        |
//! | `by_dir`  | parent directory                      | Go and Java packages     |
//!
//! ## Language Adjustments
//!
//! - C/C++: includes name files, so only exact paths match
//! - JS/TS: `./x.js` also matches `x.ts` (the extension is dropped on a miss)
//! - Python: `from .pkg import mod` tries `pkg/mod` before `pkg`
//! - Rust: `use crate::a::Item` retries without the last segment

#include "strata/graph/module_graph.hpp"

#include "strata/log/log.hpp"

#include <algorithm>
#include <filesystem>
#include <unordered_map>

namespace strata::graph {

namespace {

using ingest::FileFacts;
using ingest::ImportRef;
using ingest::Language;

/// Lexically normalised slash path; "" for the root, a leading `..` when
/// the path escapes it.
auto normalize(const std::string& path) -> std::string {
    if (path.empty()) {
        return "";
    }
    auto out = std::filesystem::path(path).lexically_normal().generic_string();
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    if (out == ".") {
        return "";
    }
    return out;
}

auto join(const std::string& dir, std::string_view rest) -> std::string {
    if (dir.empty()) {
        return std::string(rest);
    }
    if (rest.empty()) {
        return dir;
    }
    return dir + "/" + std::string(rest);
}

auto parent_dir(const std::string& path) -> std::string {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

auto strip_extension(const std::string& path) -> std::string {
    auto slash = path.rfind('/');
    auto dot = path.rfind('.');
    size_t name_start = slash == std::string::npos ? 0 : slash + 1;
    if (dot == std::string::npos || dot <= name_start) {
        return path;
    }
    return path.substr(0, dot);
}

auto escapes_root(const std::string& path) -> bool {
    return path == ".." || path.starts_with("../") || path.starts_with("/");
}

auto is_relative(std::string_view spec) -> bool {
    return spec == "." || spec == ".." || spec.starts_with("./") || spec.starts_with("../");
}

auto is_test_file(const std::string& path, Language lang) -> bool {
    return lang == Language::Go && path.ends_with("_test.go");
}

// ============================================================================
// Resolver
// ============================================================================

struct Lookup {
    enum class Outcome { Missing, Unique, Ambiguous };
    Outcome outcome = Outcome::Missing;
    std::vector<size_t> targets;
    std::string base;
};

class Resolver {
public:
    Resolver(const std::vector<FileFacts>& facts, const GraphOptions& options)
        : facts_(facts), options_(options) {
        for (size_t i = 0; i < facts.size(); ++i) {
            const auto& path = facts[i].path;
            exact_.emplace(path, i);
            by_stem_[strip_extension(path)].push_back(i);
            by_dir_[parent_dir(path)].push_back(i);
        }
    }

    /// Modules named by base path `base`.
    auto candidates(const std::string& base) const -> Lookup {
        Lookup result;
        result.base = base;
        if (escapes_root(base)) {
            return result;
        }
        if (auto it = exact_.find(base); it != exact_.end()) {
            result.outcome = Lookup::Outcome::Unique;
            result.targets.push_back(it->second);
            return result;
        }
        std::vector<size_t> found;
        if (!base.empty()) {
            append(found, base);
        }
        for (const auto& index_name : options_.index_names) {
            append(found, join(base, index_name));
        }
        std::sort(found.begin(), found.end());
        found.erase(std::unique(found.begin(), found.end()), found.end());
        if (found.size() == 1) {
            result.outcome = Lookup::Outcome::Unique;
        } else if (found.size() > 1) {
            result.outcome = Lookup::Outcome::Ambiguous;
        }
        result.targets = std::move(found);
        return result;
    }

    /// Only the module whose path is exactly `base`.
    auto exact(const std::string& base) const -> Lookup {
        Lookup result;
        result.base = base;
        if (auto it = exact_.find(base); it != exact_.end()) {
            result.outcome = Lookup::Outcome::Unique;
            result.targets.push_back(it->second);
        }
        return result;
    }

    /// Non-test modules directly inside directory `base`.
    auto package(const std::string& base) const -> Lookup {
        Lookup result;
        result.base = base;
        if (escapes_root(base)) {
            return result;
        }
        auto it = by_dir_.find(base);
        if (it == by_dir_.end()) {
            return result;
        }
        for (size_t i : it->second) {
            if (!is_test_file(facts_[i].path, facts_[i].language)) {
                result.targets.push_back(i);
            }
        }
        if (!result.targets.empty()) {
            result.outcome = Lookup::Outcome::Unique;
        }
        return result;
    }

    /// Applies the language adjustments around `candidates()`.
    auto lookup(const std::string& base, const ImportRef& ref, Language lang) const -> Lookup {
        if (ref.package_import) {
            return package(base);
        }
        if (lang == Language::Cpp) {
            return exact(base);
        }

        if (lang == Language::Python && !ref.symbols.empty()) {
            Lookup submodules;
            for (const auto& symbol : ref.symbols) {
                auto sub = candidates(normalize(join(base, symbol)));
                if (sub.outcome == Lookup::Outcome::Ambiguous) {
                    return sub;
                }
                if (sub.outcome == Lookup::Outcome::Unique) {
                    submodules.outcome = Lookup::Outcome::Unique;
                    submodules.base = sub.base;
                    submodules.targets.push_back(sub.targets.front());
                }
            }
            if (submodules.outcome == Lookup::Outcome::Unique) {
                return submodules;
            }
        }

        auto found = candidates(base);
        if (found.outcome != Lookup::Outcome::Missing) {
            return found;
        }

        if ((lang == Language::JavaScript || lang == Language::TypeScript) &&
            strip_extension(base) != base) {
            auto stem = strip_extension(base);
            auto retry = candidates(stem);
            if (retry.outcome != Lookup::Outcome::Missing) {
                return retry;
            }
        }

        if (lang == Language::Rust && base.find('/') != std::string::npos) {
            return candidates(parent_dir(base));
        }
        return found;
    }

private:
    void append(std::vector<size_t>& out, const std::string& stem) const {
        auto it = by_stem_.find(stem);
        if (it != by_stem_.end()) {
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }

    const std::vector<FileFacts>& facts_;
    const GraphOptions& options_;
    std::unordered_map<std::string, size_t> exact_;
    std::unordered_map<std::string, std::vector<size_t>> by_stem_;
    std::unordered_map<std::string, std::vector<size_t>> by_dir_;
};

struct Resolution {
    Lookup lookup;
    EdgeKind kind = EdgeKind::Direct;
};

auto resolve(const Resolver& resolver, const GraphOptions& options, const FileFacts& importer,
             const ImportRef& ref) -> Resolution {
    const auto& spec = ref.raw_specifier;
    Resolution res;

    // (a) Local to the importing file
    if (ref.local_form) {
        res.kind = EdgeKind::Direct;
        res.lookup = resolver.lookup(normalize(join(parent_dir(importer.path), spec)), ref,
                                     importer.language);
        if (res.lookup.outcome != Lookup::Outcome::Missing || is_relative(spec)) {
            return res;
        }
    }

    // (b) Root-mapping table, first productive mapping wins
    res.kind = EdgeKind::Internal;
    for (const auto& mapping : options.root_mappings) {
        if (!spec.starts_with(mapping.prefix)) {
            continue;
        }
        auto rest = std::string_view(spec).substr(mapping.prefix.size());
        auto base = normalize(join(mapping.target, rest));
        if (base.empty() && !ref.package_import) {
            continue;
        }
        res.lookup = resolver.lookup(base, ref, importer.language);
        if (res.lookup.outcome != Lookup::Outcome::Missing) {
            return res;
        }
    }

    // (c) External
    res.lookup = Lookup{};
    return res;
}

/// Feature directory of `path` under `features_root`, if any.
auto feature_of(const std::string& path, const std::string& features_root)
    -> std::optional<std::string> {
    std::string_view rest = path;
    if (!features_root.empty()) {
        if (!path.starts_with(features_root + "/")) {
            return std::nullopt;
        }
        rest.remove_prefix(features_root.size() + 1);
    }
    auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }
    return join(features_root, rest.substr(0, slash));
}

} // namespace

// ============================================================================
// Build
// ============================================================================

auto ModuleGraphBuilder::build(std::vector<ingest::FileFacts> facts) const -> ModuleGraph {
    std::sort(facts.begin(), facts.end(),
              [](const FileFacts& a, const FileFacts& b) { return a.path < b.path; });

    auto features_root = normalize(options_.features_root);
    Resolver resolver(facts, options_);

    std::vector<Module> modules;
    modules.reserve(facts.size());
    std::vector<DependencyEdge> edges;
    std::vector<AmbiguousImport> ambiguous;
    std::map<std::pair<size_t, size_t>, size_t> edge_index;

    for (size_t i = 0; i < facts.size(); ++i) {
        Module module;
        module.path = facts[i].path;
        module.feature = feature_of(module.path, features_root);

        for (auto& ref : facts[i].imports) {
            auto res = resolve(resolver, options_, facts[i], ref);

            if (res.lookup.outcome == Lookup::Outcome::Ambiguous) {
                AmbiguousImport amb;
                amb.module = i;
                amb.specifier = ref.raw_specifier;
                amb.line = ref.line;
                for (size_t t : res.lookup.targets) {
                    amb.candidates.push_back(facts[t].path);
                }
                STRATA_LOG_DEBUG("graph", "Ambiguous import '" << ref.raw_specifier << "' in "
                                                              << module.path << ":" << ref.line
                                                              << " (" << amb.candidates.size()
                                                              << " candidates)");
                ambiguous.push_back(std::move(amb));
                module.external_deps.push_back({ref.raw_specifier, ref.line});
                continue;
            }
            if (res.lookup.outcome == Lookup::Outcome::Missing) {
                module.external_deps.push_back({ref.raw_specifier, ref.line});
                continue;
            }

            ref.resolved_path = ref.package_import || res.lookup.targets.size() > 1
                                    ? res.lookup.base
                                    : facts[res.lookup.targets.front()].path;

            for (size_t target : res.lookup.targets) {
                if (target == i) {
                    continue;
                }
                auto key = std::make_pair(i, target);
                if (auto it = edge_index.find(key); it != edge_index.end()) {
                    edges[it->second].symbols.insert(ref.symbols.begin(), ref.symbols.end());
                    continue;
                }
                DependencyEdge edge;
                edge.from = i;
                edge.to = target;
                edge.kind = res.kind;
                edge.line = ref.line;
                edge.specifier = ref.raw_specifier;
                edge.symbols = ref.symbols;
                edge.package_edge = ref.package_import;
                STRATA_LOG_TRACE("graph", module.path << " -> " << facts[target].path << " ("
                                                      << edge_kind_name(edge.kind) << ", line "
                                                      << edge.line << ")");
                edge_index.emplace(key, edges.size());
                edges.push_back(std::move(edge));
            }
        }
        modules.push_back(std::move(module));
    }

    for (size_t i = 0; i < facts.size(); ++i) {
        modules[i].facts = std::move(facts[i]);
    }

    auto graph = ModuleGraph::assemble(std::move(modules), std::move(edges), std::move(ambiguous),
                                       options_.cycle_allow);
    STRATA_LOG_DEBUG("graph", "Built graph: " << graph.modules().size() << " modules, "
                                              << graph.edges().size() << " edges, "
                                              << graph.external_dep_count()
                                              << " external dependencies, "
                                              << graph.cycles().size() << " cycles");
    return graph;
}

} // namespace strata::graph
