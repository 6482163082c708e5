//! # Module Graph
//!
//! The dependency graph of an analyzed tree: one `Module` per ingested file
//! (an arena ordered by path) and index-based `DependencyEdge`s between them.
//! Cycles are ordinary input; the builder finds them with Tarjan's algorithm.
//!
//! ## Import Resolution
//!
//! Each `ImportRef` of a module is resolved in order:
//!
//! | Step | Specifier form                  | Resolved against               | Edge kind  |
//! |------|---------------------------------|--------------------------------|------------|
//! | (a)  | local (`./x`, `../x`, `"x.h"`)  | importing file's directory     | `Direct`   |
//! | (b)  | anything else                   | ordered root-mapping table     | `Internal` |
//! | (c)  | unresolved                      | recorded as external dependency| none       |
//!
//! Local specifiers that are not explicitly relative (C/C++ quoted includes)
//! fall back to the root mappings when the directory lookup finds nothing.
//!
//! Candidates for a base path `B`: the module whose path is exactly `B`;
//! otherwise every module whose path without extension is `B` or
//! `B/<index name>`. Two or more candidates make the import ambiguous: it is
//! kept external and recorded in `ambiguous()`.
//!
//! Package imports (Go, Java `.*`) resolve to a directory and produce one
//! edge per non-test module directly inside it.
//!
//! ## Determinism
//!
//! Modules are sorted by path, edges by `(from, to)`, cycle groups by their
//! smallest module index. The graph is a pure function of the input paths
//! and their facts.

#ifndef STRATA_GRAPH_MODULE_GRAPH_HPP
#define STRATA_GRAPH_MODULE_GRAPH_HPP

#include "strata/common.hpp"
#include "strata/ingest/file_facts.hpp"
#include "strata/policy/layer.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace strata::graph {

// ============================================================================
// Graph Types
// ============================================================================

enum class EdgeKind : uint8_t {
    Direct,  ///< Resolved relative to the importing file
    Internal ///< Resolved through the root-mapping table
};

[[nodiscard]] auto edge_kind_name(EdgeKind kind) -> const char*;

/// A directed dependency between two modules of the arena.
struct DependencyEdge {
    size_t from = 0;
    size_t to = 0;
    EdgeKind kind = EdgeKind::Direct;
    uint32_t line = 0;                 ///< First importing line
    std::string specifier;             ///< Raw specifier of that import
    std::set<std::string> symbols;     ///< Union over merged imports
    bool package_edge = false;         ///< Came from a directory-level import
};

/// An import that did not resolve inside the root.
struct ExternalDep {
    std::string specifier;
    uint32_t line = 0;
};

/// An import with more than one candidate module.
struct AmbiguousImport {
    size_t module = 0;
    std::string specifier;
    uint32_t line = 0;
    std::vector<std::string> candidates;
};

/// A graph node: one ingested file.
struct Module {
    std::string path;
    policy::Layer layer = policy::Layer::Unclassified;
    /// Directory of the feature the module belongs to, if any.
    std::optional<std::string> feature;
    ingest::FileFacts facts;
    std::vector<ExternalDep> external_deps;
};

/// One entry of the root-mapping table: specifiers starting with `prefix`
/// resolve to `target` followed by the rest of the specifier.
struct RootMapping {
    std::string prefix;
    std::string target;
};

/// `@/`, `~/` and the empty prefix map to the root; `crate/` maps to `src/`.
[[nodiscard]] auto default_root_mappings() -> std::vector<RootMapping>;

struct GraphOptions {
    std::vector<RootMapping> root_mappings = default_root_mappings();
    std::vector<std::string> index_names = {"index", "__init__", "mod"};
    /// Unordered module path pairs whose mutual edges are ignored by cycle detection.
    std::vector<std::pair<std::string, std::string>> cycle_allow;
    /// Directory holding one subdirectory per feature; empty for the root.
    std::string features_root;
};

// ============================================================================
// Module Graph
// ============================================================================

class ModuleGraph {
public:
    /// Assembles a graph from a path-sorted module arena and its edges: sorts
    /// and indexes the edges and runs cycle detection over those not between
    /// an allow-listed pair.
    ///
    /// Throws `InternalError` when the modules are not sorted and unique, or
    /// an edge is dangling or a self-edge.
    [[nodiscard]] static auto assemble(
        std::vector<Module> modules, std::vector<DependencyEdge> edges,
        std::vector<AmbiguousImport> ambiguous = {},
        const std::vector<std::pair<std::string, std::string>>& cycle_allow = {}) -> ModuleGraph;

    [[nodiscard]] auto modules() const -> const std::vector<Module>& {
        return modules_;
    }
    [[nodiscard]] auto edges() const -> const std::vector<DependencyEdge>& {
        return edges_;
    }
    [[nodiscard]] auto ambiguous() const -> const std::vector<AmbiguousImport>& {
        return ambiguous_;
    }
    /// Circular-dependency groups: sorted module indices, more than one each.
    [[nodiscard]] auto cycles() const -> const std::vector<std::vector<size_t>>& {
        return cycles_;
    }

    /// Indices into `edges()` of the edges leaving `module`, in target order.
    [[nodiscard]] auto out_edges(size_t module) const -> const std::vector<size_t>&;

    /// True when the edge takes part in cycle detection (not allow-listed).
    [[nodiscard]] auto counts_for_cycles(const DependencyEdge& edge) const -> bool;

    [[nodiscard]] auto find(const std::string& path) const -> std::optional<size_t>;

    [[nodiscard]] auto external_dep_count() const -> size_t;

    /// Sets every module's layer, once. `layers` is parallel to `modules()`.
    /// Throws `InternalError` on a size mismatch or a second call.
    void assign_layers(const std::vector<policy::Layer>& layers);

    [[nodiscard]] auto is_classified() const -> bool {
        return classified_;
    }

private:
    std::vector<Module> modules_;
    std::vector<DependencyEdge> edges_;
    std::vector<std::vector<size_t>> out_;
    std::vector<AmbiguousImport> ambiguous_;
    std::vector<std::vector<size_t>> cycles_;
    std::set<std::pair<size_t, size_t>> cycle_allow_;
    std::map<std::string, size_t> index_;
    bool classified_ = false;
};

// ============================================================================
// Builder
// ============================================================================

class ModuleGraphBuilder {
public:
    explicit ModuleGraphBuilder(GraphOptions options) : options_(std::move(options)) {}

    /// Builds the graph from the complete fact set of a run and fills each
    /// import's `resolved_path`. Duplicate `from -> to` edges are merged,
    /// keeping the first import line.
    [[nodiscard]] auto build(std::vector<ingest::FileFacts> facts) const -> ModuleGraph;

    [[nodiscard]] auto options() const -> const GraphOptions& {
        return options_;
    }

private:
    GraphOptions options_;
};

/// Tarjan's algorithm over `n` nodes. Returns every component with more
/// than one node, each sorted, ordered by smallest member.
[[nodiscard]] auto strongly_connected_components(size_t n,
                                                 const std::vector<std::vector<size_t>>& adjacency)
    -> std::vector<std::vector<size_t>>;

} // namespace strata::graph

#endif // STRATA_GRAPH_MODULE_GRAPH_HPP
