//! # Module Graph Assembly
//!
//! Indexes a finished arena, verifies its edges and runs cycle detection.
//! Used by the builder and directly by tests that need hand-made graphs.

#include "strata/graph/module_graph.hpp"

#include "strata/log/log.hpp"

#include <algorithm>
#include <tuple>

namespace strata::graph {

auto edge_kind_name(EdgeKind kind) -> const char* {
    switch (kind) {
    case EdgeKind::Direct:
        return "direct";
    case EdgeKind::Internal:
        return "internal";
    }
    return "unknown";
}

auto default_root_mappings() -> std::vector<RootMapping> {
    return {{"@/", ""}, {"~/", ""}, {"crate/", "src/"}, {"", ""}};
}

auto ModuleGraph::assemble(std::vector<Module> modules, std::vector<DependencyEdge> edges,
                           std::vector<AmbiguousImport> ambiguous,
                           const std::vector<std::pair<std::string, std::string>>& cycle_allow)
    -> ModuleGraph {
    ModuleGraph graph;
    graph.modules_ = std::move(modules);
    graph.ambiguous_ = std::move(ambiguous);

    const size_t n = graph.modules_.size();
    for (size_t i = 0; i < n; ++i) {
        const auto& path = graph.modules_[i].path;
        if (i > 0 && !(graph.modules_[i - 1].path < path)) {
            throw InternalError("module arena not sorted by path at '" + path + "'");
        }
        graph.index_.emplace(path, i);
    }

    for (const auto& edge : edges) {
        if (edge.from >= n || edge.to >= n) {
            throw InternalError("dangling edge " + std::to_string(edge.from) + " -> " +
                                std::to_string(edge.to) + " in a graph of " + std::to_string(n) +
                                " modules");
        }
        if (edge.from == edge.to) {
            throw InternalError("self-edge on '" + graph.modules_[edge.from].path + "'");
        }
    }
    for (const auto& amb : graph.ambiguous_) {
        if (amb.module >= n) {
            throw InternalError("ambiguous import recorded on missing module " +
                                std::to_string(amb.module));
        }
    }

    std::stable_sort(edges.begin(), edges.end(),
                     [](const DependencyEdge& a, const DependencyEdge& b) {
                         return std::tie(a.from, a.to) < std::tie(b.from, b.to);
                     });
    graph.edges_ = std::move(edges);

    graph.out_.assign(n, {});
    for (size_t e = 0; e < graph.edges_.size(); ++e) {
        graph.out_[graph.edges_[e].from].push_back(e);
    }

    for (const auto& [a, b] : cycle_allow) {
        auto ia = graph.find(a);
        auto ib = graph.find(b);
        if (ia && ib) {
            graph.cycle_allow_.emplace(std::min(*ia, *ib), std::max(*ia, *ib));
        } else {
            STRATA_LOG_DEBUG("graph", "Cycle allow-list pair " << a << " <-> " << b
                                                               << " names a missing module");
        }
    }

    std::vector<std::vector<size_t>> adjacency(n);
    for (const auto& edge : graph.edges_) {
        if (graph.counts_for_cycles(edge)) {
            adjacency[edge.from].push_back(edge.to);
        }
    }
    graph.cycles_ = strongly_connected_components(n, adjacency);

    for (const auto& group : graph.cycles_) {
        STRATA_LOG_DEBUG("graph", "Cycle of " << group.size() << " modules through "
                                              << graph.modules_[group.front()].path);
    }
    return graph;
}

auto ModuleGraph::out_edges(size_t module) const -> const std::vector<size_t>& {
    if (module >= out_.size()) {
        throw InternalError("out_edges on missing module " + std::to_string(module));
    }
    return out_[module];
}

auto ModuleGraph::counts_for_cycles(const DependencyEdge& edge) const -> bool {
    return cycle_allow_.count({std::min(edge.from, edge.to), std::max(edge.from, edge.to)}) == 0;
}

auto ModuleGraph::find(const std::string& path) const -> std::optional<size_t> {
    auto it = index_.find(path);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto ModuleGraph::external_dep_count() const -> size_t {
    size_t count = 0;
    for (const auto& module : modules_) {
        count += module.external_deps.size();
    }
    return count;
}

void ModuleGraph::assign_layers(const std::vector<policy::Layer>& layers) {
    if (classified_) {
        throw InternalError("module layers assigned twice");
    }
    if (layers.size() != modules_.size()) {
        throw InternalError("layer assignment for " + std::to_string(layers.size()) +
                            " modules in a graph of " + std::to_string(modules_.size()));
    }
    for (size_t i = 0; i < layers.size(); ++i) {
        modules_[i].layer = layers[i];
    }
    classified_ = true;
}

} // namespace strata::graph
