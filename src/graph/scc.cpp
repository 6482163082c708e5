//! # Strongly Connected Components
//!
//! Iterative Tarjan's algorithm. An explicit frame stack replaces recursion
//! so deep import chains cannot overflow the call stack.

#include "strata/graph/module_graph.hpp"

#include <algorithm>
#include <limits>

namespace strata::graph {

auto strongly_connected_components(size_t n, const std::vector<std::vector<size_t>>& adjacency)
    -> std::vector<std::vector<size_t>> {
    constexpr size_t UNVISITED = std::numeric_limits<size_t>::max();

    std::vector<size_t> index(n, UNVISITED);
    std::vector<size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<size_t> stack;
    std::vector<std::vector<size_t>> components;
    size_t next_index = 0;

    struct Frame {
        size_t node;
        size_t next_edge;
    };
    std::vector<Frame> frames;

    for (size_t root = 0; root < n; ++root) {
        if (index[root] != UNVISITED) {
            continue;
        }
        frames.push_back({root, 0});
        index[root] = lowlink[root] = next_index++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!frames.empty()) {
            auto& frame = frames.back();
            size_t v = frame.node;

            if (frame.next_edge < adjacency[v].size()) {
                size_t w = adjacency[v][frame.next_edge++];
                if (index[w] == UNVISITED) {
                    index[w] = lowlink[w] = next_index++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    frames.push_back({w, 0}); // invalidates `frame`
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            // All successors done
            if (lowlink[v] == index[v]) {
                std::vector<size_t> component;
                size_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != v);
                if (component.size() > 1) {
                    std::sort(component.begin(), component.end());
                    components.push_back(std::move(component));
                }
            }
            frames.pop_back();
            if (!frames.empty()) {
                size_t parent = frames.back().node;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
        }
    }

    std::sort(components.begin(), components.end(),
              [](const auto& a, const auto& b) { return a.front() < b.front(); });
    return components;
}

} // namespace strata::graph
