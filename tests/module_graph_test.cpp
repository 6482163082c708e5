//! # Module Graph Tests
//!
//! Import resolution (relative, index files, root mappings, packages),
//! edge merging, external and ambiguous imports, cycle detection with the
//! allow-list, and the arena invariants enforced by `assemble`.

#include "strata/graph/module_graph.hpp"
#include "strata/ingest/source_ingestor.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace strata;
using namespace strata::graph;
using ingest::FileFacts;

namespace {

class ModuleGraphTest : public ::testing::Test {
protected:
    ingest::SourceIngestor ingestor{ingest::IngestOptions{}};
    std::vector<FileFacts> files;
    GraphOptions options;

    void add(const std::string& path, const std::string& content) {
        files.push_back(ingestor.ingest(path, content));
    }

    ModuleGraph build() {
        return ModuleGraphBuilder(options).build(files);
    }

    static const DependencyEdge* edge(const ModuleGraph& g, const std::string& from,
                                      const std::string& to) {
        auto f = g.find(from);
        auto t = g.find(to);
        if (!f || !t) {
            return nullptr;
        }
        for (size_t e : g.out_edges(*f)) {
            if (g.edges()[e].to == *t) {
                return &g.edges()[e];
            }
        }
        return nullptr;
    }
};

Module make_module(const std::string& path) {
    Module m;
    m.path = path;
    m.facts.path = path;
    return m;
}

DependencyEdge link(size_t from, size_t to) {
    DependencyEdge e;
    e.from = from;
    e.to = to;
    e.line = 1;
    return e;
}

} // namespace

// ============================================================================
// Resolution
// ============================================================================

TEST_F(ModuleGraphTest, RelativeImportIsDirectEdge) {
    add("src/domain/order.ts", "import { Line } from './line';\n");
    add("src/domain/line.ts", "export interface Line {}\n");
    auto g = build();

    ASSERT_EQ(g.modules().size(), 2u);
    EXPECT_EQ(g.modules()[0].path, "src/domain/line.ts");

    const auto* e = edge(g, "src/domain/order.ts", "src/domain/line.ts");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->kind, EdgeKind::Direct);
    EXPECT_EQ(e->line, 1u);
    EXPECT_EQ(e->symbols.count("Line"), 1u);

    const auto& order = g.modules()[*g.find("src/domain/order.ts")];
    ASSERT_EQ(order.facts.imports.size(), 1u);
    EXPECT_EQ(order.facts.imports[0].resolved_path, "src/domain/line.ts");
}

TEST_F(ModuleGraphTest, DirectoryImportUsesIndexFile) {
    add("src/app.ts", "import { x } from './shared';\n");
    add("src/shared/index.ts", "export const x = 1;\n");
    auto g = build();
    EXPECT_NE(edge(g, "src/app.ts", "src/shared/index.ts"), nullptr);
}

TEST_F(ModuleGraphTest, JsExtensionMatchesTypeScriptSource) {
    add("src/app.ts", "import { x } from './util.js';\n");
    add("src/util.ts", "export const x = 1;\n");
    auto g = build();
    EXPECT_NE(edge(g, "src/app.ts", "src/util.ts"), nullptr);
}

TEST_F(ModuleGraphTest, RootMappingGivesInternalEdge) {
    add("src/presentation/page.ts", "import { place } from '@/src/domain/order';\n");
    add("src/domain/order.ts", "export function place() {}\n");
    auto g = build();

    const auto* e = edge(g, "src/presentation/page.ts", "src/domain/order.ts");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->kind, EdgeKind::Internal);
}

TEST_F(ModuleGraphTest, CustomRootMapping) {
    options.root_mappings.insert(options.root_mappings.begin(), RootMapping{"@app/", "src/"});
    add("src/ui/page.ts", "import { place } from '@app/domain/order';\n");
    add("src/domain/order.ts", "export function place() {}\n");
    auto g = build();
    EXPECT_NE(edge(g, "src/ui/page.ts", "src/domain/order.ts"), nullptr);
}

TEST_F(ModuleGraphTest, UnresolvedImportIsExternal) {
    add("src/app.ts", "import React from 'react';\nimport { a } from './missing';\n");
    auto g = build();

    EXPECT_TRUE(g.edges().empty());
    ASSERT_EQ(g.modules()[0].external_deps.size(), 2u);
    EXPECT_EQ(g.modules()[0].external_deps[0].specifier, "react");
    EXPECT_EQ(g.external_dep_count(), 2u);
    EXPECT_FALSE(g.modules()[0].facts.imports[0].resolved_path.has_value());
}

TEST_F(ModuleGraphTest, EscapingRootIsExternal) {
    add("src/app.ts", "import { a } from '../../outside';\n");
    auto g = build();
    EXPECT_TRUE(g.edges().empty());
    EXPECT_EQ(g.external_dep_count(), 1u);
}

TEST_F(ModuleGraphTest, AmbiguousImportRecorded) {
    add("src/app.ts", "import { a } from './util';\n");
    add("src/util.ts", "export const a = 1;\n");
    add("src/util/index.ts", "export const a = 2;\n");
    auto g = build();

    EXPECT_TRUE(g.edges().empty());
    ASSERT_EQ(g.ambiguous().size(), 1u);
    const auto& amb = g.ambiguous()[0];
    EXPECT_EQ(g.modules()[amb.module].path, "src/app.ts");
    EXPECT_EQ(amb.specifier, "./util");
    EXPECT_EQ(amb.candidates,
              (std::vector<std::string>{"src/util.ts", "src/util/index.ts"}));
}

TEST_F(ModuleGraphTest, DuplicateImportsMergeIntoOneEdge) {
    add("src/a.ts", "import { x } from './b';\n\nimport { y } from './b';\n");
    add("src/b.ts", "export const x = 1;\nexport const y = 2;\n");
    auto g = build();

    ASSERT_EQ(g.edges().size(), 1u);
    EXPECT_EQ(g.edges()[0].line, 1u);
    EXPECT_EQ(g.edges()[0].symbols, (std::set<std::string>{"x", "y"}));
}

TEST_F(ModuleGraphTest, SelfImportProducesNoEdge) {
    add("src/a.ts", "import { x } from './a';\nexport const x = 1;\n");
    auto g = build();
    EXPECT_TRUE(g.edges().empty());
    EXPECT_TRUE(g.cycles().empty());
}

TEST_F(ModuleGraphTest, PythonFromImportPrefersSubmodule) {
    add("app/domain/service.py", "from . import model\n");
    add("app/domain/model.py", "class Order:\n    pass\n");
    add("app/domain/__init__.py", "");
    auto g = build();
    EXPECT_NE(edge(g, "app/domain/service.py", "app/domain/model.py"), nullptr);
    EXPECT_EQ(edge(g, "app/domain/service.py", "app/domain/__init__.py"), nullptr);
}

TEST_F(ModuleGraphTest, PythonAbsoluteImport) {
    add("app/service.py", "import app.domain.model\n");
    add("app/domain/model.py", "X = 1\n");
    auto g = build();
    const auto* e = edge(g, "app/service.py", "app/domain/model.py");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->kind, EdgeKind::Internal);
}

TEST_F(ModuleGraphTest, GoPackageImportTargetsEveryFile) {
    options.root_mappings.insert(options.root_mappings.begin(),
                                 RootMapping{"example.com/app/", ""});
    add("cmd/main.go", "package main\n\nimport \"example.com/app/internal/store\"\n");
    add("internal/store/db.go", "package store\n");
    add("internal/store/cache.go", "package store\n");
    add("internal/store/db_test.go", "package store\n");
    auto g = build();

    ASSERT_EQ(g.edges().size(), 2u);
    EXPECT_TRUE(g.edges()[0].package_edge);
    EXPECT_NE(edge(g, "cmd/main.go", "internal/store/db.go"), nullptr);
    EXPECT_NE(edge(g, "cmd/main.go", "internal/store/cache.go"), nullptr);
    EXPECT_EQ(edge(g, "cmd/main.go", "internal/store/db_test.go"), nullptr);
    EXPECT_EQ(g.modules()[*g.find("cmd/main.go")].facts.imports[0].resolved_path,
              "internal/store");
}

TEST_F(ModuleGraphTest, CppIncludeMatchesExactPathOnly) {
    add("app/main.cpp", "#include \"domain/order.hpp\"\n#include <vector>\n");
    add("domain/order.hpp", "struct Order {};\n");
    add("domain/vector.cpp", "int v;\n");
    auto g = build();

    ASSERT_EQ(g.edges().size(), 1u);
    EXPECT_NE(edge(g, "app/main.cpp", "domain/order.hpp"), nullptr);
    EXPECT_EQ(g.external_dep_count(), 1u);
}

TEST_F(ModuleGraphTest, RustCrateImportDropsItemName) {
    add("src/domain/order.rs", "use crate::shared::Clock;\n");
    add("src/shared.rs", "pub struct Clock;\n");
    auto g = build();
    EXPECT_NE(edge(g, "src/domain/order.rs", "src/shared.rs"), nullptr);
}

TEST_F(ModuleGraphTest, FeatureAssignment) {
    options.features_root = "src/features";
    add("src/features/billing/invoice.ts", "");
    add("src/features/billing/index.ts", "");
    add("src/shared/util.ts", "");
    auto g = build();

    EXPECT_EQ(g.modules()[*g.find("src/features/billing/invoice.ts")].feature,
              "src/features/billing");
    EXPECT_FALSE(g.modules()[*g.find("src/shared/util.ts")].feature.has_value());
}

TEST_F(ModuleGraphTest, FeatureAtRootWhenUnset) {
    add("billing/invoice.ts", "");
    add("main.ts", "");
    auto g = build();
    EXPECT_EQ(g.modules()[*g.find("billing/invoice.ts")].feature, "billing");
    EXPECT_FALSE(g.modules()[*g.find("main.ts")].feature.has_value());
}

TEST_F(ModuleGraphTest, InputOrderDoesNotMatter) {
    add("src/a.ts", "import './b';\nimport './c';\n");
    add("src/b.ts", "import './c';\n");
    add("src/c.ts", "import './a';\n");
    auto forward = build();
    std::reverse(files.begin(), files.end());
    auto backward = build();

    ASSERT_EQ(forward.edges().size(), backward.edges().size());
    for (size_t i = 0; i < forward.edges().size(); ++i) {
        EXPECT_EQ(forward.edges()[i].from, backward.edges()[i].from);
        EXPECT_EQ(forward.edges()[i].to, backward.edges()[i].to);
        EXPECT_EQ(forward.edges()[i].line, backward.edges()[i].line);
    }
    EXPECT_EQ(forward.cycles(), backward.cycles());
}

// ============================================================================
// Cycles
// ============================================================================

TEST_F(ModuleGraphTest, DetectsThreeModuleCycle) {
    add("src/a.ts", "import './b';\n");
    add("src/b.ts", "import './c';\n");
    add("src/c.ts", "import './a';\n");
    add("src/d.ts", "import './a';\n");
    auto g = build();

    ASSERT_EQ(g.cycles().size(), 1u);
    EXPECT_EQ(g.cycles()[0], (std::vector<size_t>{0, 1, 2}));
}

TEST_F(ModuleGraphTest, AllowListedPairBreaksCycle) {
    options.cycle_allow = {{"src/b.ts", "src/a.ts"}};
    add("src/a.ts", "import './b';\n");
    add("src/b.ts", "import './a';\n");
    auto g = build();

    EXPECT_EQ(g.edges().size(), 2u);
    EXPECT_TRUE(g.cycles().empty());
    EXPECT_FALSE(g.counts_for_cycles(g.edges()[0]));
}

TEST_F(ModuleGraphTest, AllowListIgnoresBothDirections) {
    options.cycle_allow = {{"src/a.ts", "src/b.ts"}};
    add("src/a.ts", "import './b';\nimport './c';\n");
    add("src/b.ts", "import './a';\n");
    add("src/c.ts", "import './b';\n");
    auto g = build();

    // a <-> b is allow-listed, leaving a -> c -> b without a way back
    EXPECT_TRUE(g.cycles().empty());
}

TEST(SccTest, SeparateComponents) {
    std::vector<std::vector<size_t>> adj = {{1}, {0}, {3}, {4}, {2}, {}};
    auto sccs = strongly_connected_components(6, adj);
    ASSERT_EQ(sccs.size(), 2u);
    EXPECT_EQ(sccs[0], (std::vector<size_t>{0, 1}));
    EXPECT_EQ(sccs[1], (std::vector<size_t>{2, 3, 4}));
}

TEST(SccTest, AcyclicGraphHasNoComponents) {
    std::vector<std::vector<size_t>> adj = {{1, 2}, {2}, {}};
    EXPECT_TRUE(strongly_connected_components(3, adj).empty());
}

TEST(SccTest, LongChainDoesNotOverflow) {
    const size_t n = 200000;
    std::vector<std::vector<size_t>> adj(n);
    for (size_t i = 0; i + 1 < n; ++i) {
        adj[i].push_back(i + 1);
    }
    adj[n - 1].push_back(0);
    auto sccs = strongly_connected_components(n, adj);
    ASSERT_EQ(sccs.size(), 1u);
    EXPECT_EQ(sccs[0].size(), n);
}

// ============================================================================
// Assembly Invariants
// ============================================================================

TEST(ModuleGraphAssembleTest, DanglingEdgeIsInternalError) {
    std::vector<Module> modules;
    modules.push_back(make_module("a.ts"));
    modules.push_back(make_module("b.ts"));
    EXPECT_THROW((void)ModuleGraph::assemble(std::move(modules), {link(0, 5)}), InternalError);
}

TEST(ModuleGraphAssembleTest, SelfEdgeIsInternalError) {
    std::vector<Module> modules;
    modules.push_back(make_module("a.ts"));
    EXPECT_THROW((void)ModuleGraph::assemble(std::move(modules), {link(size_t{0}, size_t{0})}), InternalError);
}

TEST(ModuleGraphAssembleTest, UnsortedArenaIsInternalError) {
    std::vector<Module> modules;
    modules.push_back(make_module("b.ts"));
    modules.push_back(make_module("a.ts"));
    EXPECT_THROW((void)ModuleGraph::assemble(std::move(modules), {}), InternalError);
}

TEST(ModuleGraphAssembleTest, EdgesSortedAndIndexed) {
    std::vector<Module> modules;
    modules.push_back(make_module("a.ts"));
    modules.push_back(make_module("b.ts"));
    modules.push_back(make_module("c.ts"));
    auto g = ModuleGraph::assemble(std::move(modules), {link(2, 0), link(0, 2), link(0, 1)});

    ASSERT_EQ(g.edges().size(), 3u);
    EXPECT_EQ(g.edges()[0].to, 1u);
    EXPECT_EQ(g.edges()[1].to, 2u);
    EXPECT_EQ(g.out_edges(0).size(), 2u);
    EXPECT_EQ(g.out_edges(1).size(), 0u);
    EXPECT_EQ(g.cycles(), (std::vector<std::vector<size_t>>{{0, 2}}));
}

TEST(ModuleGraphAssembleTest, LayersAssignedOnce) {
    std::vector<Module> modules;
    modules.push_back(make_module("a.ts"));
    auto g = ModuleGraph::assemble(std::move(modules), {});
    EXPECT_FALSE(g.is_classified());

    EXPECT_THROW(g.assign_layers({}), InternalError);
    g.assign_layers({policy::Layer::Business});
    EXPECT_TRUE(g.is_classified());
    EXPECT_EQ(g.modules()[0].layer, policy::Layer::Business);
    EXPECT_THROW(g.assign_layers({policy::Layer::Shared}), InternalError);
}
