//! # Glob Tests
//!
//! Path globs used by layer patterns, ignore lists and public API patterns,
//! and the flat wildcard used for callee names.

#include "strata/policy/glob.hpp"

#include <gtest/gtest.h>

using namespace strata;
using namespace strata::policy;

// ============================================================================
// Compilation
// ============================================================================

TEST(GlobCompileTest, AcceptsCommonPatterns) {
    EXPECT_TRUE(is_ok(Glob::compile("**/domain/**")));
    EXPECT_TRUE(is_ok(Glob::compile("src/{a,b}/*.ts")));
    EXPECT_TRUE(is_ok(Glob::compile("file[0-9].py")));
    EXPECT_TRUE(is_ok(Glob::compile("index.*")));
}

TEST(GlobCompileTest, RejectsMalformedPatterns) {
    EXPECT_TRUE(is_err(Glob::compile("")));
    EXPECT_TRUE(is_err(Glob::compile("src/{a,b")));
    EXPECT_TRUE(is_err(Glob::compile("src/a}")));
    EXPECT_TRUE(is_err(Glob::compile("file[0-9.py")));
    EXPECT_TRUE(is_err(Glob::compile("trailing\\")));
}

TEST(GlobCompileTest, ErrorNamesTheProblem) {
    auto glob = Glob::compile("src/{a,b");
    ASSERT_TRUE(is_err(glob));
    EXPECT_NE(unwrap_err(glob).find("unbalanced"), std::string::npos);
}

TEST(GlobCompileTest, KeepsOriginalPattern) {
    auto glob = Glob::compile("**/{infra,adapters}/**");
    ASSERT_TRUE(is_ok(glob));
    EXPECT_EQ(unwrap(glob).pattern(), "**/{infra,adapters}/**");
}

// ============================================================================
// Matching
// ============================================================================

TEST(GlobMatchTest, DoubleStarSpansDirectories) {
    EXPECT_TRUE(glob_match("**/domain/**", "src/domain/order.ts"));
    EXPECT_TRUE(glob_match("**/domain/**", "domain/order.ts"));
    EXPECT_TRUE(glob_match("**/domain/**", "a/b/c/domain/x/y/z.py"));
    EXPECT_FALSE(glob_match("**/domain/**", "src/domains/order.ts"));
}

TEST(GlobMatchTest, SingleStarStaysInSegment) {
    EXPECT_TRUE(glob_match("src/*.ts", "src/main.ts"));
    EXPECT_FALSE(glob_match("src/*.ts", "src/sub/main.ts"));
    EXPECT_FALSE(glob_match("src/*", "src"));
}

TEST(GlobMatchTest, BracesExpand) {
    EXPECT_TRUE(glob_match("**/{infra,adapters}/**", "src/infra/db.ts"));
    EXPECT_TRUE(glob_match("**/{infra,adapters}/**", "src/adapters/db.ts"));
    EXPECT_FALSE(glob_match("**/{infra,adapters}/**", "src/domain/db.ts"));
}

TEST(GlobMatchTest, QuestionMarkAndClasses) {
    EXPECT_TRUE(glob_match("v?.go", "v1.go"));
    EXPECT_FALSE(glob_match("v?.go", "v10.go"));
    EXPECT_TRUE(glob_match("file[0-9].py", "file7.py"));
    EXPECT_FALSE(glob_match("file[0-9].py", "fileA.py"));
    EXPECT_TRUE(glob_match("file[!0-9].py", "fileA.py"));
}

TEST(GlobMatchTest, FileNamePatterns) {
    EXPECT_TRUE(glob_match("index.*", "index.ts"));
    EXPECT_TRUE(glob_match("index.*", "index.js"));
    EXPECT_FALSE(glob_match("index.*", "internal.ts"));
}

TEST(GlobMatchTest, MalformedPatternNeverMatches) {
    EXPECT_FALSE(glob_match("{a,b", "a"));
}

// ============================================================================
// Wildcards
// ============================================================================

TEST(WildcardTest, StarCrossesDots) {
    EXPECT_TRUE(wildcard_match("fs.*", "fs.readFileSync"));
    EXPECT_TRUE(wildcard_match("fs.*", "fs.promises.readFile"));
    EXPECT_FALSE(wildcard_match("fs.*", "fsx"));
    EXPECT_TRUE(wildcard_match("std.chrono.*.now", "std.chrono.system_clock.now"));
}

TEST(WildcardTest, ExactNames) {
    EXPECT_TRUE(wildcard_match("fetch", "fetch"));
    EXPECT_FALSE(wildcard_match("fetch", "prefetch"));
    EXPECT_TRUE(wildcard_match("mysql*", "mysql2"));
}
