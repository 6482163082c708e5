//! # Source Scanner Tests
//!
//! Comment and literal blanking, bracket checking and tokenization across
//! languages.

#include "strata/ingest/source_scanner.hpp"

#include <gtest/gtest.h>

using namespace strata::ingest;

namespace {

ScanResult scan(Language lang, std::string_view content) {
    return SourceScanner(lang).scan(content);
}

std::vector<std::string> idents(const ScanResult& result) {
    std::vector<std::string> out;
    for (const auto& tok : SourceScanner::tokenize(result)) {
        if (tok.is_ident()) {
            out.emplace_back(tok.text);
        }
    }
    return out;
}

} // namespace

// ============================================================================
// Blanking
// ============================================================================

TEST(SourceScannerTest, BlanksLineAndBlockComments) {
    auto result = scan(Language::TypeScript, "a // fs.readFile\n/* fetch() */ b\n");
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.text.size(), 33u);
    EXPECT_EQ(result.text.find("fs"), std::string::npos);
    EXPECT_EQ(result.text.find("fetch"), std::string::npos);
    EXPECT_EQ(idents(result), (std::vector<std::string>{"a", "b"}));
}

TEST(SourceScannerTest, PythonHashComments) {
    auto result = scan(Language::Python, "x = 1  # open('f')\n");
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.text.find("open"), std::string::npos);
}

TEST(SourceScannerTest, PreservesLineStructure) {
    auto result = scan(Language::Cpp, "/* one\ntwo */\nint x;\n");
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.line_starts.size(), 4u);
    auto tokens = SourceScanner::tokenize(result);
    ASSERT_FALSE(tokens.empty());
    EXPECT_TRUE(tokens[0].is_ident("int"));
    EXPECT_EQ(tokens[0].line, 3u);
    EXPECT_EQ(tokens[0].column, 1u);
}

TEST(SourceScannerTest, RecordsStringLiterals) {
    auto result = scan(Language::JavaScript, "import x from './domain/order';\n");
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(result.strings.size(), 1u);
    EXPECT_EQ(result.strings[0].value, "./domain/order");
    EXPECT_EQ(result.strings[0].line, 1u);
    EXPECT_NE(result.string_at(result.strings[0].offset), nullptr);
}

TEST(SourceScannerTest, BracketsInsideLiteralsIgnored) {
    auto result = scan(Language::Go, "package x\nvar s = \"({[\"\nvar r = `}`\n");
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.strings.size(), 2u);
}

TEST(SourceScannerTest, PythonTripleQuotes) {
    auto result = scan(Language::Python, "s = \"\"\"\nopen(\n\"\"\"\nx = 1\n");
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(result.strings.size(), 1u);
    EXPECT_EQ(result.strings[0].value, "\nopen(\n");
}

TEST(SourceScannerTest, CppDigitSeparatorIsNotAQuote) {
    auto result = scan(Language::Cpp, "int n = 1'000'000;\nint m = (n);\n");
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.strings.empty());
}

TEST(SourceScannerTest, CppRawString) {
    auto result = scan(Language::Cpp, "auto s = R\"x(a \" ) b)x\";\n");
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(result.strings.size(), 1u);
    EXPECT_EQ(result.strings[0].value, "a \" ) b");
}

TEST(SourceScannerTest, RustLifetimeIsNotAQuote) {
    auto result = scan(Language::Rust, "fn f<'a>(x: &'a str) -> char { 'c' }\n");
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(result.strings.size(), 1u);
    EXPECT_EQ(result.strings[0].value, "c");
}

TEST(SourceScannerTest, JsRegexLiteral) {
    auto result = scan(Language::JavaScript, "const re = /[(]/g;\nconst d = a / b;\n");
    EXPECT_TRUE(result.ok);
}

// ============================================================================
// Failures
// ============================================================================

TEST(SourceScannerTest, UnclosedBracketFails) {
    auto result = scan(Language::TypeScript, "function f() {\n  return 1;\n");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("line 1:", 0), 0u);
    EXPECT_NE(result.error.find("unclosed"), std::string::npos);
}

TEST(SourceScannerTest, UnbalancedCloserFails) {
    auto result = scan(Language::Java, "class A {}\n}\n");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("line 2:", 0), 0u);
}

TEST(SourceScannerTest, UnterminatedStringFails) {
    auto result = scan(Language::Python, "x = 'abc\ny = 1\n");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("unterminated string"), std::string::npos);
}

TEST(SourceScannerTest, UnterminatedBlockCommentFails) {
    auto result = scan(Language::Go, "package x\n/* open\n");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("line 2:", 0), 0u);
}

// ============================================================================
// Tokens
// ============================================================================

TEST(SourceScannerTest, TokenDepthTracksBraces) {
    auto result = scan(Language::Go, "func f() {\n  g()\n}\n");
    auto tokens = SourceScanner::tokenize(result);
    for (const auto& tok : tokens) {
        if (tok.is_ident("g")) {
            EXPECT_EQ(tok.depth, 1u);
            EXPECT_TRUE(tok.line_start);
        }
        if (tok.is_ident("func")) {
            EXPECT_EQ(tok.depth, 0u);
        }
    }
}

TEST(SourceScannerTest, MultiCharPunctuation) {
    auto result = scan(Language::Rust, "use a::b;\nlet f = |x| x => 1;\n");
    auto tokens = SourceScanner::tokenize(result);
    bool saw_path = false;
    bool saw_arrow = false;
    for (const auto& tok : tokens) {
        saw_path = saw_path || tok.is_punct("::");
        saw_arrow = saw_arrow || tok.is_punct("=>");
    }
    EXPECT_TRUE(saw_path);
    EXPECT_TRUE(saw_arrow);
}
