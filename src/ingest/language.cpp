//! # Languages and Symbol Kinds
//!
//! Extension table for language detection and the name tables used in
//! configuration and reports.

#include "strata/ingest/file_facts.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace strata::ingest {

namespace {

const std::unordered_map<std::string_view, Language> EXTENSIONS = {
    {".c", Language::Cpp},          {".cc", Language::Cpp},         {".cpp", Language::Cpp},
    {".cxx", Language::Cpp},        {".h", Language::Cpp},          {".hh", Language::Cpp},
    {".hpp", Language::Cpp},        {".hxx", Language::Cpp},        {".js", Language::JavaScript},
    {".jsx", Language::JavaScript}, {".mjs", Language::JavaScript}, {".cjs", Language::JavaScript},
    {".ts", Language::TypeScript},  {".tsx", Language::TypeScript}, {".mts", Language::TypeScript},
    {".cts", Language::TypeScript}, {".py", Language::Python},      {".pyi", Language::Python},
    {".go", Language::Go},          {".rs", Language::Rust},        {".java", Language::Java},
};

} // namespace

auto language_from_path(std::string_view path) -> std::optional<Language> {
    auto slash = path.find_last_of('/');
    auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) {
        return std::nullopt;
    }
    std::string ext(name.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = EXTENSIONS.find(ext);
    if (it == EXTENSIONS.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto language_name(Language lang) -> const char* {
    switch (lang) {
    case Language::Cpp:
        return "cpp";
    case Language::JavaScript:
        return "javascript";
    case Language::TypeScript:
        return "typescript";
    case Language::Python:
        return "python";
    case Language::Go:
        return "go";
    case Language::Rust:
        return "rust";
    case Language::Java:
        return "java";
    }
    return "unknown";
}

auto parse_language(std::string_view name) -> std::optional<Language> {
    for (auto lang : all_languages()) {
        if (name == language_name(lang)) {
            return lang;
        }
    }
    return std::nullopt;
}

auto all_languages() -> const std::vector<Language>& {
    static const std::vector<Language> langs = {Language::Cpp,    Language::JavaScript,
                                                Language::TypeScript, Language::Python,
                                                Language::Go,     Language::Rust,
                                                Language::Java};
    return langs;
}

auto symbol_kind_name(SymbolKind kind) -> const char* {
    switch (kind) {
    case SymbolKind::Function:
        return "function";
    case SymbolKind::Class:
        return "class";
    case SymbolKind::Interface:
        return "interface";
    case SymbolKind::Type:
        return "type";
    case SymbolKind::Struct:
        return "struct";
    case SymbolKind::Enum:
        return "enum";
    case SymbolKind::Trait:
        return "trait";
    case SymbolKind::Constant:
        return "constant";
    case SymbolKind::Variable:
        return "variable";
    }
    return "unknown";
}

auto is_contract_kind(SymbolKind kind) -> bool {
    switch (kind) {
    case SymbolKind::Interface:
    case SymbolKind::Type:
    case SymbolKind::Struct:
    case SymbolKind::Enum:
    case SymbolKind::Trait:
    case SymbolKind::Constant:
        return true;
    default:
        return false;
    }
}

} // namespace strata::ingest
