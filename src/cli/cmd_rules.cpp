//! # Rules Command
//!
//! Implements `strata rules`: lists every built-in rule with its category,
//! default severity and description. `--format=json` prints an array.

#include "cli_internal.hpp"

#include "strata/json/json_value.hpp"
#include "strata/log/log.hpp"
#include "strata/rules/rule.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace strata::cli {

std::string format_rules_text(const Palette& p) {
    std::ostringstream out;
    for (const auto& rule : rules::builtin_rules()) {
        out << p.bold << std::left << std::setw(22) << rule->id() << p.reset << " " << std::setw(8)
            << report::severity_name(rule->default_severity()) << " " << p.dim << std::setw(17)
            << report::category_name(rule->category()) << p.reset << " " << rule->description()
            << "\n";
    }
    return out.str();
}

namespace {

json::JsonValue rules_to_json() {
    json::JsonArray arr;
    for (const auto& rule : rules::builtin_rules()) {
        json::JsonObject obj;
        obj.emplace("id", json::JsonValue(rule->id()));
        obj.emplace("category", json::JsonValue(report::category_name(rule->category())));
        obj.emplace("default_severity",
                    json::JsonValue(report::severity_name(rule->default_severity())));
        obj.emplace("description", json::JsonValue(rule->description()));
        arr.emplace_back(std::move(obj));
    }
    return json::JsonValue(std::move(arr));
}

} // namespace

int run_rules(int argc, char* argv[]) {
    bool as_json = false;
    bool color = true;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--format=json") {
            as_json = true;
        } else if (arg == "--no-color") {
            color = false;
        } else if (arg == "--format=text" || log::is_log_option(arg)) {
            continue;
        } else {
            std::cerr << "strata rules: unknown option '" << arg << "'\n";
            return EXIT_CONFIG_ERROR;
        }
    }

    if (as_json) {
        std::cout << rules_to_json().to_string_pretty() << "\n";
    } else {
        std::cout << format_rules_text(color && stdout_supports_color() ? Palette::ansi()
                                                                        : Palette::plain());
    }
    return EXIT_CLEAN;
}

} // namespace strata::cli
