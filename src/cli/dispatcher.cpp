//! # CLI Command Dispatcher
//!
//! Parses global options, initializes logging and routes to the command
//! handler.
//!
//! ## Architecture
//!
//! ```text
//! strata_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ check          → run_check()
//!   └─ rules          → run_rules()
//! ```
//!
//! Logging options (`--log-level=`, `-v`, `-q`, ...) are accepted anywhere on
//! the command line and are consumed before dispatch.

#include "cli_internal.hpp"

#include "strata/log/log.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace strata::cli {

/// Main entry point for the Strata CLI.
///
/// ## Examples
///
/// ```bash
/// strata check                        # Analyze the current directory
/// strata check services/api -vv       # Debug logging
/// strata check --format=json > r.json # Machine-readable report
/// strata rules                        # List built-in rules
/// ```
int strata_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    // The first argument that is not a log option names the command
    int command_index = 1;
    while (command_index < argc && log::is_log_option(argv[command_index])) {
        ++command_index;
    }
    if (command_index >= argc) {
        print_usage();
        return EXIT_CLEAN;
    }

    std::string command = argv[command_index];

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return EXIT_CLEAN;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return EXIT_CLEAN;
    }

    // Handlers read their options from argv[2..]; move the command to argv[1]
    std::vector<char*> args(argv, argv + argc);
    if (command_index != 1) {
        std::rotate(args.begin() + 1, args.begin() + command_index,
                    args.begin() + command_index + 1);
    }
    int code = EXIT_CLEAN;

    try {
        if (command == "check") {
            code = run_check(argc, args.data());
        } else if (command == "rules") {
            code = run_rules(argc, args.data());
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            std::cerr << "Run 'strata --help' for usage.\n";
            code = EXIT_CONFIG_ERROR;
        }
    } catch (const std::exception& e) {
        STRATA_LOG_FATAL("cli", "Unhandled exception: " << e.what());
        std::cerr << "internal error: " << e.what() << "\n";
        code = EXIT_INTERNAL_ERROR;
    }

    log::Logger::instance().flush();
    return code;
}

} // namespace strata::cli
