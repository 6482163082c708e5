//! # Strata Entry Point
//!
//! The binary is named `strata`. All work happens in the CLI driver.
//!
//! ```bash
//! strata check                 # Analyze the current directory
//! strata check --format=json   # JSON report on stdout
//! strata rules                 # List built-in rules
//! ```

#include "cli/cli_internal.hpp"

int main(int argc, char* argv[]) {
    return strata::cli::strata_main(argc, argv);
}
