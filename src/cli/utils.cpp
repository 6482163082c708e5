#include "cli_internal.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define STRATA_ISATTY(fd) _isatty(fd)
#define STRATA_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define STRATA_ISATTY(fd) isatty(fd)
#define STRATA_FILENO(f) fileno(f)
#endif

namespace strata::cli {

auto Palette::plain() -> Palette {
    return Palette{};
}

auto Palette::ansi() -> Palette {
    Palette p;
    p.reset = "\033[0m";
    p.bold = "\033[1m";
    p.dim = "\033[2m";
    p.red = "\033[31m";
    p.yellow = "\033[33m";
    p.green = "\033[32m";
    p.cyan = "\033[36m";
    return p;
}

bool stdout_supports_color() {
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    return STRATA_ISATTY(STRATA_FILENO(stdout)) != 0;
}

int exit_code(analysis::RunStatus status) {
    switch (status) {
    case analysis::RunStatus::Clean:
        return EXIT_CLEAN;
    case analysis::RunStatus::ViolationsFound:
        return EXIT_VIOLATIONS;
    case analysis::RunStatus::ConfigError:
        return EXIT_CONFIG_ERROR;
    case analysis::RunStatus::Timeout:
        return EXIT_TIMEOUT;
    case analysis::RunStatus::InternalError:
        return EXIT_INTERNAL_ERROR;
    }
    return EXIT_INTERNAL_ERROR;
}

void print_usage() {
    std::cout << "Strata " << VERSION << " - architecture conformance analyzer\n\n";
    std::cout << "Usage: strata <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check [<root>]   Analyze a source tree against its layer policy\n";
    std::cout << "  rules            List the built-in rules\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h            Show this help\n";
    std::cout << "  --version, -V         Show version\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. ingest=debug,*=warn\n";
    std::cout << "  --log-file=<path>     Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>    text or json\n";
    std::cout << "  -v, -vv, -vvv         Info, debug, trace logging\n";
    std::cout << "  -q, --quiet           Errors only\n";
    std::cout << "\nRun 'strata check --help' for analysis options.\n";
}

void print_version() {
    std::cout << "strata " << VERSION << "\n";
}

void print_check_help() {
    std::cout << "Usage: strata check [<root>] [options]\n\n";
    std::cout << "Analyzes every source file under <root> (default: current directory).\n";
    std::cout << "Configuration is read from <root>/strata.json when present.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config=<file>       Read configuration from <file>\n";
    std::cout << "  --format=text|json    Output format (default: text)\n";
    std::cout << "  --threads=<n>         Ingestion workers (0 = hardware concurrency)\n";
    std::cout << "  --deadline-ms=<n>     Abandon the run after <n> ms (0 = no deadline)\n";
    std::cout << "  --no-color            Disable colored output\n";
    std::cout << "\nExit codes:\n";
    std::cout << "  0 clean, 1 violations found, 2 configuration error,\n";
    std::cout << "  3 timeout, 4 internal error\n";
}

} // namespace strata::cli
