#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace doclink::cli {

void print_usage() {
    std::cout << "migrate-links " << VERSION << "\n\n";
    std::cout << "Usage: migrate-links [command] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  migrate   Rewrite relative links after documents moved (default)\n";
    std::cout << "  check     Report relative links that do not resolve\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --root <dir>           Content root directory\n";
    std::cout << "  --move-table <file>    Migration manifest (old -> new)\n";
    std::cout << "  --dry-run              Print proposed edits without writing\n";
    std::cout << "  --check                Verify all links after rewriting\n";
    std::cout << "  --nav <file>           Audit a navigation file (read only)\n";
    std::cout << "  --verify <command>     Strict site build to run afterwards\n";
    std::cout << "  --exclude <a,b>        Directory names to skip\n";
    std::cout << "  --format <text|json>   Report format\n";
    std::cout << "  --help, -h             Show this help\n";
    std::cout << "  --version, -V          Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  -v, -vv, -vvv          Info, debug, trace output\n";
    std::cout << "  -q, --quiet            Errors only\n";
    std::cout << "  --log-level=<level>    trace|debug|info|warn|error|off\n";
    std::cout << "  --log-filter=<spec>    e.g. plan=debug,*=warn\n";
    std::cout << "  --log-file=<path>      Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>     text|json\n";
    std::cout << "\nDefaults are read from the [migrate] section of ./doclink.toml.\n";
}

void print_version() {
    std::cout << "migrate-links " << VERSION << "\n";
}

} // namespace doclink::cli
