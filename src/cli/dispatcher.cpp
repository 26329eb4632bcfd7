//! # CLI Command Dispatcher
//!
//! Parses the command word and routes to its handler.
//!
//! ```text
//! doclink_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ check          → run_check()
//!   ├─ migrate        → run_migrate()
//!   └─ --<option>     → run_migrate()   (default command)
//! ```
//!
//! Logging options (`-v`, `--log-level=...`) are accepted anywhere on the
//! command line and applied before dispatch.

#include "commands/cmd_check.hpp"
#include "commands/cmd_migrate.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

namespace doclink::cli {

static int dispatch(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return EXIT_OK;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return EXIT_OK;
    }
    if (command == "--version" || command == "-V") {
        print_version();
        return EXIT_OK;
    }
    if (command == "migrate") {
        return run_migrate(argc, argv, 2);
    }
    if (command == "check") {
        return run_check(argc, argv, 2);
    }
    if (!command.empty() && command[0] == '-') {
        return run_migrate(argc, argv, 1);
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'migrate-links --help' for usage.\n";
    return EXIT_FATAL;
}

} // namespace doclink::cli

int doclink_main(int argc, char* argv[]) {
    int code = doclink::cli::dispatch(argc, argv);
    doclink::log::Logger::instance().flush();
    return code;
}
