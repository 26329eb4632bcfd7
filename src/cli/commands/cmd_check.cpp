#include "cmd_check.hpp"

#include "cli/config.hpp"
#include "cli/report.hpp"
#include "cmd_migrate.hpp"
#include "log/log.hpp"
#include "migrate/pipeline.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace doclink::cli {

int run_check(int argc, char* argv[], int first) {
    auto parsed = parse_migrate_args(argc, argv, first, load_config(fs::current_path()));
    if (is_err(parsed)) {
        DOCLINK_LOG_ERROR("cli", unwrap_err(parsed).message);
        return EXIT_FATAL;
    }
    const MigrateOptions& options = unwrap(parsed);

    if (options.help) {
        std::cout << "Usage: migrate-links check --root <dir> [--exclude <a,b>] "
                     "[--format <text|json>]\n";
        return EXIT_OK;
    }

    std::error_code ec;
    if (options.root.empty() || !fs::is_directory(options.root, ec)) {
        DOCLINK_LOG_ERROR("cli", "Content root not found: '" << options.root << "'");
        return EXIT_FATAL;
    }

    migrate::MigrationOptions run;
    run.root = options.root;
    run.scan.exclude_dirs = options.exclude;

    migrate::MigrationReport report = migrate::run_check(run);
    print_report(report, options.format, std::cout);

    return report.errors() > 0 ? EXIT_ISSUES : EXIT_OK;
}

} // namespace doclink::cli
