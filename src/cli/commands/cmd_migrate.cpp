//! # Migrate Command Implementation
//!
//! ```text
//! run_migrate()
//!   ├─ Options: doclink.toml, then argv
//!   ├─ Fatal checks: content root, move table, nav file
//!   ├─ run_migration()            scan → plan → apply
//!   ├─ Nav audit warnings
//!   ├─ Verify command             skipped on --dry-run
//!   └─ Report and exit code
//! ```

#include "cmd_migrate.hpp"

#include "cli/config.hpp"
#include "cli/report.hpp"
#include "log/log.hpp"
#include "migrate/move_table.hpp"
#include "migrate/nav.hpp"
#include "migrate/pipeline.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace doclink::cli {

static void log_config_error(const migrate::ConfigError& error) {
    if (error.file.empty()) {
        DOCLINK_LOG_ERROR("cli", error.message);
    } else if (error.line > 0) {
        DOCLINK_LOG_ERROR("cli", error.file << ":" << error.line << ": " << error.message);
    } else {
        DOCLINK_LOG_ERROR("cli", error.file << ": " << error.message);
    }
}

void print_migrate_help() {
    std::cout << "Usage: migrate-links [migrate] --root <dir> --move-table <file> [options]\n\n";
    std::cout << "Rewrites relative Markdown links after documents were moved.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --root <dir>           Content root directory\n";
    std::cout << "  --move-table <file>    Migration manifest\n";
    std::cout << "  --dry-run              Print proposed edits without writing\n";
    std::cout << "  --check                Verify all links after rewriting\n";
    std::cout << "  --nav <file>           Report navigation entries naming old paths\n";
    std::cout << "  --verify <command>     Run a strict site build afterwards\n";
    std::cout << "  --exclude <a,b>        Directory names to skip\n";
    std::cout << "  --format <text|json>   Report format\n";
    std::cout << "\nManifest lines:\n";
    std::cout << "  old.md -> topic/old.md\n";
    std::cout << "  nest <dir> [prefix]    <prefix><name>.md -> <dir>/<name>.md\n";
}

int run_migrate(int argc, char* argv[], int first) {
    auto parsed = parse_migrate_args(argc, argv, first, load_config(fs::current_path()));
    if (is_err(parsed)) {
        log_config_error(unwrap_err(parsed));
        return EXIT_FATAL;
    }
    const MigrateOptions& options = unwrap(parsed);

    if (options.help) {
        print_migrate_help();
        return EXIT_OK;
    }

    // Configuration-level failures abort before anything is written.
    if (options.root.empty()) {
        DOCLINK_LOG_ERROR("cli", "No content root given (--root)");
        return EXIT_FATAL;
    }
    std::error_code ec;
    if (!fs::is_directory(options.root, ec)) {
        DOCLINK_LOG_ERROR("cli", "Content root not found: " << options.root);
        return EXIT_FATAL;
    }
    if (options.move_table.empty()) {
        DOCLINK_LOG_ERROR("cli", "No move table given (--move-table)");
        return EXIT_FATAL;
    }

    auto loaded = migrate::MoveTable::load(options.move_table, options.root);
    if (is_err(loaded)) {
        log_config_error(unwrap_err(loaded));
        return EXIT_FATAL;
    }
    const migrate::MoveTable& table = unwrap(loaded);
    if (table.empty()) {
        DOCLINK_LOG_WARN("cli", "Move table " << options.move_table << " has no entries");
    }

    std::vector<migrate::Issue> nav_issues;
    if (!options.nav.empty()) {
        auto audited = migrate::audit_nav(options.nav, table);
        if (is_err(audited)) {
            log_config_error(unwrap_err(audited));
            return EXIT_FATAL;
        }
        nav_issues = std::move(unwrap(audited));
    }

    migrate::MigrationOptions run;
    run.root = options.root;
    run.scan.exclude_dirs = options.exclude;
    run.dry_run = options.dry_run;
    run.check_after = options.check;

    DOCLINK_LOG_INFO("cli", "Migrating links under " << options.root << " ("
                                                     << table.size() << " moves)");
    migrate::MigrationReport report = migrate::run_migration(table, run);
    report.issues.insert(report.issues.end(), nav_issues.begin(), nav_issues.end());

    bool verify_failed = false;
    if (!options.verify.empty() && !options.dry_run) {
        DOCLINK_LOG_INFO("cli", "Running verification: " << options.verify);
        std::cout.flush();
        int status = std::system(options.verify.c_str());
        if (status != 0) {
            DOCLINK_LOG_ERROR("cli", "Verification command failed (status " << status
                                                                            << "): "
                                                                            << options.verify);
            verify_failed = true;
        }
    }

    print_report(report, options.format, std::cout);

    if (report.errors() > 0 || verify_failed) {
        return EXIT_ISSUES;
    }
    return EXIT_OK;
}

} // namespace doclink::cli
