//! # Configuration Loading
//!
//! Line-based reader for the `[migrate]` section of `doclink.toml`, plus
//! command-line parsing. Command-line values override file values.

#include "cli/config.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace doclink::cli {

// ============================================================================
// Helpers
// ============================================================================

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos)
        return {};
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

static std::string unquote(std::string value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

static OutputFormat parse_format(const std::string& value) {
    return (value == "json" || value == "JSON") ? OutputFormat::JSON : OutputFormat::Text;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream in(value);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty())
            items.push_back(item);
    }
    return items;
}

// ============================================================================
// Config File Parsing
// ============================================================================

MigrateOptions load_config(const fs::path& project_root) {
    MigrateOptions options;

    fs::path config_path = project_root / "doclink.toml";
    std::ifstream file(config_path);
    if (!file) {
        return options;
    }

    std::string line;
    bool in_section = false;

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (line[0] == '[') {
            in_section = (line == "[migrate]");
            continue;
        }
        if (!in_section)
            continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos)
            continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = unquote(trim(line.substr(eq_pos + 1)));

        if (key == "root") {
            options.root = value;
        } else if (key == "move-table") {
            options.move_table = value;
        } else if (key == "nav") {
            options.nav = value;
        } else if (key == "verify") {
            options.verify = value;
        } else if (key == "exclude") {
            options.exclude = split_list(value);
        } else if (key == "check") {
            options.check = (value == "true");
        } else if (key == "format") {
            options.format = parse_format(value);
        } else {
            DOCLINK_LOG_WARN("cli", config_path.string() << ": unknown key '" << key << "'");
        }
    }

    DOCLINK_LOG_DEBUG("cli", "Loaded defaults from " << config_path.string());
    return options;
}

// ============================================================================
// Argument Parsing
// ============================================================================

Result<MigrateOptions, migrate::ConfigError> parse_migrate_args(int argc, char* argv[], int first,
                                                                MigrateOptions base) {
    MigrateOptions options = std::move(base);

    auto fail = [](std::string message) {
        migrate::ConfigError error;
        error.message = std::move(message);
        return error;
    };

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (log::is_log_option(arg))
            continue;

        if (arg == "--help" || arg == "-h") {
            options.help = true;
            continue;
        }
        if (arg == "--dry-run") {
            options.dry_run = true;
            continue;
        }
        if (arg == "--check") {
            options.check = true;
            continue;
        }

        // Valued options: "--name value" or "--name=value"
        std::string name = arg;
        std::string value;
        bool has_value = false;
        size_t eq = arg.find('=');
        if (arg.starts_with("--") && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            has_value = true;
        }

        bool known = name == "--root" || name == "--move-table" || name == "--nav" ||
                     name == "--verify" || name == "--exclude" || name == "--format";
        if (!known) {
            return fail("unknown option '" + arg + "'");
        }
        if (!has_value) {
            if (i + 1 >= argc) {
                return fail("option '" + name + "' expects a value");
            }
            value = argv[++i];
        }

        if (name == "--root") {
            options.root = value;
        } else if (name == "--move-table") {
            options.move_table = value;
        } else if (name == "--nav") {
            options.nav = value;
        } else if (name == "--verify") {
            options.verify = value;
        } else if (name == "--exclude") {
            options.exclude = split_list(value);
        } else if (name == "--format") {
            if (value != "text" && value != "json") {
                return fail("--format expects 'text' or 'json', got '" + value + "'");
            }
            options.format = parse_format(value);
        }
    }

    return options;
}

} // namespace doclink::cli
