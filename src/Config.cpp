#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <stdexcept>

namespace sqlstep {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            // Apply to appropriate section
            if (current_section == "connection") {
                if (key == "path") config.connection.path = value;
                else if (key == "read_only") config.connection.read_only = parseBool(value);
                else if (key == "create") config.connection.create = parseBool(value);
                else if (key == "threading") config.connection.threading = value;
                else if (key == "busy_timeout")
                    config.connection.busy_timeout = std::chrono::milliseconds(std::stoi(value));
                else if (key == "busy_retries") config.connection.busy_retries = std::stoi(value);
            }
            else if (current_section == "output") {
                if (key == "format") config.output.format = value;
                else if (key == "pretty_json") config.output.pretty_json = parseBool(value);
                else if (key == "include_csv_header")
                    config.output.include_csv_header = parseBool(value);
                else if (key == "max_rows")
                    config.output.max_rows = static_cast<size_t>(std::stoul(value));
            }
            else if (current_section == "logging") {
                if (key == "debug") config.debug = parseBool(value);
                else if (key == "file") config.log_file = value;
            }
        } catch (const std::logic_error&) {
            // std::stoi and friends report malformed numbers this way
            spdlog::warn("Ignoring invalid value for '{}' at {}:{}", key, path.string(), line_number);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"sqlstep - run a parameterized query against an SQLite database"};

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Connection options
    std::string path;
    app.add_option("-D,--database", path, "SQLite database file (default :memory:)");
    bool read_only = false;
    app.add_flag("--read-only", read_only, "Open the database read-only");
    bool no_create = false;
    app.add_flag("--no-create", no_create, "Fail if the database file does not exist");
    std::string threading;
    app.add_option("--threading", threading, "Threading mode (default, full_mutex, no_mutex)");
    int busy_timeout = -1;
    app.add_option("--busy-timeout", busy_timeout, "Busy timeout in milliseconds");
    int busy_retries = -1;
    app.add_option("--busy-retries", busy_retries, "Retries allowed by the busy handler");

    // Output options
    std::string format;
    app.add_option("-o,--format", format, "Output format (csv, json)");
    bool pretty = false;
    app.add_flag("--pretty", pretty, "Pretty-print JSON output");
    bool no_header = false;
    app.add_flag("--no-header", no_header, "Omit the CSV header line");
    size_t max_rows = 0;
    app.add_option("--max-rows", max_rows, "Maximum rows to print (0 = unlimited)");

    // Parameters
    std::vector<std::string> positional;
    app.add_option("-b,--bind", positional, "Positional parameter value (repeatable)")
        ->allow_extra_args(false);
    std::vector<std::string> named;
    app.add_option("-n,--named", named, "Named parameter as :name=value (repeatable)")
        ->allow_extra_args(false);

    // Logging
    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug output");
    std::string log_file;
    app.add_option("-l,--log-file", log_file, "Also write log output to this file");

    // Query (positional)
    std::string query;
    app.add_option("query", query, "SQL query to run")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Load config file if specified; command line values override it
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Apply parsed values
    if (!path.empty()) config.connection.path = path;
    if (read_only) config.connection.read_only = true;
    if (no_create) config.connection.create = false;
    if (!threading.empty()) config.connection.threading = threading;
    if (busy_timeout >= 0) config.connection.busy_timeout = std::chrono::milliseconds(busy_timeout);
    if (busy_retries >= 0) config.connection.busy_retries = busy_retries;

    if (!format.empty()) config.output.format = format;
    if (pretty) config.output.pretty_json = true;
    if (no_header) config.output.include_csv_header = false;
    if (max_rows > 0) config.output.max_rows = max_rows;

    if (debug) config.debug = true;
    if (!log_file.empty()) config.log_file = log_file;

    config.query = query;
    config.positional_params = positional;
    config.named_params = named;

    return config;
}

bool Config::validate() const {
    if (connection.path.empty()) {
        spdlog::error("Database path is required (use -D option)");
        return false;
    }

    if (connection.threading != "default" && connection.threading != "full_mutex" &&
        connection.threading != "no_mutex") {
        spdlog::error("Unknown threading mode: {}", connection.threading);
        return false;
    }

    if (connection.busy_timeout.count() < 0 || connection.busy_retries < 0) {
        spdlog::error("Busy timeout and retries must not be negative");
        return false;
    }

    if (connection.read_only && connection.path != ":memory:" &&
        !std::filesystem::exists(connection.path)) {
        spdlog::error("Database file does not exist: {}", connection.path);
        return false;
    }

    if (output.format != "csv" && output.format != "json") {
        spdlog::error("Unknown output format: {}", output.format);
        return false;
    }

    if (!positional_params.empty() && !named_params.empty()) {
        spdlog::error("Positional and named parameters cannot be mixed");
        return false;
    }

    for (const auto& param : named_params) {
        auto eq_pos = param.find('=');
        if (eq_pos == std::string::npos || eq_pos == 0) {
            spdlog::error("Named parameter must look like :name=value: {}", param);
            return false;
        }
    }

    return true;
}

}  // namespace sqlstep
