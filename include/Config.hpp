#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>

namespace sqlstep {

struct ConnectionConfig {
    std::string path = ":memory:";
    bool read_only = false;
    bool create = true;
    std::string threading = "default";  // default, full_mutex, no_mutex

    // Busy handling
    std::chrono::milliseconds busy_timeout{0};
    int busy_retries = 0;
};

struct OutputConfig {
    std::string format = "csv";  // csv, json
    bool pretty_json = false;
    bool include_csv_header = true;
    size_t max_rows = 0;  // 0 = unlimited
};

struct Config {
    ConnectionConfig connection;
    OutputConfig output;

    bool debug = false;
    std::string log_file;

    // Query to run and its parameters, as given on the command line
    std::string query;
    std::vector<std::string> positional_params;
    std::vector<std::string> named_params;  // ":name=value"

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;
};

}  // namespace sqlstep
