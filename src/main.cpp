#include "Config.hpp"
#include "FormatConverter.hpp"
#include "sqlstep.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <cstdlib>
#include <vector>

using namespace sqlstep;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console logging goes to stderr so query output on stdout stays clean
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sqlstep", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <query>\n\n";
    std::cout << "Connection Options:\n";
    std::cout << "  -D, --database <path>   SQLite database file (default: :memory:)\n";
    std::cout << "  --read-only             Open the database read-only\n";
    std::cout << "  --no-create             Fail if the database file does not exist\n";
    std::cout << "  --threading <mode>      default, full_mutex or no_mutex\n";
    std::cout << "  --busy-timeout <ms>     Wait this long for locked tables\n";
    std::cout << "  --busy-retries <N>      Retry busy statements N times\n";
    std::cout << "\nParameters:\n";
    std::cout << "  -b, --bind <value>      Positional parameter (repeatable)\n";
    std::cout << "  -n, --named <:n=value>  Named parameter (repeatable)\n";
    std::cout << "                          Values: 42, 4.2, NULL, x'0a0b', or text\n";
    std::cout << "\nOutput Options:\n";
    std::cout << "  -o, --format <fmt>      csv or json (default: csv)\n";
    std::cout << "  --pretty                Pretty-print JSON\n";
    std::cout << "  --no-header             Omit the CSV header line\n";
    std::cout << "  --max-rows <N>          Stop after N rows\n";
    std::cout << "\nOther Options:\n";
    std::cout << "  -c, --config <file>     Path to configuration file\n";
    std::cout << "  -d, --debug             Enable debug output\n";
    std::cout << "  -l, --log-file <file>   Also log to this file\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -V, --version           Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program << " -D app.db \"SELECT * FROM users WHERE age > ?\" -b 40\n";
    std::cout << "  " << program << " -D app.db -o json \"SELECT * FROM users WHERE name = :name\" -n :name=Alice\n";
    std::cout << std::endl;
}

void bindParameters(SQLiteCursor& cursor, const Config& config) {
    if (!config.named_params.empty()) {
        std::vector<std::pair<std::string, Value>> named;
        for (const auto& param : config.named_params) {
            auto eq_pos = param.find('=');
            named.emplace_back(param.substr(0, eq_pos), FormatConverter::parseLiteral(param.substr(eq_pos + 1)));
        }
        cursor.bind(named);
        return;
    }

    std::vector<Value> positional;
    for (const auto& param : config.positional_params) {
        positional.push_back(FormatConverter::parseLiteral(param));
    }
    cursor.bind(positional);
}

int runQuery(const Config& config) {
    SQLiteConnection conn = SQLiteConnection::open(config.connection);
    ErrorContext context("query");

    SQLiteCursor cursor(conn.prepare(config.query));
    bindParameters(cursor, config);

    std::vector<SQLiteRow> rows;
    while (config.output.max_rows == 0 || rows.size() < config.output.max_rows) {
        std::optional<SQLiteRow> row = cursor.next();
        if (!row) break;
        rows.push_back(std::move(*row));
    }
    spdlog::debug("Fetched {} rows, {} changed", rows.size(), conn.changeCount());

    if (config.output.format == "json") {
        JSONOptions options;
        options.pretty = config.output.pretty_json;
        std::cout << FormatConverter::toJSON(rows, options) << std::endl;
    } else {
        CSVOptions options;
        options.includeHeader = config.output.include_csv_header && cursor.columnCount() > 0;
        std::cout << FormatConverter::toCSV(cursor.columnNames(), rows, options);
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Quick help check
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-V" || arg == "--version") {
            std::cout << "sqlstep version 1.0.0 (SQLite " << engineVersionString() << ")" << std::endl;
            return 0;
        }
    }

    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.debug, config.log_file);

    spdlog::debug("Opening {}", config.connection.path);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    try {
        return runQuery(config);
    } catch (const SQLiteException& e) {
        spdlog::error("{}", e.what());
        return e.errorCode() ? 2 : 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
