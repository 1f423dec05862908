#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "PostgreSQLConnection.hpp"
#include "TypedResult.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace pqrow;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitSqlError = 2;
constexpr int kExitConnection = 3;
constexpr int kExitDecode = 4;
constexpr int kExitFailure = 5;

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Diagnostics go to stderr so stdout carries only the rows
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

        auto logger = std::make_shared<spdlog::logger>("pqrow", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

int run(const Config& config) {
    std::vector<ColumnSpec> specs;
    try {
        specs = ColumnSpec::parseAll(config.columns);
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    }

    PostgreSQLConnection conn(config.connection);
    PostgreSQLResultSet raw = config.params.empty()
        ? conn.execute(config.query)
        : conn.executeParams(config.query, config.params);

    TypedResult<json> result(FormatConverter::makeJsonRowDecoder(specs), raw);
    result.okResult();

    spdlog::info("{}", result.cmdStatus());
    if (auto affected = result.cmdTuples()) {
        spdlog::info("{} row(s) affected", *affected);
    }

    if (specs.empty()) {
        if (result.resultStatus() == PGRES_TUPLES_OK) {
            spdlog::info("{} row(s) x {} column(s); pass --column to decode them",
                         result.ntuples(), result.nfields());
        }
        return 0;
    }

    std::vector<json> rows;
    for (const auto& row : result.rows()) {
        rows.push_back(row);
    }

    if (config.output.format == "csv") {
        CSVOptions options;
        options.includeHeader = config.output.include_csv_header;
        std::cout << FormatConverter::toCSV(specs, rows, options);
    } else {
        JSONOptions options;
        options.pretty = config.output.pretty;
        options.includeNull = config.output.include_null;
        std::cout << FormatConverter::toJSON(rows, options) << std::endl;
    }

    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitUsage;
    }

    // Setup logging
    setupLogging(config.debug, config.log_file);

    // Validate configuration
    if (!config.validate()) {
        return kExitUsage;
    }

    spdlog::debug("Connecting to {}:{} as {}", config.connection.host,
                  config.connection.port, config.connection.user);

    try {
        return run(config);
    } catch (const SqlError& e) {
        spdlog::error("{} ({})", e.what(), ErrorHandler::categoryName(e.category()));
        return e.isConnectionFailure() ? kExitConnection : kExitSqlError;
    } catch (const ConnectionError& e) {
        spdlog::error("Connection failure: {}", e.what());
        return kExitConnection;
    } catch (const ResultException& e) {
        spdlog::error("{}", e.what());
        return kExitDecode;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return kExitFailure;
    }
}
