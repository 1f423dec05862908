#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace pqrow {

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string dbname;
    std::string application_name = "pqrow";

    // SSL options
    std::string sslmode = "prefer";
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;

    std::chrono::milliseconds connect_timeout{5000};

    // Build a libpq conninfo string
    std::string toConnInfo() const;
};

struct OutputConfig {
    std::string format = "json";  // json, csv
    bool pretty = true;
    bool include_null = true;
    bool include_csv_header = true;
};

struct Config {
    ConnectionConfig connection;
    OutputConfig output;

    std::string query;
    std::vector<std::string> params;
    std::vector<std::string> columns;  // name:type[?]

    bool debug = false;
    std::string log_file;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();
};

}  // namespace pqrow
