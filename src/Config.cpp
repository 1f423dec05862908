#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <algorithm>

namespace pqrow {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

// conninfo values with spaces or quotes must be single-quoted
std::string connInfoValue(const std::string& value) {
    if (!value.empty() && value.find_first_of(" '\\") == std::string::npos) {
        return value;
    }
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

const std::vector<std::string> kSslModes = {
    "disable", "allow", "prefer", "require", "verify-ca", "verify-full"};

}  // namespace

std::string ConnectionConfig::toConnInfo() const {
    std::ostringstream connInfo;

    connInfo << "host=" << connInfoValue(host);
    connInfo << " port=" << port;

    if (!user.empty()) {
        connInfo << " user=" << connInfoValue(user);
    }

    if (!password.empty()) {
        connInfo << " password=" << connInfoValue(password);
    }

    if (!dbname.empty()) {
        connInfo << " dbname=" << connInfoValue(dbname);
    }

    // Timeout in seconds, libpq treats 0 as "wait forever"
    auto seconds = std::max<long long>(1, connect_timeout.count() / 1000);
    connInfo << " connect_timeout=" << seconds;

    connInfo << " sslmode=" << sslmode;
    if (!ssl_ca.empty()) {
        connInfo << " sslrootcert=" << connInfoValue(ssl_ca);
    }
    if (!ssl_cert.empty()) {
        connInfo << " sslcert=" << connInfoValue(ssl_cert);
    }
    if (!ssl_key.empty()) {
        connInfo << " sslkey=" << connInfoValue(ssl_key);
    }

    if (!application_name.empty()) {
        connInfo << " application_name=" << connInfoValue(application_name);
    }

    return connInfo.str();
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
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
            if (current_section == "connection") {
                if (key == "host") config.connection.host = value;
                else if (key == "port") config.connection.port = static_cast<uint16_t>(std::stoi(value));
                else if (key == "user") config.connection.user = value;
                else if (key == "password") config.connection.password = value;
                else if (key == "dbname" || key == "database") config.connection.dbname = value;
                else if (key == "application_name") config.connection.application_name = value;
                else if (key == "sslmode") config.connection.sslmode = value;
                else if (key == "ssl_ca") config.connection.ssl_ca = value;
                else if (key == "ssl_cert") config.connection.ssl_cert = value;
                else if (key == "ssl_key") config.connection.ssl_key = value;
                else if (key == "connect_timeout")
                    config.connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
            }
            else if (current_section == "output") {
                if (key == "format") config.output.format = value;
                else if (key == "pretty") config.output.pretty = parseBool(value);
                else if (key == "include_null") config.output.include_null = parseBool(value);
                else if (key == "include_csv_header") config.output.include_csv_header = parseBool(value);
            }
            else if (current_section == "logging") {
                if (key == "debug") config.debug = parseBool(value);
                else if (key == "file") config.log_file = value;
            }
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid value for {}.{} in {}: {}",
                         current_section, key, path.string(), value);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"pqrow - run a PostgreSQL statement and decode its rows"};

    // Connection options
    app.add_option("-H,--host", config.connection.host, "Database server host")
        ->default_val("localhost");
    app.add_option("-P,--port", config.connection.port, "Database server port")
        ->default_val(5432);
    app.add_option("-u,--user", config.connection.user, "Database username");
    app.add_option("-p,--password", config.connection.password, "Database password");
    app.add_option("-D,--dbname", config.connection.dbname, "Database name");
    app.add_option("--sslmode", config.connection.sslmode, "libpq sslmode")
        ->check(CLI::IsMember(kSslModes));
    app.add_option("--ssl-ca", config.connection.ssl_ca, "SSL CA certificate file");
    app.add_option("--ssl-cert", config.connection.ssl_cert, "SSL client certificate file");
    app.add_option("--ssl-key", config.connection.ssl_key, "SSL client key file");
    int connect_timeout = static_cast<int>(config.connection.connect_timeout.count());
    app.add_option("--connect-timeout", connect_timeout, "Connect timeout in milliseconds")
        ->default_val(5000);

    // Statement
    app.add_option("-q,--query", config.query, "SQL statement to execute")->required();
    app.add_option("--param", config.params, "Statement parameter ($1, $2, ...), repeatable");
    app.add_option("-c,--column", config.columns,
                   "Expected result column as name:type[?], repeatable "
                   "(types: text, bool, int2, int4, int8, float4, float8, json)");

    // Output
    app.add_option("-f,--format", config.output.format, "Output format (json, csv)")
        ->check(CLI::IsMember({"json", "csv"}));
    app.add_flag_function("--compact", [&config](int64_t) { config.output.pretty = false; },
                 "Compact JSON output");
    app.add_flag_function("--omit-null", [&config](int64_t) { config.output.include_null = false; },
                 "Leave NULL columns out of JSON objects");
    app.add_flag_function("--no-header", [&config](int64_t) { config.output.include_csv_header = false; },
                 "Omit the CSV header line");

    // Logging
    app.add_flag("-d,--debug", config.debug, "Enable debug output");
    app.add_option("--log-file", config.log_file, "Also log to this file");

    // Config file
    std::string config_file;
    app.add_option("--config", config_file, "Path to configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    config.connection.connect_timeout = std::chrono::milliseconds(connect_timeout);

    // Load config file if specified; command line args override file config
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            auto unset = [&app](const char* name) { return app.count(name) == 0; };

            if (unset("--host")) config.connection.host = file_config->connection.host;
            if (unset("--port")) config.connection.port = file_config->connection.port;
            if (unset("--user")) config.connection.user = file_config->connection.user;
            if (unset("--password")) config.connection.password = file_config->connection.password;
            if (unset("--dbname")) config.connection.dbname = file_config->connection.dbname;
            if (unset("--sslmode")) config.connection.sslmode = file_config->connection.sslmode;
            if (unset("--ssl-ca")) config.connection.ssl_ca = file_config->connection.ssl_ca;
            if (unset("--ssl-cert")) config.connection.ssl_cert = file_config->connection.ssl_cert;
            if (unset("--ssl-key")) config.connection.ssl_key = file_config->connection.ssl_key;
            if (unset("--connect-timeout"))
                config.connection.connect_timeout = file_config->connection.connect_timeout;
            config.connection.application_name = file_config->connection.application_name;

            if (unset("--format")) config.output.format = file_config->output.format;
            if (unset("--compact")) config.output.pretty = file_config->output.pretty;
            if (unset("--omit-null")) config.output.include_null = file_config->output.include_null;
            if (unset("--no-header"))
                config.output.include_csv_header = file_config->output.include_csv_header;

            if (unset("--debug")) config.debug = file_config->debug;
            if (unset("--log-file")) config.log_file = file_config->log_file;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    if (query.empty()) {
        spdlog::error("A statement is required (use -q option)");
        return false;
    }

    if (connection.host.empty()) {
        spdlog::error("Database host is required");
        return false;
    }

    if (connection.port == 0) {
        spdlog::error("Invalid database port: {}", connection.port);
        return false;
    }

    if (std::find(kSslModes.begin(), kSslModes.end(), connection.sslmode) == kSslModes.end()) {
        spdlog::error("Unknown sslmode: {}", connection.sslmode);
        return false;
    }

    if (output.format != "json" && output.format != "csv") {
        spdlog::error("Unknown output format: {}", output.format);
        return false;
    }

    if (!connection.ssl_ca.empty() && !std::filesystem::exists(connection.ssl_ca)) {
        spdlog::error("SSL CA file not found: {}", connection.ssl_ca);
        return false;
    }
    if (!connection.ssl_cert.empty() && !std::filesystem::exists(connection.ssl_cert)) {
        spdlog::error("SSL certificate file not found: {}", connection.ssl_cert);
        return false;
    }
    if (!connection.ssl_key.empty() && !std::filesystem::exists(connection.ssl_key)) {
        spdlog::error("SSL key file not found: {}", connection.ssl_key);
        return false;
    }

    return true;
}

void Config::resolvePassword() {
    if (connection.password.empty()) {
        const char* env_pwd = std::getenv("PGPASSWORD");
        if (env_pwd) {
            connection.password = env_pwd;
        }
    }
}

}  // namespace pqrow
