#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "log.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace geodetic {

struct configuration {
    /// Path of the SQLite file holding the EPSG dataset. Use ":memory:" for
    /// an in-memory database (tests only, each connection sees its own copy).
    std::string path = ":memory:";

    /// Open the dataset read-only. Disable only to create fixtures.
    bool read_only = true;

    /// Open with immutable=1: no locking and no journal checks. Use this for
    /// datasets installed in read-only locations.
    bool immutable = false;

    /// Prefix of the table names. Empty for the MS-Access names
    /// ("Coordinate Reference System"), "epsg_" for the names of the SQL
    /// scripts ("epsg_coordinatereferencesystem").
    std::string table_prefix;

    /// Schema (attached database) holding the tables, empty for "main".
    std::string schema;

    /// Global log level applied when a resolver is created. Unset leaves it unchanged.
    std::optional<log_level> level;

    /// Maximum number of prepared statements kept per resolver.
    size_t statement_cache_size = 20;

    /// resolver_pool: time after which an unused resolver is closed.
    std::chrono::milliseconds idle_timeout{60000};

    /// resolver_pool: maximum number of resolvers lent at the same time.
    size_t max_pool_size = 4;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}

    configuration(const std::string& p, const std::string& prefix)
        : path(p), table_prefix(prefix) {}

    database::open_mode open_mode() const {
        if (!read_only) return database::open_mode::read_write;
        return immutable ? database::open_mode::read_only_immutable : database::open_mode::read_only;
    }

    /// Parses a JSON document:
    /// {"path": "...", "readOnly": true, "immutable": false, "tablePrefix": "epsg_",
    ///  "schema": "", "logLevel": "warn", "statementCacheSize": 20,
    ///  "idleTimeoutMs": 60000, "maxPoolSize": 4}
    /// Missing keys keep their default. Throws configuration_error.
    static configuration from_json(const std::string& text);

    /// Reads and parses a JSON file. Throws configuration_error.
    static configuration from_file(const std::string& file);

    std::string to_json() const;
};

/// "off", "error", "warn", "info" or "debug".
std::optional<log_level> parse_log_level(const std::string& name);
const char* to_string(log_level level);

} // namespace geodetic

#endif // __cplusplus
