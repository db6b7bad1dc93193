#include "geodetic/configuration.hpp"
#include "geodetic/errors.hpp"
#include "geodetic/text.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace geodetic {

using json = nlohmann::json;

std::optional<log_level> parse_log_level(const std::string& name) {
    auto lower = text::to_lower(name);
    if (lower == "off") return log_level::off;
    if (lower == "error") return log_level::error;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "info") return log_level::info;
    if (lower == "debug") return log_level::debug;
    return std::nullopt;
}

const char* to_string(log_level level) {
    switch (level) {
        case log_level::off:   return "off";
        case log_level::error: return "error";
        case log_level::warn:  return "warn";
        case log_level::info:  return "info";
        case log_level::debug: return "debug";
    }
    return "warn";
}

namespace {

template<typename T>
void read_key(const json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        out = j[key].get<T>();
    } catch (const json::exception& e) {
        throw configuration_error(std::string("Invalid value for \"") + key + "\": " + e.what());
    }
}

} // namespace

configuration configuration::from_json(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        LOG_ERROR("config", "Cannot parse configuration: %s", e.what());
        throw configuration_error(std::string("Cannot parse configuration: ") + e.what());
    }
    if (!j.is_object()) {
        throw configuration_error("Configuration must be a JSON object");
    }

    configuration config;
    read_key(j, "path", config.path);
    read_key(j, "readOnly", config.read_only);
    read_key(j, "immutable", config.immutable);
    read_key(j, "tablePrefix", config.table_prefix);
    read_key(j, "schema", config.schema);

    std::string level;
    read_key(j, "logLevel", level);
    if (!level.empty()) {
        config.level = parse_log_level(level);
        if (!config.level) {
            throw configuration_error("Unknown log level \"" + level + "\"");
        }
    }

    int64_t cache_size = static_cast<int64_t>(config.statement_cache_size);
    read_key(j, "statementCacheSize", cache_size);
    if (cache_size <= 0) {
        throw configuration_error("statementCacheSize must be positive");
    }
    config.statement_cache_size = static_cast<size_t>(cache_size);

    int64_t idle_ms = config.idle_timeout.count();
    read_key(j, "idleTimeoutMs", idle_ms);
    if (idle_ms < 0) {
        throw configuration_error("idleTimeoutMs must not be negative");
    }
    config.idle_timeout = std::chrono::milliseconds(idle_ms);

    int64_t pool_size = static_cast<int64_t>(config.max_pool_size);
    read_key(j, "maxPoolSize", pool_size);
    if (pool_size <= 0) {
        throw configuration_error("maxPoolSize must be positive");
    }
    config.max_pool_size = static_cast<size_t>(pool_size);

    if (config.path.empty()) {
        throw configuration_error("path must not be empty");
    }
    return config;
}

configuration configuration::from_file(const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        LOG_ERROR("config", "Cannot read %s", file.c_str());
        throw configuration_error("Cannot read configuration file " + file);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

std::string configuration::to_json() const {
    json j;
    j["path"] = path;
    j["readOnly"] = read_only;
    j["immutable"] = immutable;
    j["tablePrefix"] = table_prefix;
    j["schema"] = schema;
    if (level) j["logLevel"] = geodetic::to_string(*level);
    j["statementCacheSize"] = statement_cache_size;
    j["idleTimeoutMs"] = idle_timeout.count();
    j["maxPoolSize"] = max_pool_size;
    return j.dump();
}

} // namespace geodetic
