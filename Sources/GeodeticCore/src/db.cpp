#include "geodetic/db.hpp"
#include "geodetic/log.hpp"
#include <type_traits>
#include <utility>

namespace geodetic {

database::database(const std::string& path, open_mode mode) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    int rc;

    if (mode == open_mode::read_only_immutable) {
        // immutable=1 skips the journal checks, required for datasets shipped
        // in read-only locations where -wal/-shm files cannot exist.
        flags |= SQLITE_OPEN_READONLY | SQLITE_OPEN_URI;
        std::string uri = file_uri(path) + "?immutable=1";
        rc = sqlite3_open_v2(uri.c_str(), &db_, flags, nullptr);
    } else if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
        rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    }
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    execute("PRAGMA cache_size = 20000");
    execute("PRAGMA temp_store = MEMORY");

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);
    LOG_DEBUG("db", "Opened %s", path.c_str());
}

std::string database::file_uri(const std::string& path) {
    static const char hex[] = "0123456789ABCDEF";
    std::string uri = "file:";
    for (char c : path) {
        // Characters that would end the path part of the URI
        if (c == '%' || c == '?' || c == '#') {
            auto byte = static_cast<unsigned char>(c);
            uri += '%';
            uri += hex[byte >> 4];
            uri += hex[byte & 0x0F];
        } else {
            uri += c;
        }
    }
    return uri;
}

database::~database() {
    if (db_) {
        // sqlite3_close_v2 defers the close until outstanding statements are finalized
        sqlite3_close_v2(db_);
    }
}

void database::close() {
    if (!db_) return;
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to close database %s: %s", path_.c_str(), error.c_str());
        throw db_error("Failed to close database: " + error);
    }
    db_ = nullptr;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (!db_) {
        throw db_error("Database is closed");
    }
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Execution failed: " + std::string(sqlite3_errmsg(db_)));
    }
}

bool database::table_exists(const std::string& name) const {
    if (!db_) {
        throw db_error("Database is closed");
    }
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_exists statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return sqlite3_column_int64(stmt, index);
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::vector<row_t> database::collect_rows(sqlite3* db, sqlite3_stmt* stmt) {
    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);
    int rc;

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db));
        LOG_ERROR("db", "Query failed: %s", error.c_str());
        throw db_error("Query failed: " + error);
    }
    return results;
}

std::vector<row_t> database::query(const std::string& sql,
                                   const std::vector<column_value_t>& params) {
    if (!db_) {
        throw db_error("Database is closed");
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare query: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    try {
        auto rows = collect_rows(db_, stmt);
        sqlite3_finalize(stmt);
        return rows;
    } catch (const db_error&) {
        sqlite3_finalize(stmt);
        throw;
    }
}

// ============================================================================
// statement_cache
// ============================================================================

statement_cache::statement_cache(database& db, size_t capacity)
    : db_(db), capacity_(capacity == 0 ? 1 : capacity) {}

statement_cache::~statement_cache() {
    for (auto& [_, e] : statements_) {
        sqlite3_finalize(e.stmt);
    }
}

std::vector<row_t> statement_cache::query(const std::string& key,
                                          const std::string& sql,
                                          const std::vector<column_value_t>& params) {
    sqlite3* db = db_.handle();
    if (!db) {
        throw db_error("Database is closed");
    }

    auto it = statements_.find(key);
    if (it != statements_.end() && it->second.sql != sql) {
        // Same logical operation, different table or dialect
        sqlite3_finalize(it->second.stmt);
        statements_.erase(it);
        it = statements_.end();
    }
    if (it == statements_.end()) {
        if (statements_.size() >= capacity_) {
            evict_least_recently_used();
        }
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db), sql.c_str());
            throw db_error("Failed to prepare query \"" + key + "\": " + std::string(sqlite3_errmsg(db)));
        }
        LOG_DEBUG("db", "Prepared \"%s\": %s", key.c_str(), sql.c_str());
        it = statements_.emplace(key, entry{sql, stmt, 0}).first;
    }

    entry& e = it->second;
    e.last_use = ++clock_;
    sqlite3_reset(e.stmt);
    sqlite3_clear_bindings(e.stmt);

    int index = 1;
    for (const auto& param : params) {
        database::bind_value(e.stmt, index++, param);
    }

    try {
        auto rows = database::collect_rows(db, e.stmt);
        sqlite3_reset(e.stmt);
        return rows;
    } catch (const db_error&) {
        sqlite3_reset(e.stmt);
        throw;
    }
}

void statement_cache::evict_least_recently_used() {
    auto oldest = statements_.end();
    for (auto it = statements_.begin(); it != statements_.end(); ++it) {
        if (oldest == statements_.end() || it->second.last_use < oldest->second.last_use) {
            oldest = it;
        }
    }
    if (oldest != statements_.end()) {
        LOG_DEBUG("db", "Evicting statement \"%s\"", oldest->first.c_str());
        sqlite3_finalize(oldest->second.stmt);
        statements_.erase(oldest);
    }
}

void statement_cache::close() {
    std::string first_error;
    size_t failures = 0;
    for (auto& [key, e] : statements_) {
        int rc = sqlite3_finalize(e.stmt);
        if (rc != SQLITE_OK) {
            ++failures;
            if (first_error.empty()) {
                first_error = "Failed to finalize \"" + key + "\": " + std::string(sqlite3_errstr(rc));
            }
        }
    }
    statements_.clear();
    if (failures != 0) {
        LOG_ERROR("db", "%zu statement(s) failed to finalize", failures);
        throw db_error(first_error);
    }
}

} // namespace geodetic
