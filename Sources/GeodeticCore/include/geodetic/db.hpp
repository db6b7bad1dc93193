#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace geodetic {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,          ///< Full read/write access (fixtures, dataset installation)
        read_only,           ///< Read-only access
        read_only_immutable  ///< Read-only, no journal checks (bundled dataset files)
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_only);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name) const;

    // Query - returns rows as vector of column maps
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Execute SQL with optional params (for DDL and fixture loading)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Closes the connection. Throws db_error if SQLite refuses (unfinalized statements).
    /// Closing an already closed database does nothing.
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    static void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    static column_value_t extract_column(sqlite3_stmt* stmt, int index);

    /// Steps `stmt` to completion and collects every row.
    static std::vector<row_t> collect_rows(sqlite3* db, sqlite3_stmt* stmt);

    /// "file:" URI for `path`, with '%', '?' and '#' percent-encoded.
    static std::string file_uri(const std::string& path);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

// ============================================================================
// Prepared statements cached by logical operation name. A name re-prepared
// with different SQL text replaces the old statement. When the cache is full
// the least recently used statement is finalized.
// ============================================================================

class statement_cache {
public:
    explicit statement_cache(database& db, size_t capacity = 20);
    ~statement_cache();

    statement_cache(const statement_cache&) = delete;
    statement_cache& operator=(const statement_cache&) = delete;

    /// Runs `sql` through the statement cached under `key`. All rows are read
    /// before returning, so a nested query reusing the same key cannot
    /// invalidate the rows of an enclosing call.
    std::vector<row_t> query(const std::string& key,
                             const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    size_t size() const { return statements_.size(); }
    size_t capacity() const { return capacity_; }
    bool contains(const std::string& key) const { return statements_.count(key) != 0; }

    /// Finalizes every statement. Throws db_error after finalizing all of them
    /// if any finalization reported an error.
    void close();

private:
    struct entry {
        std::string sql;
        sqlite3_stmt* stmt = nullptr;
        uint64_t last_use = 0;
    };

    void evict_least_recently_used();

    database& db_;
    size_t capacity_;
    uint64_t clock_ = 0;
    std::unordered_map<std::string, entry> statements_;
};

} // namespace geodetic

#endif // __cplusplus
