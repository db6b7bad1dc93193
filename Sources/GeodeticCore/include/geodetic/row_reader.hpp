#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "types.hpp"
#include <string>

namespace geodetic {

/// Typed access to the columns of one materialized row.
/// A null or unconvertible required column is reported as malformed data
/// naming the table, the column and the code.
class row_reader {
public:
    row_reader(const row_t& row, std::string table, std::string code)
        : row_(row), table_(std::move(table)), code_(std::move(code)) {}

    const column_value_t& value(const char* column) const {
        static const column_value_t null_value = nullptr;
        auto it = row_.find(column);
        return it == row_.end() ? null_value : it->second;
    }

    bool is_null(const char* column) const {
        return detail::is_null(value(column));
    }

    std::optional<std::string> optional_string(const char* column) const {
        auto s = detail::to_optional_string(value(column));
        if (s && s->empty()) return std::nullopt;
        return s;
    }

    std::string string_or_empty(const char* column) const {
        return optional_string(column).value_or(std::string());
    }

    std::string required_string(const char* column) const {
        auto s = optional_string(column);
        if (!s) throw missing(column);
        return *s;
    }

    std::optional<int64_t> optional_integer(const char* column) const {
        return detail::to_optional_integer(value(column));
    }

    int64_t required_integer(const char* column) const {
        auto i = optional_integer(column);
        if (!i) throw missing(column);
        return *i;
    }

    std::optional<double> optional_double(const char* column) const {
        return detail::to_optional_double(value(column));
    }

    double required_double(const char* column) const {
        auto d = optional_double(column);
        if (!d) throw missing(column);
        return *d;
    }

    /// Null and unknown spellings read as false.
    bool flag(const char* column) const {
        return detail::to_optional_bool(value(column)).value_or(false);
    }

    std::optional<bool> optional_bool(const char* column) const {
        return detail::to_optional_bool(value(column));
    }

    const std::string& code() const { return code_; }

private:
    malformed_data_error missing(const char* column) const {
        return malformed_data_error("Null or invalid value in column " + std::string(column) +
                                    " of table \"" + table_ + "\" for code " + code_ + ".");
    }

    const row_t& row_;
    std::string table_;
    std::string code_;
};

} // namespace geodetic

#endif // __cplusplus
