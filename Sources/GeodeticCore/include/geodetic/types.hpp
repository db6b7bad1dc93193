#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <cstdlib>
#include <cctype>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <unordered_map>

namespace geodetic {

// Primary key type (EPSG codes are integers in a single codespace)
using primary_key_t = int64_t;

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// One result row, keyed by column name
using row_t = std::unordered_map<std::string, column_value_t>;

// Geographic bounding box in decimal degrees (EPSG "Extent" BBOX_* columns)
struct geographic_bbox {
    double south = 0.0;
    double north = 0.0;
    double west = 0.0;
    double east = 0.0;

    geographic_bbox() = default;

    geographic_bbox(double s, double n, double w, double e)
        : south(s), north(n), west(w), east(e) {}

    bool operator==(const geographic_bbox& other) const {
        return south == other.south && north == other.north &&
               west == other.west && east == other.east;
    }

    bool operator!=(const geographic_bbox& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Column conversions. SQLite is dynamically typed and the EPSG scripts store
// some numeric columns as TEXT, so conversions accept both representations.
// ============================================================================

namespace detail {
    inline bool is_null(const column_value_t& v) {
        return std::holds_alternative<std::nullptr_t>(v);
    }

    inline std::optional<std::string> to_optional_string(const column_value_t& v) {
        if (auto s = std::get_if<std::string>(&v)) return *s;
        if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
        if (auto d = std::get_if<double>(&v)) {
            std::string text = std::to_string(*d);
            // Trim the trailing zeros written by std::to_string
            auto dot = text.find('.');
            if (dot != std::string::npos) {
                auto last = text.find_last_not_of('0');
                text.erase(last == dot ? dot : last + 1);
            }
            return text;
        }
        return std::nullopt;
    }

    inline std::optional<int64_t> to_optional_integer(const column_value_t& v) {
        if (auto i = std::get_if<int64_t>(&v)) return *i;
        if (auto d = std::get_if<double>(&v)) {
            auto truncated = static_cast<int64_t>(*d);
            if (static_cast<double>(truncated) == *d) return truncated;
            return std::nullopt;
        }
        if (auto s = std::get_if<std::string>(&v)) {
            if (s->empty()) return std::nullopt;
            char* end = nullptr;
            long long parsed = std::strtoll(s->c_str(), &end, 10);
            if (end && *end == '\0') return static_cast<int64_t>(parsed);
        }
        return std::nullopt;
    }

    inline std::optional<double> to_optional_double(const column_value_t& v) {
        if (auto d = std::get_if<double>(&v)) return *d;
        if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
        if (auto s = std::get_if<std::string>(&v)) {
            if (s->empty()) return std::nullopt;
            char* end = nullptr;
            double parsed = std::strtod(s->c_str(), &end);
            if (end && *end == '\0') return parsed;
        }
        return std::nullopt;
    }

    /// Accepts SQL integers and the "Yes"/"No", "true"/"false" spellings of the EPSG scripts.
    inline std::optional<bool> to_optional_bool(const column_value_t& v) {
        if (auto i = std::get_if<int64_t>(&v)) return *i != 0;
        if (auto s = std::get_if<std::string>(&v)) {
            std::string lower;
            for (char c : *s) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower == "yes" || lower == "true" || lower == "1" || lower == "y") return true;
            if (lower == "no" || lower == "false" || lower == "0" || lower == "n") return false;
        }
        return std::nullopt;
    }
} // namespace detail

} // namespace geodetic

#endif // __cplusplus
