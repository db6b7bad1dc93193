#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "types.hpp"
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace geodetic {

/// A row being read: (table, primary key tuple).
struct in_flight_key {
    std::string table;
    std::vector<primary_key_t> keys;

    bool operator<(const in_flight_key& other) const {
        return std::tie(table, keys) < std::tie(other.table, other.keys);
    }
};

/// State threaded through the recursive calls of one public resolver call.
///
/// The in-flight set is shared by every frame of the call chain. The flags
/// only apply to the frame that set them and to its callees.
class resolution_context {
public:
    explicit resolution_context(std::set<in_flight_key>& in_flight) : in_flight_(in_flight) {}

    /// Do not log deprecation warnings.
    bool quiet = false;
    /// Replace the deprecated sexagesimal ellipsoidal CS by their decimal degree equivalents.
    bool replace_deprecated_cs = false;
    /// Accept out of range projection parameters.
    bool relax_parameter_checks = false;

    /// Context for resolving the base of a deprecated projected CRS.
    resolution_context for_deprecated_base() const {
        resolution_context child(in_flight_);
        child.quiet = true;
        child.replace_deprecated_cs = true;
        child.relax_parameter_checks = true;
        return child;
    }

    bool is_in_flight(const in_flight_key& key) const {
        return in_flight_.count(key) != 0;
    }

private:
    friend class in_flight_guard;
    std::set<in_flight_key>& in_flight_;
};

/// Registers a row as being read for the lifetime of the guard.
/// Throws recursive_resolution_error if the row is already being read
/// higher in the call chain.
class in_flight_guard {
public:
    in_flight_guard(resolution_context& ctx, in_flight_key key)
        : set_(ctx.in_flight_), key_(std::move(key)) {
        if (!set_.insert(key_).second) {
            std::string code;
            for (size_t i = 0; i < key_.keys.size(); ++i) {
                if (i != 0) code += ", ";
                code += std::to_string(key_.keys[i]);
            }
            throw recursive_resolution_error(key_.table, code);
        }
    }

    ~in_flight_guard() {
        set_.erase(key_);
    }

    in_flight_guard(const in_flight_guard&) = delete;
    in_flight_guard& operator=(const in_flight_guard&) = delete;

private:
    std::set<in_flight_key>& set_;
    in_flight_key key_;
};

} // namespace geodetic

#endif // __cplusplus
