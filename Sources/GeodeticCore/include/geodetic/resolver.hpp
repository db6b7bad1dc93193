#pragma once

#ifdef __cplusplus

#include "code_set.hpp"
#include "configuration.hpp"
#include "context.hpp"
#include "db.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "objects.hpp"
#include "sql_translator.hpp"
#include "table_info.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace geodetic {

// ============================================================================
// epsg_resolver - builds geodetic objects from the EPSG dataset
//
// Every public call locks the resolver, so one instance can be shared between
// threads, but calls are serialized. Use resolver_pool for parallel access.
// Codes are given as text: either the numeric code ("4326") or a name or
// alias ("WGS 84"), matched ignoring case, accents and punctuation.
// ============================================================================

class epsg_resolver {
public:
    /// Opens the dataset described by `config`. Throws connectivity_error.
    explicit epsg_resolver(const configuration& config);

    /// Uses an already opened dataset. The resolver owns it until close().
    explicit epsg_resolver(std::unique_ptr<database> db, const configuration& config = {});

    ~epsg_resolver();

    epsg_resolver(const epsg_resolver&) = delete;
    epsg_resolver& operator=(const epsg_resolver&) = delete;

    /// EPSG citation, with edition and date of the newest "Version History" row.
    citation authority();

    /// Object of any kind. Throws duplicate_identifier_error if the code is
    /// used by more than one table.
    object_ptr resolve_object(const std::string& code);

    /// Object of the given kind. A subtype kind (e.g. projected_crs) fails
    /// with no_such_code_error when the code designates another subtype.
    /// A datum kind also accepts an ensemble whose members are of that kind,
    /// although authority_codes() lists ensembles under datum_ensemble only.
    object_ptr resolve(object_kind kind, const std::string& code);

    crs_ptr resolve_crs(const std::string& code);
    datum_ptr resolve_datum(const std::string& code);
    ellipsoid_ptr resolve_ellipsoid(const std::string& code);
    prime_meridian_ptr resolve_prime_meridian(const std::string& code);
    cs_ptr resolve_coordinate_system(const std::string& code);
    axis_ptr resolve_axis(const std::string& code);
    unit_ptr resolve_unit(const std::string& code);
    parameter_ptr resolve_parameter(const std::string& code);
    method_ptr resolve_operation_method(const std::string& code);
    operation_ptr resolve_operation(const std::string& code);
    extent_ptr resolve_extent(const std::string& code);
    conventional_rs_ptr resolve_conventional_rs(const std::string& code);

    /// Operations from `source` to `target`: the defining conversion when
    /// `target` is a projected CRS based on `source`, then the non-deprecated
    /// operations by accuracy (unknown accuracy last), reordered by supersession.
    std::vector<operation_ptr> operations_between(const std::string& source, const std::string& target);

    /// Non-deprecated codes of a kind. A family returns the codes of all its subtypes.
    code_set_ptr authority_codes(object_kind kind);

    /// Name of the object, without building it. Empty if there is no such code.
    std::optional<std::string> describe(object_kind kind, const std::string& code);

    /// Moves superseding codes before the codes they supersede, in place.
    /// Returns true if the order changed.
    bool sort_by_supersession(object_kind kind, std::vector<std::string>& codes);

    /// False while a code_set returned by authority_codes() is still held.
    bool can_close();
    size_t live_code_sets();

    /// Releases the statements, the code sets and the connection. Every step
    /// runs even if a previous one failed; failures are reported together in
    /// a close_error. Closing twice does nothing.
    void close();
    bool is_closed() const;

    const configuration& config() const { return config_; }

private:
    // MARK: Call plumbing (resolver.cpp)

    /// Locks, checks that the resolver is open, runs `body` with a fresh
    /// call context and reports database failures as connectivity_error.
    template<typename F>
    auto guarded(const char* what, const std::string& code, F&& body)
        -> decltype(body(std::declval<resolution_context&>()));

    void ensure_open(const char* what, const std::string& code) const;

    std::vector<row_t> run(const std::string& key, const std::string& sql,
                           const std::vector<column_value_t>& params = {});

    bool table_found(const std::string& access_name);
    std::string object_table_name(const table_info& info) const;

    /// Code or name to primary key.
    primary_key_t to_primary_key(object_kind kind, const std::string& code);
    std::vector<primary_key_t> find_codes_from_name(const table_info& info, const std::string& name,
                                                    bool search_aliases);

    template<typename T>
    std::shared_ptr<const T> cached(object_kind family, primary_key_t key) const {
        auto it = objects_.find({family, key});
        if (it == objects_.end()) return nullptr;
        return std::dynamic_pointer_cast<const T>(it->second);
    }

    void remember(object_kind family, primary_key_t key, object_ptr object) {
        objects_[{family, key}] = std::move(object);
    }

    /// First row's object, or the previous one when an equal duplicate row
    /// is found. Throws duplicate_identifier_error on a non-equal duplicate.
    template<typename T>
    static std::shared_ptr<const T> ensure_singleton(std::shared_ptr<const T> previous,
                                                     std::shared_ptr<const T> current,
                                                     const std::string& code) {
        if (!previous) return current;
        if (previous->equals(*current)) {
            LOG_WARN("epsg", "Duplicated rows for EPSG:%s with identical content", code.c_str());
            return previous;
        }
        throw duplicate_identifier_error(code);
    }

    object_ptr dispatch(resolution_context& ctx, object_kind family, const std::string& code);

    // MARK: Properties (resolver.cpp)

    citation authority_impl();

    struct property_source {
        std::string name;
        std::string description;
        std::optional<std::string> legacy_extent;  ///< AREA_OF_USE_CODE
        std::optional<std::string> legacy_scope;
        std::string remarks;
        bool deprecated = false;
    };

    properties make_properties(resolution_context& ctx, const table_info& info,
                               primary_key_t code, property_source source);
    identifier make_identifier(resolution_context& ctx, const table_info& info, primary_key_t code,
                               const std::string& description, bool deprecated);
    std::string replacement_of(resolution_context& ctx, const table_info& info, primary_key_t code,
                               std::string& reason);
    std::string scope_text(primary_key_t scope_code);

    // MARK: Builders

    crs_ptr crs_impl(resolution_context& ctx, const std::string& code);                 // resolver_crs.cpp
    crs_ptr crs_of_kind(resolution_context& ctx, const std::string& code, object_kind kind);
    void check_conversion_parameters(const coordinate_operation& conversion, const std::string& crs_code,
                                     bool relaxed) const;

    datum_ptr datum_impl(resolution_context& ctx, const std::string& code);             // resolver_datum.cpp
    datum_ptr datum_of_kind(resolution_context& ctx, const std::string& code, object_kind kind);
    ellipsoid_ptr ellipsoid_impl(resolution_context& ctx, const std::string& code);
    prime_meridian_ptr prime_meridian_impl(resolution_context& ctx, const std::string& code);
    conventional_rs_ptr conventional_rs_impl(resolution_context& ctx, const std::string& code);
    std::string realization_method(std::optional<int64_t> code);

    cs_ptr cs_impl(resolution_context& ctx, const std::string& code);                   // resolver_cs.cpp
    cs_ptr cs_of_kind(resolution_context& ctx, const std::string& code, object_kind kind);
    axis_ptr axis_impl(resolution_context& ctx, const std::string& code);
    unit_ptr unit_impl(resolution_context& ctx, const std::string& code);

    struct axis_name {
        std::string name;
        std::string description;
        std::string remarks;
    };
    const axis_name& axis_name_of(primary_key_t code);

    extent_ptr extent_impl(resolution_context& ctx, const std::string& code);           // resolver_extent.cpp

    operation_ptr operation_impl(resolution_context& ctx, const std::string& code);     // resolver_operations.cpp
    method_ptr method_impl(resolution_context& ctx, const std::string& code);
    parameter_ptr parameter_impl(resolution_context& ctx, const std::string& code);

    /// Options distinguishing the variants of one parameter descriptor.
    struct parameter_key {
        primary_key_t code = 0;
        std::string unit_code;              ///< Empty for no unit
        parameter_value_type type = parameter_value_type::real;
        std::optional<bool> sign_reversal;

        bool operator<(const parameter_key& other) const {
            return std::tie(code, unit_code, type, sign_reversal) <
                   std::tie(other.code, other.unit_code, other.type, other.sign_reversal);
        }
    };

    parameter_ptr parameter_variant(resolution_context& ctx, const parameter_key& key);
    std::optional<std::string> dominant_unit(resolution_context& ctx, primary_key_t parameter,
                                             const unit* compatible_with);
    bool has_file_reference(primary_key_t parameter);
    std::optional<bool> sign_reversal(primary_key_t parameter);
    std::vector<parameter_value> parameter_values(resolution_context& ctx, primary_key_t operation,
                                                  primary_key_t method);

    bool sort_impl(const table_info& info, std::vector<std::string>& codes);            // resolver_sort.cpp

    // MARK: State

    configuration config_;
    sql_translator translator_;
    std::unique_ptr<database> db_;
    std::unique_ptr<statement_cache> statements_;
    mutable std::recursive_mutex mutex_;
    bool closed_ = false;

    std::optional<citation> citation_;
    std::map<std::string, bool> tables_found_;
    std::map<std::pair<object_kind, primary_key_t>, object_ptr> objects_;
    std::map<primary_key_t, axis_name> axis_names_;
    std::map<primary_key_t, std::string> realization_methods_;
    std::map<primary_key_t, std::string> scopes_;
    std::map<std::string, std::shared_ptr<const name_space>> name_spaces_;
    std::map<parameter_key, parameter_ptr> parameter_variants_;
    std::map<object_kind, std::weak_ptr<const code_set>> code_sets_;
};

template<typename F>
auto epsg_resolver::guarded(const char* what, const std::string& code, F&& body)
    -> decltype(body(std::declval<resolution_context&>()))
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open(what, code);
    std::set<in_flight_key> in_flight;
    resolution_context ctx(in_flight);
    try {
        return body(ctx);
    } catch (const db_error& e) {
        throw connectivity_error(e.what(), what, code);
    }
}

} // namespace geodetic

#endif // __cplusplus
