#include "geodetic/resolver.hpp"
#include "geodetic/row_reader.hpp"
#include "geodetic/text.hpp"
#include <cmath>
#include <type_traits>
#include <variant>

namespace geodetic {

namespace {

// ============================================================================
// Row plans. Every value a CRS needs is read from the row into one of these
// before any referenced object is resolved.
// ============================================================================

struct geographic_plan {
    bool three_dimensional;
    int64_t cs_code;
    std::optional<std::string> datum_code;
    std::optional<std::string> base_code;   ///< Datum source when datum_code is null
};

struct geocentric_plan {
    std::string cs_code;
    std::string datum_code;
};

struct projected_plan {
    std::string cs_code;
    std::string base_code;
    std::string conversion_code;
};

/// Vertical, temporal, engineering and parametric CRS: one CS and one datum.
struct single_plan {
    crs_type type;
    object_kind cs_kind;
    object_kind datum_kind;
    std::string cs_code;
    std::string datum_code;
};

struct compound_plan {
    std::string head_code;
    std::string tail_code;
};

using crs_plan = std::variant<geographic_plan, geocentric_plan, projected_plan, single_plan, compound_plan>;

crs_plan plan_for(const row_reader& r) {
    auto kind = text::to_lower(r.required_string("COORD_REF_SYS_KIND"));
    if (kind == "geographic 2d" || kind == "geographic 3d") {
        auto datum_code = r.optional_string("DATUM_CODE");
        std::optional<std::string> base_code;
        if (!datum_code) base_code = r.required_string("BASE_CRS_CODE");
        return geographic_plan{kind == "geographic 3d", r.required_integer("COORD_SYS_CODE"),
                               datum_code, base_code};
    }
    if (kind == "geocentric") {
        return geocentric_plan{r.required_string("COORD_SYS_CODE"), r.required_string("DATUM_CODE")};
    }
    if (kind == "projected") {
        return projected_plan{r.required_string("COORD_SYS_CODE"), r.required_string("BASE_CRS_CODE"),
                              r.required_string("PROJECTION_CONV_CODE")};
    }
    if (kind == "vertical") {
        return single_plan{crs_type::vertical, object_kind::vertical_cs, object_kind::vertical_datum,
                           r.required_string("COORD_SYS_CODE"), r.required_string("DATUM_CODE")};
    }
    if (kind == "time" || kind == "temporal") {
        return single_plan{crs_type::temporal, object_kind::time_cs, object_kind::temporal_datum,
                           r.required_string("COORD_SYS_CODE"), r.required_string("DATUM_CODE")};
    }
    if (kind == "engineering") {
        return single_plan{crs_type::engineering, object_kind::coordinate_system, object_kind::engineering_datum,
                           r.required_string("COORD_SYS_CODE"), r.required_string("DATUM_CODE")};
    }
    if (kind == "parametric") {
        return single_plan{crs_type::parametric, object_kind::parametric_cs, object_kind::parametric_datum,
                           r.required_string("COORD_SYS_CODE"), r.required_string("DATUM_CODE")};
    }
    if (kind == "compound") {
        return compound_plan{r.required_string("CMPD_HORIZCRS_CODE"), r.required_string("CMPD_VERTCRS_CODE")};
    }
    throw malformed_data_error("Unknown CRS kind \"" + kind + "\" for code " + r.code() + ".");
}

/// Deprecated ellipsoidal CS using sexagesimal units, replaced by the
/// equivalent CS in decimal degrees.
int64_t replace_deprecated_cs(int64_t code) {
    if (code == 6402 || (code >= 6405 && code <= 6412)) return 6422;
    if (code == 6401 || (code >= 6413 && code <= 6420)) return 6423;
    return code;
}

constexpr double half_pi = 1.57079632679489661923;

bool is_latitude_parameter(const std::string& code) {
    return code == "8801" || code == "8811" || code == "8821" ||
           code == "8823" || code == "8824" || code == "8832";
}

bool is_scale_parameter(const std::string& code) {
    return code == "8805" || code == "8815" || code == "8819";
}

} // namespace

// ============================================================================
// Coordinate reference systems
// ============================================================================

crs_ptr epsg_resolver::crs_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::crs);
    auto key = to_primary_key(object_kind::crs, code);
    // A base CRS built with replaced coordinate systems is not the EPSG definition
    const bool use_cache = !ctx.replace_deprecated_cs;
    if (use_cache) {
        if (auto hit = cached<crs>(object_kind::crs, key)) return hit;
    }

    const auto code_text = std::to_string(key);
    crs_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("crs",
            "SELECT COORD_REF_SYS_CODE, COORD_REF_SYS_NAME, AREA_OF_USE_CODE, CRS_SCOPE, REMARKS,"
            " DEPRECATED, COORD_REF_SYS_KIND, COORD_SYS_CODE, DATUM_CODE, BASE_CRS_CODE,"
            " PROJECTION_CONV_CODE, CMPD_HORIZCRS_CODE, CMPD_VERTCRS_CODE"
            " FROM [Coordinate Reference System] WHERE COORD_REF_SYS_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("COORD_REF_SYS_NAME");
            source.legacy_extent = r.optional_string("AREA_OF_USE_CODE");
            source.legacy_scope = r.optional_string("CRS_SCOPE");
            source.remarks = r.string_or_empty("REMARKS");
            source.deprecated = r.flag("DEPRECATED");
            auto plan = plan_for(r);

            crs_type type = crs_type::compound;
            crs_fields fields;
            std::visit([&](auto&& p) {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, geographic_plan>) {
                    if (p.datum_code) {
                        fields.datum = datum_of_kind(ctx, *p.datum_code, object_kind::geodetic_datum);
                    } else {
                        fields.datum = crs_of_kind(ctx, *p.base_code, object_kind::geographic_crs)->datum_of();
                    }
                    auto cs_code = ctx.replace_deprecated_cs ? replace_deprecated_cs(p.cs_code) : p.cs_code;
                    fields.coordinate_system = cs_of_kind(ctx, std::to_string(cs_code), object_kind::ellipsoidal_cs);
                    type = p.three_dimensional ? crs_type::geographic_3d : crs_type::geographic_2d;
                } else if constexpr (std::is_same_v<T, geocentric_plan>) {
                    auto cs = cs_impl(ctx, p.cs_code);
                    if (cs->type() != cs_type::cartesian && cs->type() != cs_type::spherical) {
                        throw malformed_data_error("Illegal coordinate system \"" + cs->name() +
                                                   "\" for geocentric CRS " + code_text + ".");
                    }
                    fields.coordinate_system = cs;
                    fields.datum = datum_of_kind(ctx, p.datum_code, object_kind::geodetic_datum);
                    type = crs_type::geocentric;
                } else if constexpr (std::is_same_v<T, projected_plan>) {
                    auto conversion = operation_impl(ctx, p.conversion_code);
                    if (conversion->type() != operation_type::conversion) {
                        throw no_such_code_error("conversion", p.conversion_code);
                    }
                    crs_ptr base;
                    if (source.deprecated) {
                        auto base_ctx = ctx.for_deprecated_base();
                        base = crs_impl(base_ctx, p.base_code);
                    } else {
                        base = crs_impl(ctx, p.base_code);
                    }
                    if (!base->is_geographic() && base->type() != crs_type::geocentric) {
                        throw unsupported_operation_error("Projected CRS " + code_text + " is based on " +
                                                          to_string(base->type()) + " CRS " + base->code() +
                                                          "; only geographic and geocentric bases are supported.");
                    }
                    fields.coordinate_system = cs_of_kind(ctx, p.cs_code, object_kind::cartesian_cs);
                    check_conversion_parameters(*conversion, code_text,
                                                source.deprecated || ctx.relax_parameter_checks);
                    fields.base = std::move(base);
                    fields.conversion = std::move(conversion);
                    type = crs_type::projected;
                } else if constexpr (std::is_same_v<T, single_plan>) {
                    if (p.cs_kind == object_kind::coordinate_system) {
                        fields.coordinate_system = cs_impl(ctx, p.cs_code);
                    } else {
                        fields.coordinate_system = cs_of_kind(ctx, p.cs_code, p.cs_kind);
                    }
                    fields.datum = datum_of_kind(ctx, p.datum_code, p.datum_kind);
                    type = p.type;
                } else if constexpr (std::is_same_v<T, compound_plan>) {
                    fields.components.push_back(crs_impl(ctx, p.head_code));
                    fields.components.push_back(crs_impl(ctx, p.tail_code));
                    type = crs_type::compound;
                }
            }, plan);

            auto object = std::make_shared<const crs>(make_properties(ctx, info, key, std::move(source)),
                                                      type, std::move(fields));
            result = ensure_singleton<crs>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("coordinate reference system", code);
    }
    if (use_cache) {
        remember(object_kind::crs, key, result);
    }
    return result;
}

crs_ptr epsg_resolver::crs_of_kind(resolution_context& ctx, const std::string& code, object_kind kind) {
    auto result = crs_impl(ctx, code);
    if (result->kind() != kind) {
        throw no_such_code_error(to_string(kind), code);
    }
    return result;
}

void epsg_resolver::check_conversion_parameters(const coordinate_operation& conversion,
                                                const std::string& crs_code, bool relaxed) const {
    for (const auto& value : conversion.values()) {
        if (!value.descriptor) continue;
        const auto& parameter = value.descriptor->code();
        auto v = value.as_double();
        if (!v) continue;

        std::string problem;
        if (is_latitude_parameter(parameter)) {
            if (!value.value_unit || !value.value_unit->factor_to_base()) continue;
            double radians = *v * *value.value_unit->factor_to_base();
            if (std::abs(radians) > half_pi + 1e-12) {
                problem = "latitude out of range";
            }
        } else if (is_scale_parameter(parameter)) {
            if (!(*v > 0)) {
                problem = "scale factor must be positive";
            }
        }
        if (problem.empty()) continue;

        if (relaxed) {
            LOG_DEBUG("epsg", "Ignored invalid parameter %s of CRS %s: %s",
                      parameter.c_str(), crs_code.c_str(), problem.c_str());
            continue;
        }
        throw malformed_data_error("Invalid value " + std::to_string(*v) + " for parameter \"" +
                                   value.descriptor->name() + "\" of CRS " + crs_code + ": " + problem + ".");
    }
}

} // namespace geodetic
