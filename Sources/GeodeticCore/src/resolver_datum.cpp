#include "geodetic/resolver.hpp"
#include "geodetic/row_reader.hpp"
#include "geodetic/text.hpp"
#include <type_traits>
#include <variant>

namespace geodetic {

namespace {

struct geodetic_plan {
    bool dynamic;
    std::string ellipsoid_code;
    std::string prime_meridian_code;
};

struct vertical_plan {
    std::optional<int64_t> realization_method_code;
};

struct temporal_plan {};

/// Engineering and parametric datums carry nothing beyond the common columns.
struct plain_plan {
    datum_type type;
};

struct ensemble_plan {};

using datum_plan = std::variant<geodetic_plan, vertical_plan, temporal_plan, plain_plan, ensemble_plan>;

datum_plan plan_for(const row_reader& r) {
    auto type = text::to_lower(r.required_string("DATUM_TYPE"));
    if (type == "geodetic" || type == "dynamic geodetic") {
        return geodetic_plan{type == "dynamic geodetic", r.required_string("ELLIPSOID_CODE"),
                             r.required_string("PRIME_MERIDIAN_CODE")};
    }
    if (type == "vertical") return vertical_plan{r.optional_integer("REALIZATION_METHOD_CODE")};
    if (type == "temporal") return temporal_plan{};
    if (type == "engineering") return plain_plan{datum_type::engineering};
    if (type == "parametric") return plain_plan{datum_type::parametric};
    if (type == "ensemble") return ensemble_plan{};
    throw malformed_data_error("Unknown datum type \"" + type + "\" for code " + r.code() + ".");
}

/// True if `d` is of `kind`, or is an ensemble whose members are.
bool datum_matches(const datum& d, object_kind kind) {
    if (kind == object_kind::datum) return true;
    if (d.kind() == kind) return true;
    if (!d.is_ensemble()) return false;
    switch (kind) {
        case object_kind::geodetic_datum:    return d.is_geodetic();
        case object_kind::vertical_datum:    return d.member_type() == datum_type::vertical;
        case object_kind::temporal_datum:    return d.member_type() == datum_type::temporal;
        case object_kind::engineering_datum: return d.member_type() == datum_type::engineering;
        case object_kind::parametric_datum:  return d.member_type() == datum_type::parametric;
        default:                             return false;
    }
}

} // namespace

// ============================================================================
// Datums and ensembles
// ============================================================================

datum_ptr epsg_resolver::datum_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::datum);
    auto key = to_primary_key(object_kind::datum, code);
    if (auto hit = cached<datum>(object_kind::datum, key)) return hit;

    const auto code_text = std::to_string(key);
    datum_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("datum",
            "SELECT DATUM_CODE, DATUM_NAME, DATUM_TYPE, ORIGIN_DESCRIPTION, ANCHOR_EPOCH,"
            " FRAME_REFERENCE_EPOCH, PUBLICATION_DATE, AREA_OF_USE_CODE, DATUM_SCOPE, REMARKS,"
            " DEPRECATED, ELLIPSOID_CODE, PRIME_MERIDIAN_CODE, REALIZATION_METHOD_CODE,"
            " CONVENTIONAL_RS_CODE"
            " FROM [Datum] WHERE DATUM_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("DATUM_NAME");
            source.legacy_extent = r.optional_string("AREA_OF_USE_CODE");
            source.legacy_scope = r.optional_string("DATUM_SCOPE");
            source.remarks = r.string_or_empty("REMARKS");
            source.deprecated = r.flag("DEPRECATED");

            datum_fields fields;
            fields.anchor = r.string_or_empty("ORIGIN_DESCRIPTION");
            fields.anchor_epoch = r.optional_double("ANCHOR_EPOCH");
            auto frame_epoch = r.optional_double("FRAME_REFERENCE_EPOCH");
            fields.publication_date = r.string_or_empty("PUBLICATION_DATE");
            auto conventional_rs_code = r.optional_string("CONVENTIONAL_RS_CODE");
            auto plan = plan_for(r);

            datum_type type = datum_type::engineering;
            std::visit([&](auto&& p) {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, geodetic_plan>) {
                    fields.ellipsoid = ellipsoid_impl(ctx, p.ellipsoid_code);
                    fields.prime_meridian = prime_meridian_impl(ctx, p.prime_meridian_code);
                    if (p.dynamic) fields.frame_reference_epoch = frame_epoch;
                    type = p.dynamic ? datum_type::dynamic_geodetic : datum_type::geodetic;
                } else if constexpr (std::is_same_v<T, vertical_plan>) {
                    fields.realization_method = realization_method(p.realization_method_code);
                    fields.frame_reference_epoch = frame_epoch;
                    type = datum_type::vertical;
                } else if constexpr (std::is_same_v<T, temporal_plan>) {
                    // The time origin is stored as the origin description
                    if (fields.anchor.empty()) {
                        throw malformed_data_error("Temporal datum " + code_text + ": origin shall be a date.");
                    }
                    type = datum_type::temporal;
                } else if constexpr (std::is_same_v<T, plain_plan>) {
                    type = p.type;
                } else if constexpr (std::is_same_v<T, ensemble_plan>) {
                    std::optional<double> accuracy;
                    auto accuracy_rows = run("datum ensemble",
                        "SELECT ENSEMBLE_ACCURACY FROM [Datum Ensemble] WHERE DATUM_ENSEMBLE_CODE = ?", {key});
                    for (const auto& a : accuracy_rows) {
                        double value = row_reader(a, "Datum Ensemble", code_text).required_double("ENSEMBLE_ACCURACY");
                        if (!accuracy || value > *accuracy) accuracy = value;
                    }
                    std::vector<std::string> member_codes;
                    auto member_rows = run("datum ensemble member",
                        "SELECT DATUM_CODE FROM [Datum Ensemble Member]"
                        " WHERE DATUM_ENSEMBLE_CODE = ? ORDER BY DATUM_SEQUENCE", {key});
                    for (const auto& m : member_rows) {
                        member_codes.push_back(row_reader(m, "Datum Ensemble Member", code_text).required_string("DATUM_CODE"));
                    }
                    for (const auto& member : member_codes) {
                        fields.members.push_back(datum_impl(ctx, member));
                    }
                    fields.ensemble_accuracy = accuracy;
                    type = datum_type::ensemble;
                }
            }, plan);

            if (conventional_rs_code) {
                fields.conventional_rs = conventional_rs_impl(ctx, *conventional_rs_code);
            }
            auto object = std::make_shared<const datum>(make_properties(ctx, info, key, std::move(source)),
                                                        type, std::move(fields));
            result = ensure_singleton<datum>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("datum", code);
    }
    remember(object_kind::datum, key, result);
    return result;
}

datum_ptr epsg_resolver::datum_of_kind(resolution_context& ctx, const std::string& code, object_kind kind) {
    auto result = datum_impl(ctx, code);
    if (!datum_matches(*result, kind)) {
        throw no_such_code_error(to_string(kind), code);
    }
    return result;
}

std::string epsg_resolver::realization_method(std::optional<int64_t> code) {
    if (!code) return "geoidal";
    auto it = realization_methods_.find(*code);
    if (it != realization_methods_.end()) return it->second;

    auto code_text = std::to_string(*code);
    auto rows = run("realization method",
                    "SELECT REALIZATION_METHOD_NAME FROM [Datum Realization Method] WHERE REALIZATION_METHOD_CODE = ?",
                    {*code});
    std::optional<std::string> name;
    for (const auto& row : rows) {
        auto value = row_reader(row, "Datum Realization Method", code_text).required_string("REALIZATION_METHOD_NAME");
        if (name && *name != value) {
            throw duplicate_identifier_error(code_text);
        }
        name = value;
    }
    if (!name) {
        throw no_such_code_error("realization method", code_text);
    }
    realization_methods_[*code] = *name;
    return *name;
}

conventional_rs_ptr epsg_resolver::conventional_rs_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::conventional_rs);
    auto key = to_primary_key(object_kind::conventional_rs, code);
    if (auto hit = cached<conventional_rs>(object_kind::conventional_rs, key)) return hit;

    const auto code_text = std::to_string(key);
    conventional_rs_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("conventional rs",
            "SELECT CONVENTIONAL_RS_CODE, CONVENTIONAL_RS_NAME, REMARKS, DEPRECATED"
            " FROM [Conventional RS] WHERE CONVENTIONAL_RS_CODE = ?", {key});
        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("CONVENTIONAL_RS_NAME");
            source.remarks = r.string_or_empty("REMARKS");
            source.deprecated = r.flag("DEPRECATED");
            auto object = std::make_shared<const conventional_rs>(make_properties(ctx, info, key, std::move(source)));
            result = ensure_singleton<conventional_rs>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("conventional RS", code);
    }
    remember(object_kind::conventional_rs, key, result);
    return result;
}

// ============================================================================
// Ellipsoids and prime meridians
// ============================================================================

ellipsoid_ptr epsg_resolver::ellipsoid_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::ellipsoid);
    auto key = to_primary_key(object_kind::ellipsoid, code);
    if (auto hit = cached<ellipsoid>(object_kind::ellipsoid, key)) return hit;

    const auto code_text = std::to_string(key);
    ellipsoid_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("ellipsoid",
            "SELECT ELLIPSOID_CODE, ELLIPSOID_NAME, SEMI_MAJOR_AXIS, INV_FLATTENING, SEMI_MINOR_AXIS,"
            " UOM_CODE, REMARKS, DEPRECATED"
            " FROM [Ellipsoid] WHERE ELLIPSOID_CODE = ?", {key});
        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("ELLIPSOID_NAME");
            source.remarks = r.string_or_empty("REMARKS");
            source.deprecated = r.flag("DEPRECATED");
            double semi_major = r.required_double("SEMI_MAJOR_AXIS");
            auto inverse_flattening = r.optional_double("INV_FLATTENING");
            auto semi_minor = r.optional_double("SEMI_MINOR_AXIS");
            auto unit_code = r.required_string("UOM_CODE");

            if (!inverse_flattening && !semi_minor) {
                throw malformed_data_error("Ellipsoid " + code_text +
                                           " has neither an inverse flattening nor a semi-minor axis.");
            }
            if (inverse_flattening && semi_minor) {
                LOG_WARN("epsg", "Ellipsoid EPSG:%s defines both the inverse flattening and the"
                         " semi-minor axis; the inverse flattening is used", code_text.c_str());
            }

            auto axis_unit = unit_impl(ctx, unit_code);
            if (axis_unit->type() != unit_type::length) {
                throw malformed_data_error("Unit " + unit_code + " of ellipsoid " + code_text + " is not a length.");
            }
            bool ivf = inverse_flattening.has_value();
            auto object = std::make_shared<const ellipsoid>(make_properties(ctx, info, key, std::move(source)),
                                                            semi_major, ivf ? *inverse_flattening : *semi_minor,
                                                            ivf, axis_unit);
            result = ensure_singleton<ellipsoid>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("ellipsoid", code);
    }
    remember(object_kind::ellipsoid, key, result);
    return result;
}

prime_meridian_ptr epsg_resolver::prime_meridian_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::prime_meridian);
    auto key = to_primary_key(object_kind::prime_meridian, code);
    if (auto hit = cached<prime_meridian>(object_kind::prime_meridian, key)) return hit;

    const auto code_text = std::to_string(key);
    prime_meridian_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("prime meridian",
            "SELECT PRIME_MERIDIAN_CODE, PRIME_MERIDIAN_NAME, GREENWICH_LONGITUDE, UOM_CODE, REMARKS, DEPRECATED"
            " FROM [Prime Meridian] WHERE PRIME_MERIDIAN_CODE = ?", {key});
        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("PRIME_MERIDIAN_NAME");
            source.remarks = r.string_or_empty("REMARKS");
            source.deprecated = r.flag("DEPRECATED");
            double longitude = r.required_double("GREENWICH_LONGITUDE");
            auto unit_code = r.required_string("UOM_CODE");

            auto angular_unit = unit_impl(ctx, unit_code);
            if (angular_unit->type() != unit_type::angle) {
                throw malformed_data_error("Unit " + unit_code + " of prime meridian " + code_text +
                                           " is not an angle.");
            }
            auto object = std::make_shared<const prime_meridian>(make_properties(ctx, info, key, std::move(source)),
                                                                 longitude, angular_unit);
            result = ensure_singleton<prime_meridian>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("prime meridian", code);
    }
    remember(object_kind::prime_meridian, key, result);
    return result;
}

} // namespace geodetic
