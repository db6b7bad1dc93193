#include "geodetic/resolver.hpp"
#include "geodetic/row_reader.hpp"
#include "geodetic/text.hpp"
#include <cmath>

namespace geodetic {

namespace {

// Parameters whose value is an EPSG code: integer type, no unit
bool is_code_parameter(primary_key_t code) {
    return code == 1048 || code == 1062;
}

std::optional<operation_type> operation_type_of(const std::string& type) {
    if (type == "transformation") return operation_type::transformation;
    if (type == "conversion") return operation_type::conversion;
    if (type == "concatenated operation") return operation_type::concatenated;
    if (type == "point motion operation") return operation_type::point_motion;
    return std::nullopt;
}

parameter_ptr make_descriptor(properties props, primary_key_t code, parameter_value_type type,
                              unit_ptr default_unit, std::optional<bool> sign_reversal) {
    if (is_code_parameter(code)) {
        type = parameter_value_type::integer;
        default_unit = nullptr;
    }
    return std::make_shared<const parameter_descriptor>(std::move(props), type, std::move(default_unit),
                                                        sign_reversal);
}

/// The method with the descriptors of `values`. Descriptors equal to the
/// method's own are shared; if any differs a new method is built.
method_ptr recreate_if_changed(const method_ptr& generic, std::vector<parameter_value>& values) {
    const auto& existing = generic->parameters();
    std::vector<parameter_ptr> descriptors;
    bool changed = values.size() != existing.size();
    for (size_t i = 0; i < values.size(); ++i) {
        auto& descriptor = values[i].descriptor;
        if (i < existing.size() && descriptor->equals(*existing[i])) {
            descriptor = existing[i];
        } else {
            changed = true;
        }
        descriptors.push_back(descriptor);
    }
    if (!changed) return generic;
    return std::make_shared<const operation_method>(generic->props(), std::move(descriptors));
}

} // namespace

// ============================================================================
// Coordinate operations
// ============================================================================

operation_ptr epsg_resolver::operation_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::coordinate_operation);
    auto key = to_primary_key(object_kind::coordinate_operation, code);
    if (auto hit = cached<coordinate_operation>(object_kind::coordinate_operation, key)) return hit;

    const auto code_text = std::to_string(key);
    operation_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("operation",
            "SELECT COORD_OP_CODE, COORD_OP_NAME, COORD_OP_TYPE, SOURCE_CRS_CODE, TARGET_CRS_CODE,"
            " COORD_OP_METHOD_CODE, COORD_TFM_VERSION, COORD_OP_ACCURACY, AREA_OF_USE_CODE,"
            " COORD_OP_SCOPE, REMARKS, DEPRECATED"
            " FROM [Coordinate_Operation] WHERE COORD_OP_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("COORD_OP_NAME");
            auto type_name = text::to_lower(r.required_string("COORD_OP_TYPE"));
            auto type = operation_type_of(type_name);
            if (!type) {
                throw malformed_data_error("Unknown operation type \"" + type_name + "\" for code " + code_text + ".");
            }
            // Source and target are optional for conversions only, the method for concatenations only
            std::optional<std::string> source_code, target_code;
            if (*type == operation_type::conversion) {
                source_code = r.optional_string("SOURCE_CRS_CODE");
                target_code = r.optional_string("TARGET_CRS_CODE");
            } else {
                source_code = r.required_string("SOURCE_CRS_CODE");
                target_code = r.required_string("TARGET_CRS_CODE");
            }
            std::optional<int64_t> method_code;
            if (*type == operation_type::concatenated) {
                method_code = r.optional_integer("COORD_OP_METHOD_CODE");
            } else {
                method_code = r.required_integer("COORD_OP_METHOD_CODE");
            }
            operation_fields fields;
            fields.version = r.string_or_empty("COORD_TFM_VERSION");
            fields.accuracy = r.optional_double("COORD_OP_ACCURACY");
            source.legacy_extent = r.optional_string("AREA_OF_USE_CODE");
            source.legacy_scope = r.optional_string("COORD_OP_SCOPE");
            source.remarks = r.string_or_empty("REMARKS");
            source.deprecated = r.flag("DEPRECATED");

            if (source_code) fields.source = crs_impl(ctx, *source_code);
            if (target_code) fields.target = crs_impl(ctx, *target_code);

            if (method_code) {
                auto generic = method_impl(ctx, std::to_string(*method_code));
                fields.values = parameter_values(ctx, key, *method_code);
                fields.method = recreate_if_changed(generic, fields.values);
            }

            if (*type == operation_type::concatenated) {
                std::vector<std::string> step_codes;
                auto step_rows = run("operation path",
                    "SELECT SINGLE_OPERATION_CODE FROM [Coordinate_Operation Path]"
                    " WHERE (CONCAT_OPERATION_CODE = ?) ORDER BY OP_PATH_STEP", {key});
                for (const auto& s : step_rows) {
                    step_codes.push_back(row_reader(s, "Coordinate_Operation Path", code_text)
                                             .required_string("SINGLE_OPERATION_CODE"));
                }
                if (step_codes.size() < 2) {
                    throw unsupported_operation_error("Concatenated operation " + code_text + " has " +
                                                      std::to_string(step_codes.size()) +
                                                      " step(s); at least two are required.");
                }
                for (const auto& step : step_codes) {
                    fields.steps.push_back(operation_impl(ctx, step));
                }
            }

            auto object = std::make_shared<const coordinate_operation>(
                make_properties(ctx, info, key, std::move(source)), *type, std::move(fields));
            result = ensure_singleton<coordinate_operation>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("coordinate operation", code);
    }
    remember(object_kind::coordinate_operation, key, result);
    return result;
}

method_ptr epsg_resolver::method_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::operation_method);
    auto key = to_primary_key(object_kind::operation_method, code);
    if (auto hit = cached<operation_method>(object_kind::operation_method, key)) return hit;

    const auto code_text = std::to_string(key);
    method_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("method",
            "SELECT COORD_OP_METHOD_CODE, COORD_OP_METHOD_NAME, REMARKS, DEPRECATED"
            " FROM [Coordinate_Operation Method] WHERE COORD_OP_METHOD_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("COORD_OP_METHOD_NAME");
            source.remarks = r.string_or_empty("REMARKS");
            source.deprecated = r.flag("DEPRECATED");

            std::vector<std::string> parameter_codes;
            auto usage_rows = run("parameter usage",
                "SELECT PARAMETER_CODE FROM [Coordinate_Operation Parameter Usage]"
                " WHERE COORD_OP_METHOD_CODE = ? ORDER BY SORT_ORDER", {key});
            for (const auto& u : usage_rows) {
                parameter_codes.push_back(row_reader(u, "Coordinate_Operation Parameter Usage", code_text)
                                              .required_string("PARAMETER_CODE"));
            }
            std::vector<parameter_ptr> parameters;
            for (const auto& p : parameter_codes) {
                parameters.push_back(parameter_impl(ctx, p));
            }
            auto object = std::make_shared<const operation_method>(
                make_properties(ctx, info, key, std::move(source)), std::move(parameters));
            result = ensure_singleton<operation_method>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("operation method", code);
    }
    remember(object_kind::operation_method, key, result);
    return result;
}

// ============================================================================
// Parameter descriptors and their variants
// ============================================================================

parameter_ptr epsg_resolver::parameter_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::parameter);
    auto key = to_primary_key(object_kind::parameter, code);
    if (auto hit = cached<parameter_descriptor>(object_kind::parameter, key)) return hit;

    const auto code_text = std::to_string(key);
    parameter_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("parameter",
            "SELECT PARAMETER_CODE, PARAMETER_NAME, DESCRIPTION, DEPRECATED"
            " FROM [Coordinate_Operation Parameter] WHERE PARAMETER_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("PARAMETER_NAME");
            source.description = r.string_or_empty("DESCRIPTION");
            source.deprecated = r.flag("DEPRECATED");

            auto unit_code = dominant_unit(ctx, key, nullptr);
            auto type = has_file_reference(key) ? parameter_value_type::uri : parameter_value_type::real;
            auto reversal = sign_reversal(key);
            unit_ptr default_unit = unit_code ? unit_impl(ctx, *unit_code) : nullptr;

            auto object = make_descriptor(make_properties(ctx, info, key, std::move(source)), key, type,
                                          default_unit, reversal);
            result = ensure_singleton<parameter_descriptor>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("parameter", code);
    }
    remember(object_kind::parameter, key, result);
    return result;
}

parameter_ptr epsg_resolver::parameter_variant(resolution_context& ctx, const parameter_key& key) {
    auto it = parameter_variants_.find(key);
    if (it != parameter_variants_.end()) return it->second;

    auto generic = parameter_impl(ctx, std::to_string(key.code));
    unit_ptr default_unit = key.unit_code.empty() ? nullptr : unit_impl(ctx, key.unit_code);
    auto variant = make_descriptor(generic->props(), key.code, key.type, default_unit, key.sign_reversal);
    // Share the generic instance when the options change nothing
    parameter_ptr result = variant->equals(*generic) ? generic : variant;
    parameter_variants_[key] = result;
    return result;
}

std::optional<std::string> epsg_resolver::dominant_unit(resolution_context& ctx, primary_key_t parameter,
                                                        const unit* compatible_with) {
    auto rows = run("parameter unit",
                    "SELECT UOM_CODE FROM [Coordinate_Operation Parameter Value]"
                    " WHERE (PARAMETER_CODE = ?) GROUP BY UOM_CODE ORDER BY COUNT(UOM_CODE) DESC",
                    {parameter});
    std::vector<std::string> candidates;
    for (const auto& row : rows) {
        if (auto c = row_reader(row, "Coordinate_Operation Parameter Value", std::to_string(parameter))
                         .optional_string("UOM_CODE")) {
            candidates.push_back(*c);
        }
    }
    for (const auto& c : candidates) {
        if (compatible_with && !unit_impl(ctx, c)->is_compatible(*compatible_with)) {
            continue;
        }
        return c;
    }
    return std::nullopt;
}

bool epsg_resolver::has_file_reference(primary_key_t parameter) {
    auto rows = run("parameter type",
                    "SELECT PARAM_VALUE_FILE_REF FROM [Coordinate_Operation Parameter Value]"
                    " WHERE PARAM_VALUE_FILE_REF IS NOT NULL AND (PARAMETER_CODE = ?)",
                    {parameter});
    for (const auto& row : rows) {
        auto ref = row_reader(row, "Coordinate_Operation Parameter Value", std::to_string(parameter))
                       .optional_string("PARAM_VALUE_FILE_REF");
        if (ref && ref->find_first_not_of(" \t\r\n") != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<bool> epsg_resolver::sign_reversal(primary_key_t parameter) {
    auto rows = run("sign reversal",
                    "SELECT DISTINCT PARAM_SIGN_REVERSAL FROM [Coordinate_Operation Parameter Usage]"
                    " WHERE (PARAMETER_CODE = ?)",
                    {parameter});
    std::optional<bool> reversal;
    for (const auto& row : rows) {
        auto value = row_reader(row, "Coordinate_Operation Parameter Usage", std::to_string(parameter))
                         .optional_bool("PARAM_SIGN_REVERSAL");
        // Unknown for at least one method: undecided
        if (!value) return std::nullopt;
        if (reversal && *reversal != *value) {
            LOG_WARN("epsg", "Parameter EPSG:%lld changes sign for some methods only",
                     static_cast<long long>(parameter));
            return std::nullopt;
        }
        reversal = value;
    }
    return reversal;
}

std::vector<parameter_value> epsg_resolver::parameter_values(resolution_context& ctx, primary_key_t operation,
                                                             primary_key_t method) {
    struct value_row {
        primary_key_t parameter;
        std::optional<double> value;
        std::optional<std::string> reference;
        std::optional<std::string> unit_code;
        std::optional<bool> sign_reversal;
    };

    const auto code_text = std::to_string(operation);
    auto rows = run("parameter values",
        "SELECT CV.PARAMETER_CODE AS PARAMETER_CODE, CV.PARAMETER_VALUE AS PARAMETER_VALUE,"
        " CV.PARAM_VALUE_FILE_REF AS PARAM_VALUE_FILE_REF, CV.UOM_CODE AS UOM_CODE,"
        " CU.PARAM_SIGN_REVERSAL AS PARAM_SIGN_REVERSAL"
        " FROM [Coordinate_Operation Parameter Value] AS CV"
        " INNER JOIN [Coordinate_Operation Parameter Usage] AS CU"
        " ON (CV.PARAMETER_CODE = CU.PARAMETER_CODE) AND (CV.COORD_OP_METHOD_CODE = CU.COORD_OP_METHOD_CODE)"
        " WHERE CV.COORD_OP_METHOD_CODE = ? AND CV.COORD_OP_CODE = ?"
        " ORDER BY CU.SORT_ORDER",
        {method, operation});

    std::vector<value_row> collected;
    for (const auto& row : rows) {
        row_reader r(row, "Coordinate_Operation Parameter Value", code_text);
        value_row v;
        v.parameter = r.required_integer("PARAMETER_CODE");
        v.value = r.optional_double("PARAMETER_VALUE");
        // No numeric value: the value is a file reference
        if (!v.value) v.reference = r.required_string("PARAM_VALUE_FILE_REF");
        v.unit_code = r.optional_string("UOM_CODE");
        v.sign_reversal = r.optional_bool("PARAM_SIGN_REVERSAL");
        collected.push_back(std::move(v));
    }

    std::vector<parameter_value> values;
    for (const auto& v : collected) {
        unit_ptr value_unit = v.unit_code ? unit_impl(ctx, *v.unit_code) : nullptr;

        parameter_key key;
        key.code = v.parameter;
        key.type = v.reference ? parameter_value_type::uri : parameter_value_type::real;
        key.unit_code = dominant_unit(ctx, v.parameter, value_unit.get()).value_or(std::string());
        key.sign_reversal = v.sign_reversal;

        parameter_value pv;
        pv.descriptor = parameter_variant(ctx, key);
        pv.value_unit = value_unit;
        if (v.reference) {
            pv.value = *v.reference;
        } else if (pv.descriptor->value_type() == parameter_value_type::integer) {
            pv.value = static_cast<int64_t>(std::llround(*v.value));
        } else {
            pv.value = *v.value;
        }
        values.push_back(std::move(pv));
    }
    return values;
}

} // namespace geodetic
