#include "geodetic/resolver.hpp"
#include "geodetic/row_reader.hpp"
#include "geodetic/text.hpp"
#include "geodetic/units.hpp"
#include <cmath>

namespace geodetic {

namespace {

struct cs_rule {
    cs_type type;
    int min_dimension;
    int max_dimension;
};

// COORD_SYS_TYPE spellings and the dimensions each accepts
std::optional<cs_rule> rule_for(const std::string& type) {
    if (type == "ellipsoidal")                           return cs_rule{cs_type::ellipsoidal, 2, 3};
    if (type == "cartesian")                             return cs_rule{cs_type::cartesian, 2, 3};
    if (type == "spherical")                             return cs_rule{cs_type::spherical, 2, 3};
    if (type == "vertical" || type == "gravity-related") return cs_rule{cs_type::vertical, 1, 1};
    if (type == "time" || type == "temporal")            return cs_rule{cs_type::time, 1, 1};
    if (type == "parametric")                            return cs_rule{cs_type::parametric, 1, 1};
    if (type == "linear")                                return cs_rule{cs_type::linear, 1, 1};
    if (type == "polar")                                 return cs_rule{cs_type::polar, 2, 2};
    if (type == "cylindrical")                           return cs_rule{cs_type::cylindrical, 3, 3};
    if (type == "affine")                                return cs_rule{cs_type::affine, 2, 3};
    return std::nullopt;
}

bool is_known_direction(const std::string& orientation) {
    static const char* const directions[] = {
        "north", "north-north-east", "north-east", "east-north-east",
        "east", "east-south-east", "south-east", "south-south-east",
        "south", "south-south-west", "south-west", "west-south-west",
        "west", "west-north-west", "north-west", "north-north-west",
        "up", "down", "geocentricx", "geocentricy", "geocentricz",
        "future", "past", "columnpositive", "columnnegative", "rowpositive", "rownegative",
        "displayright", "displayleft", "displayup", "displaydown",
        "forward", "aft", "port", "starboard", "clockwise", "counterclockwise",
        "towards", "awayfrom", "unspecified",
    };
    auto lower = text::to_lower(orientation);
    // "North along 90°E" and similar polar directions
    if (lower.rfind("north along", 0) == 0 || lower.rfind("south along", 0) == 0) return true;
    for (const char* d : directions) {
        if (lower == d) return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Coordinate systems and axes
// ============================================================================

cs_ptr epsg_resolver::cs_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::coordinate_system);
    auto key = to_primary_key(object_kind::coordinate_system, code);
    if (auto hit = cached<coordinate_system>(object_kind::coordinate_system, key)) return hit;

    const auto code_text = std::to_string(key);
    cs_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("cs",
            "SELECT COORD_SYS_CODE, COORD_SYS_NAME, COORD_SYS_TYPE, DIMENSION, REMARKS, DEPRECATED"
            " FROM [Coordinate System] WHERE COORD_SYS_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            property_source source;
            source.name = r.required_string("COORD_SYS_NAME");
            source.remarks = r.string_or_empty("REMARKS");
            source.deprecated = r.flag("DEPRECATED");
            auto type = text::to_lower(r.required_string("COORD_SYS_TYPE"));
            auto dimension = r.required_integer("DIMENSION");

            std::vector<std::string> axis_codes;
            auto axis_rows = run("axis order",
                "SELECT COORD_AXIS_CODE FROM [Coordinate Axis] WHERE COORD_SYS_CODE = ? ORDER BY COORD_AXIS_ORDER",
                {key});
            for (const auto& a : axis_rows) {
                axis_codes.push_back(row_reader(a, "Coordinate Axis", code_text).required_string("COORD_AXIS_CODE"));
            }
            if (static_cast<int64_t>(axis_codes.size()) != dimension) {
                throw malformed_data_error("Coordinate system " + code_text + " declares " +
                                           std::to_string(dimension) + " dimensions but has " +
                                           std::to_string(axis_codes.size()) + " axes.");
            }

            auto rule = rule_for(type);
            if (!rule) {
                throw malformed_data_error("Unknown coordinate system type \"" + type + "\" for code " + code_text + ".");
            }
            if (dimension < rule->min_dimension || dimension > rule->max_dimension) {
                throw malformed_data_error("Unexpected dimension " + std::to_string(dimension) +
                                           " for " + type + " coordinate system " + code_text + ".");
            }

            std::vector<axis_ptr> axes;
            for (const auto& axis_code : axis_codes) {
                axes.push_back(axis_impl(ctx, axis_code));
            }
            auto object = std::make_shared<const coordinate_system>(
                make_properties(ctx, info, key, std::move(source)), rule->type, std::move(axes));
            result = ensure_singleton<coordinate_system>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("coordinate system", code);
    }
    remember(object_kind::coordinate_system, key, result);
    return result;
}

cs_ptr epsg_resolver::cs_of_kind(resolution_context& ctx, const std::string& code, object_kind kind) {
    auto result = cs_impl(ctx, code);
    if (result->kind() != kind) {
        throw no_such_code_error(to_string(kind), code);
    }
    return result;
}

axis_ptr epsg_resolver::axis_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::axis);
    auto key = to_primary_key(object_kind::axis, code);
    if (auto hit = cached<axis>(object_kind::axis, key)) return hit;

    const auto code_text = std::to_string(key);
    axis_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("axis",
            "SELECT COORD_AXIS_CODE, COORD_AXIS_NAME_CODE, COORD_AXIS_ORIENTATION,"
            " COORD_AXIS_ABBREVIATION, UOM_CODE"
            " FROM [Coordinate Axis] WHERE COORD_AXIS_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            auto name_code = r.required_integer("COORD_AXIS_NAME_CODE");
            auto orientation = r.required_string("COORD_AXIS_ORIENTATION");
            auto abbreviation = r.required_string("COORD_AXIS_ABBREVIATION");
            auto unit_code = r.required_string("UOM_CODE");
            if (!is_known_direction(orientation)) {
                throw malformed_data_error("Unknown axis orientation \"" + orientation + "\" for axis " + code_text + ".");
            }

            const auto& an = axis_name_of(name_code);
            property_source source;
            source.name = an.name;
            source.description = an.description;
            source.remarks = an.remarks;
            auto axis_unit = unit_impl(ctx, unit_code);
            auto object = std::make_shared<const axis>(make_properties(ctx, info, key, std::move(source)),
                                                       abbreviation, orientation, axis_unit);
            result = ensure_singleton<axis>(result, object, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("axis", code);
    }
    remember(object_kind::axis, key, result);
    return result;
}

const epsg_resolver::axis_name& epsg_resolver::axis_name_of(primary_key_t code) {
    auto it = axis_names_.find(code);
    if (it != axis_names_.end()) return it->second;

    auto code_text = std::to_string(code);
    auto rows = run("axis name",
                    "SELECT COORD_AXIS_NAME, DESCRIPTION, REMARKS FROM [Coordinate Axis Name]"
                    " WHERE COORD_AXIS_NAME_CODE = ?", {code});
    std::optional<axis_name> found;
    for (const auto& row : rows) {
        row_reader r(row, "Coordinate Axis Name", code_text);
        axis_name an{r.required_string("COORD_AXIS_NAME"), r.string_or_empty("DESCRIPTION"),
                     r.string_or_empty("REMARKS")};
        if (found && (found->name != an.name || found->description != an.description)) {
            throw duplicate_identifier_error(code_text);
        }
        found = an;
    }
    if (!found) {
        throw no_such_code_error("axis name", code_text);
    }
    return axis_names_.emplace(code, *found).first->second;
}

// ============================================================================
// Units of measure
// ============================================================================

unit_ptr epsg_resolver::unit_impl(resolution_context& ctx, const std::string& code) {
    const auto& info = table_for(object_kind::unit);
    auto key = to_primary_key(object_kind::unit, code);
    if (auto hit = cached<unit>(object_kind::unit, key)) return hit;

    const auto code_text = std::to_string(key);
    unit_ptr result;
    {
        in_flight_guard guard(ctx, {info.table, {key}});
        auto rows = run("unit",
            "SELECT UOM_CODE, FACTOR_B, FACTOR_C, TARGET_UOM_CODE, UNIT_OF_MEAS_NAME"
            " FROM [Unit of Measure] WHERE UOM_CODE = ?", {key});

        for (const auto& row : rows) {
            row_reader r(row, info.table, code_text);
            auto source = static_cast<int>(r.required_integer("UOM_CODE"));
            auto b = r.optional_double("FACTOR_B");
            auto c = r.optional_double("FACTOR_C");
            auto target = static_cast<int>(r.required_integer("TARGET_UOM_CODE"));
            auto name = r.string_or_empty("UNIT_OF_MEAS_NAME");

            if (source == target) {
                // A base unit converts to itself
                if (b.value_or(1.0) != 1.0 || c.value_or(1.0) != 1.0) {
                    throw malformed_data_error("Inconsistent factors for base unit " + code_text +
                                               ": FACTOR_B and FACTOR_C shall be 1.");
                }
            }

            unit_ptr found = units::from_epsg(source);
            if (!found) {
                auto base = units::from_epsg(target);
                // Null factors denote a non-linear conversion
                if (base && b && c && *c != 0 && !std::isnan(*b) && !std::isnan(*c)) {
                    found = units::derive(source, name, *base, *b, *c);
                } else {
                    found = units::parse(source, name);
                }
            }
            if (!found) {
                throw malformed_data_error("Unknown unit \"" + name + "\" for code " + code_text + ".");
            }
            result = ensure_singleton<unit>(result, found, code_text);
        }
    }
    if (!result) {
        throw no_such_code_error("unit", code);
    }
    remember(object_kind::unit, key, result);
    return result;
}

} // namespace geodetic
