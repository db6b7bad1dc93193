#include "geodetic/table_info.hpp"

namespace geodetic {

namespace {

const table_info tables[] = {
    {object_kind::crs, "Coordinate Reference System", "[Coordinate Reference System]",
     "COORD_REF_SYS_CODE", "COORD_REF_SYS_NAME", "COORD_REF_SYS_KIND", true},
    {object_kind::coordinate_system, "Coordinate System", "[Coordinate System]",
     "COORD_SYS_CODE", "COORD_SYS_NAME", "COORD_SYS_TYPE", true},
    {object_kind::axis, "Coordinate Axis",
     "[Coordinate Axis] AS CA INNER JOIN [Coordinate Axis Name] AS CAN"
     " ON CA.COORD_AXIS_NAME_CODE = CAN.COORD_AXIS_NAME_CODE",
     "COORD_AXIS_CODE", "COORD_AXIS_NAME", nullptr, false},
    {object_kind::datum, "Datum", "[Datum]",
     "DATUM_CODE", "DATUM_NAME", "DATUM_TYPE", true},
    {object_kind::ellipsoid, "Ellipsoid", "[Ellipsoid]",
     "ELLIPSOID_CODE", "ELLIPSOID_NAME", nullptr, true},
    {object_kind::prime_meridian, "Prime Meridian", "[Prime Meridian]",
     "PRIME_MERIDIAN_CODE", "PRIME_MERIDIAN_NAME", nullptr, true},
    {object_kind::coordinate_operation, "Coordinate_Operation", "[Coordinate_Operation]",
     "COORD_OP_CODE", "COORD_OP_NAME", "COORD_OP_TYPE", true},
    {object_kind::operation_method, "Coordinate_Operation Method", "[Coordinate_Operation Method]",
     "COORD_OP_METHOD_CODE", "COORD_OP_METHOD_NAME", nullptr, true},
    {object_kind::parameter, "Coordinate_Operation Parameter", "[Coordinate_Operation Parameter]",
     "PARAMETER_CODE", "PARAMETER_NAME", nullptr, true},
    {object_kind::unit, "Unit of Measure", "[Unit of Measure]",
     "UOM_CODE", "UNIT_OF_MEAS_NAME", nullptr, true},
    {object_kind::extent, "Extent", "[Extent]",
     "EXTENT_CODE", "EXTENT_NAME", nullptr, true},
    {object_kind::conventional_rs, "Conventional RS", "[Conventional RS]",
     "CONVENTIONAL_RS_CODE", "CONVENTIONAL_RS_NAME", nullptr, true},
};

// Values of the discriminator column, lower case
std::vector<std::string> discriminator_values(object_kind kind) {
    switch (kind) {
        case object_kind::geocentric_crs:         return {"geocentric"};
        case object_kind::projected_crs:          return {"projected"};
        case object_kind::vertical_crs:           return {"vertical"};
        case object_kind::temporal_crs:           return {"time", "temporal"};
        case object_kind::engineering_crs:        return {"engineering"};
        case object_kind::parametric_crs:         return {"parametric"};
        case object_kind::compound_crs:           return {"compound"};
        case object_kind::geodetic_datum:         return {"geodetic", "dynamic geodetic"};
        case object_kind::vertical_datum:         return {"vertical"};
        case object_kind::temporal_datum:         return {"temporal"};
        case object_kind::engineering_datum:      return {"engineering"};
        case object_kind::parametric_datum:       return {"parametric"};
        case object_kind::datum_ensemble:         return {"ensemble"};
        case object_kind::ellipsoidal_cs:         return {"ellipsoidal"};
        case object_kind::cartesian_cs:           return {"cartesian"};
        case object_kind::spherical_cs:           return {"spherical"};
        case object_kind::vertical_cs:            return {"vertical", "gravity-related"};
        case object_kind::time_cs:                return {"time", "temporal"};
        case object_kind::parametric_cs:          return {"parametric"};
        case object_kind::linear_cs:              return {"linear"};
        case object_kind::polar_cs:               return {"polar"};
        case object_kind::cylindrical_cs:         return {"cylindrical"};
        case object_kind::affine_cs:              return {"affine"};
        case object_kind::conversion:             return {"conversion"};
        case object_kind::transformation:         return {"transformation"};
        case object_kind::concatenated_operation: return {"concatenated operation"};
        case object_kind::point_motion_operation: return {"point motion operation"};
        default:                                  return {};
    }
}

} // namespace

const table_info& table_for(object_kind kind) {
    auto family = family_of(kind);
    for (const auto& info : tables) {
        if (info.family == family) return info;
    }
    // Every family has a row above
    return tables[0];
}

const std::vector<object_kind>& probed_families() {
    static const std::vector<object_kind> families = {
        object_kind::crs, object_kind::coordinate_system, object_kind::axis,
        object_kind::datum, object_kind::ellipsoid, object_kind::prime_meridian,
        object_kind::coordinate_operation, object_kind::operation_method,
        object_kind::parameter,
    };
    return families;
}

const std::vector<object_kind>& subtypes_of(object_kind family) {
    static const std::vector<object_kind> crs_kinds = {
        object_kind::geographic_crs, object_kind::geocentric_crs, object_kind::projected_crs,
        object_kind::vertical_crs, object_kind::temporal_crs, object_kind::engineering_crs,
        object_kind::parametric_crs, object_kind::compound_crs,
    };
    static const std::vector<object_kind> datum_kinds = {
        object_kind::geodetic_datum, object_kind::vertical_datum, object_kind::temporal_datum,
        object_kind::engineering_datum, object_kind::parametric_datum, object_kind::datum_ensemble,
    };
    static const std::vector<object_kind> cs_kinds = {
        object_kind::ellipsoidal_cs, object_kind::cartesian_cs, object_kind::spherical_cs,
        object_kind::vertical_cs, object_kind::time_cs, object_kind::parametric_cs,
        object_kind::linear_cs, object_kind::polar_cs, object_kind::cylindrical_cs,
        object_kind::affine_cs,
    };
    static const std::vector<object_kind> operation_kinds = {
        object_kind::conversion, object_kind::transformation,
        object_kind::concatenated_operation, object_kind::point_motion_operation,
    };
    static const std::vector<object_kind> none;
    switch (family) {
        case object_kind::crs:                  return crs_kinds;
        case object_kind::datum:                return datum_kinds;
        case object_kind::coordinate_system:    return cs_kinds;
        case object_kind::coordinate_operation: return operation_kinds;
        default:                                return none;
    }
}

std::string subtype_condition(object_kind kind) {
    const auto& info = table_for(kind);
    if (!info.type_column || kind == info.family) return {};
    std::string column = std::string("LOWER(") + info.type_column + ")";
    if (kind == object_kind::geographic_crs) {
        // "geographic 2D" and "geographic 3D"
        return column + " LIKE 'geographic%'";
    }
    auto values = discriminator_values(kind);
    if (values.empty()) return {};
    std::string condition = column + " IN (";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i != 0) condition += ", ";
        condition += "'" + values[i] + "'";
    }
    return condition + ")";
}

} // namespace geodetic
