#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geodetic {

// ============================================================================
// Object kinds. Families map to one EPSG table each; the other kinds are
// subtypes selected by the table's discriminator column.
// ============================================================================

enum class object_kind {
    // Coordinate reference systems
    crs,
    geographic_crs,
    geocentric_crs,
    projected_crs,
    vertical_crs,
    temporal_crs,
    engineering_crs,
    parametric_crs,
    compound_crs,
    // Datums
    datum,
    geodetic_datum,
    vertical_datum,
    temporal_datum,
    engineering_datum,
    parametric_datum,
    datum_ensemble,
    // Coordinate systems
    coordinate_system,
    ellipsoidal_cs,
    cartesian_cs,
    spherical_cs,
    vertical_cs,
    time_cs,
    parametric_cs,
    linear_cs,
    polar_cs,
    cylindrical_cs,
    affine_cs,
    // Operations
    coordinate_operation,
    conversion,
    transformation,
    concatenated_operation,
    point_motion_operation,
    // Single-table kinds
    axis,
    ellipsoid,
    prime_meridian,
    extent,
    unit,
    parameter,
    operation_method,
    conventional_rs
};

const char* to_string(object_kind kind);

/// The table-level kind (e.g. projected_crs -> crs).
object_kind family_of(object_kind kind);

// ============================================================================
// Common metadata
// ============================================================================

struct citation {
    std::string title = "EPSG Geodetic Parameter Dataset";
    std::string edition;
    std::string edition_date;
};

struct name_space {
    std::string name;
};

struct alias_name {
    std::shared_ptr<const name_space> scope;  ///< Naming system, may be null
    std::string name;
};

struct identifier {
    std::string codespace = "EPSG";
    std::string code;
    std::string version;        ///< Dataset edition
    std::string description;
    bool deprecated = false;
    /// Replacement text of a deprecated identifier: a code, or "(none)".
    std::string replaced_by;
    std::string remarks;

    /// The replacement as a code, if it is one.
    std::optional<std::string> replacement_code() const;
};

class extent;
class crs;

struct domain {
    std::string scope;                             ///< Empty when unknown
    std::shared_ptr<const extent> domain_of_validity;
};

struct properties {
    std::string name;
    identifier id;
    std::vector<alias_name> aliases;
    std::string remarks;
    bool deprecated = false;
    std::vector<domain> domains;
};

nlohmann::json to_json(const properties& props);

// ============================================================================
// Identified objects. Instances are immutable once built and shared through
// std::shared_ptr<const T>.
// ============================================================================

class identified_object {
public:
    explicit identified_object(properties props) : props_(std::move(props)) {}
    virtual ~identified_object() = default;

    const properties& props() const { return props_; }
    const std::string& name() const { return props_.name; }
    const identifier& id() const { return props_.id; }
    const std::string& code() const { return props_.id.code; }
    bool is_deprecated() const { return props_.deprecated; }

    virtual object_kind kind() const = 0;
    virtual nlohmann::json to_json() const;

    /// Structural equality: same JSON form.
    bool equals(const identified_object& other) const;

protected:
    properties props_;
};

using object_ptr = std::shared_ptr<const identified_object>;

// MARK: Units

enum class unit_type { length, angle, scale, time, parametric, other };

const char* to_string(unit_type type);

class unit : public identified_object {
public:
    unit(properties props, unit_type type, std::string symbol,
         std::optional<double> factor_to_base, int base_code)
        : identified_object(std::move(props)), type_(type), symbol_(std::move(symbol))
        , factor_to_base_(factor_to_base), base_code_(base_code) {}

    object_kind kind() const override { return object_kind::unit; }
    nlohmann::json to_json() const override;

    unit_type type() const { return type_; }
    const std::string& symbol() const { return symbol_; }
    /// Scale to the base unit of the same type, empty for non-linear units (sexagesimal).
    std::optional<double> factor_to_base() const { return factor_to_base_; }
    int base_code() const { return base_code_; }
    bool is_linear() const { return factor_to_base_.has_value(); }
    bool is_compatible(const unit& other) const { return type_ == other.type_; }

private:
    unit_type type_;
    std::string symbol_;
    std::optional<double> factor_to_base_;
    int base_code_;
};

using unit_ptr = std::shared_ptr<const unit>;

// MARK: Extent

struct vertical_extent {
    double minimum = 0.0;
    double maximum = 0.0;
    std::shared_ptr<const crs> vertical_crs;  ///< May be null
};

struct temporal_extent {
    std::string begin;
    std::string end;
};

class extent : public identified_object {
public:
    extent(properties props, std::string description,
           std::optional<geographic_bbox> bbox,
           std::optional<vertical_extent> vertical,
           std::optional<temporal_extent> temporal)
        : identified_object(std::move(props)), description_(std::move(description))
        , bbox_(std::move(bbox)), vertical_(std::move(vertical)), temporal_(std::move(temporal)) {}

    object_kind kind() const override { return object_kind::extent; }
    nlohmann::json to_json() const override;

    const std::string& description() const { return description_; }
    const std::optional<geographic_bbox>& bbox() const { return bbox_; }
    const std::optional<vertical_extent>& vertical() const { return vertical_; }
    const std::optional<temporal_extent>& temporal() const { return temporal_; }

private:
    std::string description_;
    std::optional<geographic_bbox> bbox_;
    std::optional<vertical_extent> vertical_;
    std::optional<temporal_extent> temporal_;
};

using extent_ptr = std::shared_ptr<const extent>;

// MARK: Ellipsoid and prime meridian

class ellipsoid : public identified_object {
public:
    ellipsoid(properties props, double semi_major_axis, double second_parameter,
              bool ivf_definitive, unit_ptr axis_unit)
        : identified_object(std::move(props)), semi_major_axis_(semi_major_axis)
        , second_parameter_(second_parameter), ivf_definitive_(ivf_definitive)
        , axis_unit_(std::move(axis_unit)) {}

    object_kind kind() const override { return object_kind::ellipsoid; }
    nlohmann::json to_json() const override;

    double semi_major_axis() const { return semi_major_axis_; }
    double semi_minor_axis() const;
    /// Infinite for a sphere.
    double inverse_flattening() const;
    bool is_ivf_definitive() const { return ivf_definitive_; }
    bool is_sphere() const;
    const unit_ptr& axis_unit() const { return axis_unit_; }

private:
    double semi_major_axis_;
    double second_parameter_;  ///< Inverse flattening or semi-minor axis
    bool ivf_definitive_;
    unit_ptr axis_unit_;
};

using ellipsoid_ptr = std::shared_ptr<const ellipsoid>;

class prime_meridian : public identified_object {
public:
    prime_meridian(properties props, double greenwich_longitude, unit_ptr angular_unit)
        : identified_object(std::move(props)), greenwich_longitude_(greenwich_longitude)
        , angular_unit_(std::move(angular_unit)) {}

    object_kind kind() const override { return object_kind::prime_meridian; }
    nlohmann::json to_json() const override;

    double greenwich_longitude() const { return greenwich_longitude_; }
    const unit_ptr& angular_unit() const { return angular_unit_; }

private:
    double greenwich_longitude_;
    unit_ptr angular_unit_;
};

using prime_meridian_ptr = std::shared_ptr<const prime_meridian>;

// MARK: Coordinate systems

class axis : public identified_object {
public:
    axis(properties props, std::string abbreviation, std::string direction, unit_ptr axis_unit)
        : identified_object(std::move(props)), abbreviation_(std::move(abbreviation))
        , direction_(std::move(direction)), unit_(std::move(axis_unit)) {}

    object_kind kind() const override { return object_kind::axis; }
    nlohmann::json to_json() const override;

    const std::string& abbreviation() const { return abbreviation_; }
    const std::string& direction() const { return direction_; }
    const unit_ptr& axis_unit() const { return unit_; }

private:
    std::string abbreviation_;
    std::string direction_;
    unit_ptr unit_;
};

using axis_ptr = std::shared_ptr<const axis>;

enum class cs_type {
    ellipsoidal, cartesian, spherical, vertical, time,
    parametric, linear, polar, cylindrical, affine
};

const char* to_string(cs_type type);

class coordinate_system : public identified_object {
public:
    coordinate_system(properties props, cs_type type, std::vector<axis_ptr> axes)
        : identified_object(std::move(props)), type_(type), axes_(std::move(axes)) {}

    object_kind kind() const override;
    nlohmann::json to_json() const override;

    cs_type type() const { return type_; }
    size_t dimension() const { return axes_.size(); }
    const std::vector<axis_ptr>& axes() const { return axes_; }

private:
    cs_type type_;
    std::vector<axis_ptr> axes_;
};

using cs_ptr = std::shared_ptr<const coordinate_system>;

// MARK: Datums

class conventional_rs : public identified_object {
public:
    explicit conventional_rs(properties props) : identified_object(std::move(props)) {}

    object_kind kind() const override { return object_kind::conventional_rs; }
};

using conventional_rs_ptr = std::shared_ptr<const conventional_rs>;

enum class datum_type {
    geodetic, dynamic_geodetic, vertical, temporal, engineering, parametric, ensemble
};

const char* to_string(datum_type type);

class datum;
using datum_ptr = std::shared_ptr<const datum>;

struct datum_fields {
    std::string anchor;                           ///< ORIGIN_DESCRIPTION (time origin for temporal datums)
    std::optional<double> anchor_epoch;
    std::optional<double> frame_reference_epoch;  ///< Dynamic geodetic datums only
    std::string publication_date;
    ellipsoid_ptr ellipsoid;                      ///< Geodetic datums only
    prime_meridian_ptr prime_meridian;            ///< Geodetic datums only
    std::string realization_method;               ///< Vertical datums only
    conventional_rs_ptr conventional_rs;          ///< Members of an ensemble
    std::vector<datum_ptr> members;               ///< Ensembles only
    std::optional<double> ensemble_accuracy;      ///< Ensembles only, in metres
};

class datum : public identified_object {
public:
    datum(properties props, datum_type type, datum_fields fields)
        : identified_object(std::move(props)), type_(type), fields_(std::move(fields)) {}

    object_kind kind() const override;
    nlohmann::json to_json() const override;

    datum_type type() const { return type_; }
    bool is_ensemble() const { return type_ == datum_type::ensemble; }
    /// Type of the members for an ensemble, own type otherwise.
    datum_type member_type() const;
    bool is_geodetic() const;

    const std::string& anchor() const { return fields_.anchor; }
    const std::optional<double>& anchor_epoch() const { return fields_.anchor_epoch; }
    const std::optional<double>& frame_reference_epoch() const { return fields_.frame_reference_epoch; }
    const std::string& publication_date() const { return fields_.publication_date; }
    const ellipsoid_ptr& ellipsoid_of() const { return fields_.ellipsoid; }
    const prime_meridian_ptr& prime_meridian_of() const { return fields_.prime_meridian; }
    const std::string& realization_method() const { return fields_.realization_method; }
    const conventional_rs_ptr& conventional_rs_of() const { return fields_.conventional_rs; }
    const std::vector<datum_ptr>& members() const { return fields_.members; }
    const std::optional<double>& ensemble_accuracy() const { return fields_.ensemble_accuracy; }

private:
    datum_type type_;
    datum_fields fields_;
};

// MARK: Operations

enum class parameter_value_type { integer, real, uri };

const char* to_string(parameter_value_type type);

class parameter_descriptor : public identified_object {
public:
    parameter_descriptor(properties props, parameter_value_type value_type,
                         unit_ptr default_unit, std::optional<bool> sign_reversal)
        : identified_object(std::move(props)), value_type_(value_type)
        , unit_(std::move(default_unit)), sign_reversal_(sign_reversal) {}

    object_kind kind() const override { return object_kind::parameter; }
    nlohmann::json to_json() const override;

    parameter_value_type value_type() const { return value_type_; }
    const unit_ptr& default_unit() const { return unit_; }
    /// Empty when the dataset is ambiguous about it.
    std::optional<bool> sign_reversal() const { return sign_reversal_; }

private:
    parameter_value_type value_type_;
    unit_ptr unit_;
    std::optional<bool> sign_reversal_;
};

using parameter_ptr = std::shared_ptr<const parameter_descriptor>;

class operation_method : public identified_object {
public:
    operation_method(properties props, std::vector<parameter_ptr> parameters)
        : identified_object(std::move(props)), parameters_(std::move(parameters)) {}

    object_kind kind() const override { return object_kind::operation_method; }
    nlohmann::json to_json() const override;

    const std::vector<parameter_ptr>& parameters() const { return parameters_; }
    parameter_ptr find_parameter(const std::string& code) const;

private:
    std::vector<parameter_ptr> parameters_;
};

using method_ptr = std::shared_ptr<const operation_method>;

struct parameter_value {
    parameter_ptr descriptor;
    std::variant<std::monostate, double, int64_t, std::string> value;  ///< string = file reference
    unit_ptr value_unit;

    std::optional<double> as_double() const;
};

enum class operation_type { conversion, transformation, concatenated, point_motion };

const char* to_string(operation_type type);

using crs_ptr = std::shared_ptr<const crs>;

class coordinate_operation;
using operation_ptr = std::shared_ptr<const coordinate_operation>;

struct operation_fields {
    crs_ptr source;                      ///< Null for a defining conversion
    crs_ptr target;
    method_ptr method;                   ///< Null for a concatenated operation
    std::vector<parameter_value> values;
    std::string version;
    std::optional<double> accuracy;      ///< Metres
    std::vector<operation_ptr> steps;    ///< Concatenated operations only
};

class coordinate_operation : public identified_object {
public:
    coordinate_operation(properties props, operation_type type, operation_fields fields)
        : identified_object(std::move(props)), type_(type), fields_(std::move(fields)) {}

    object_kind kind() const override;
    nlohmann::json to_json() const override;

    operation_type type() const { return type_; }
    bool is_defining_conversion() const {
        return type_ == operation_type::conversion && (!fields_.source || !fields_.target);
    }

    const crs_ptr& source() const { return fields_.source; }
    const crs_ptr& target() const { return fields_.target; }
    const method_ptr& method() const { return fields_.method; }
    const std::vector<parameter_value>& values() const { return fields_.values; }
    const parameter_value* find_value(const std::string& parameter_code) const;
    const std::string& version() const { return fields_.version; }
    const std::optional<double>& accuracy() const { return fields_.accuracy; }
    const std::vector<operation_ptr>& steps() const { return fields_.steps; }

private:
    operation_type type_;
    operation_fields fields_;
};

// MARK: Coordinate reference systems

enum class crs_type {
    geographic_2d, geographic_3d, geocentric, projected, vertical,
    temporal, engineering, parametric, compound
};

const char* to_string(crs_type type);

struct crs_fields {
    datum_ptr datum;                 ///< Datum or ensemble; null for projected and compound
    cs_ptr coordinate_system;        ///< Null for compound
    crs_ptr base;                    ///< Projected only
    operation_ptr conversion;        ///< Projected only (defining conversion)
    std::vector<crs_ptr> components; ///< Compound only
};

class crs : public identified_object {
public:
    crs(properties props, crs_type type, crs_fields fields)
        : identified_object(std::move(props)), type_(type), fields_(std::move(fields)) {}

    object_kind kind() const override;
    nlohmann::json to_json() const override;

    crs_type type() const { return type_; }
    bool is_geographic() const { return type_ == crs_type::geographic_2d || type_ == crs_type::geographic_3d; }

    /// Datum of this CRS, or of its base for a projected CRS.
    datum_ptr datum_of() const;
    /// The ensemble when the datum is one, null otherwise.
    datum_ptr datum_ensemble() const;
    const cs_ptr& coordinate_system() const { return fields_.coordinate_system; }
    const crs_ptr& base() const { return fields_.base; }
    const operation_ptr& conversion() const { return fields_.conversion; }
    const std::vector<crs_ptr>& components() const { return fields_.components; }
    size_t dimension() const;

private:
    crs_type type_;
    crs_fields fields_;
};

} // namespace geodetic

#endif // __cplusplus
