#include "geodetic/objects.hpp"
#include "geodetic/text.hpp"
#include <cmath>
#include <limits>
#include <type_traits>

namespace geodetic {

using json = nlohmann::json;

// ============================================================================
// Kind names
// ============================================================================

const char* to_string(object_kind kind) {
    switch (kind) {
        case object_kind::crs:                    return "coordinate reference system";
        case object_kind::geographic_crs:         return "geographic CRS";
        case object_kind::geocentric_crs:         return "geocentric CRS";
        case object_kind::projected_crs:          return "projected CRS";
        case object_kind::vertical_crs:           return "vertical CRS";
        case object_kind::temporal_crs:           return "temporal CRS";
        case object_kind::engineering_crs:        return "engineering CRS";
        case object_kind::parametric_crs:         return "parametric CRS";
        case object_kind::compound_crs:           return "compound CRS";
        case object_kind::datum:                  return "datum";
        case object_kind::geodetic_datum:         return "geodetic datum";
        case object_kind::vertical_datum:         return "vertical datum";
        case object_kind::temporal_datum:         return "temporal datum";
        case object_kind::engineering_datum:      return "engineering datum";
        case object_kind::parametric_datum:       return "parametric datum";
        case object_kind::datum_ensemble:         return "datum ensemble";
        case object_kind::coordinate_system:      return "coordinate system";
        case object_kind::ellipsoidal_cs:         return "ellipsoidal CS";
        case object_kind::cartesian_cs:           return "Cartesian CS";
        case object_kind::spherical_cs:           return "spherical CS";
        case object_kind::vertical_cs:            return "vertical CS";
        case object_kind::time_cs:                return "time CS";
        case object_kind::parametric_cs:          return "parametric CS";
        case object_kind::linear_cs:              return "linear CS";
        case object_kind::polar_cs:               return "polar CS";
        case object_kind::cylindrical_cs:         return "cylindrical CS";
        case object_kind::affine_cs:              return "affine CS";
        case object_kind::coordinate_operation:   return "coordinate operation";
        case object_kind::conversion:             return "conversion";
        case object_kind::transformation:         return "transformation";
        case object_kind::concatenated_operation: return "concatenated operation";
        case object_kind::point_motion_operation: return "point motion operation";
        case object_kind::axis:                   return "coordinate system axis";
        case object_kind::ellipsoid:              return "ellipsoid";
        case object_kind::prime_meridian:         return "prime meridian";
        case object_kind::extent:                 return "extent";
        case object_kind::unit:                   return "unit of measure";
        case object_kind::parameter:              return "parameter descriptor";
        case object_kind::operation_method:       return "operation method";
        case object_kind::conventional_rs:        return "conventional reference system";
    }
    return "object";
}

object_kind family_of(object_kind kind) {
    switch (kind) {
        case object_kind::crs:
        case object_kind::geographic_crs:
        case object_kind::geocentric_crs:
        case object_kind::projected_crs:
        case object_kind::vertical_crs:
        case object_kind::temporal_crs:
        case object_kind::engineering_crs:
        case object_kind::parametric_crs:
        case object_kind::compound_crs:
            return object_kind::crs;
        case object_kind::datum:
        case object_kind::geodetic_datum:
        case object_kind::vertical_datum:
        case object_kind::temporal_datum:
        case object_kind::engineering_datum:
        case object_kind::parametric_datum:
        case object_kind::datum_ensemble:
            return object_kind::datum;
        case object_kind::coordinate_system:
        case object_kind::ellipsoidal_cs:
        case object_kind::cartesian_cs:
        case object_kind::spherical_cs:
        case object_kind::vertical_cs:
        case object_kind::time_cs:
        case object_kind::parametric_cs:
        case object_kind::linear_cs:
        case object_kind::polar_cs:
        case object_kind::cylindrical_cs:
        case object_kind::affine_cs:
            return object_kind::coordinate_system;
        case object_kind::coordinate_operation:
        case object_kind::conversion:
        case object_kind::transformation:
        case object_kind::concatenated_operation:
        case object_kind::point_motion_operation:
            return object_kind::coordinate_operation;
        default:
            return kind;
    }
}

const char* to_string(unit_type type) {
    switch (type) {
        case unit_type::length:     return "length";
        case unit_type::angle:      return "angle";
        case unit_type::scale:      return "scale";
        case unit_type::time:       return "time";
        case unit_type::parametric: return "parametric";
        case unit_type::other:      return "other";
    }
    return "other";
}

const char* to_string(cs_type type) {
    switch (type) {
        case cs_type::ellipsoidal: return "ellipsoidal";
        case cs_type::cartesian:   return "Cartesian";
        case cs_type::spherical:   return "spherical";
        case cs_type::vertical:    return "vertical";
        case cs_type::time:        return "time";
        case cs_type::parametric:  return "parametric";
        case cs_type::linear:      return "linear";
        case cs_type::polar:       return "polar";
        case cs_type::cylindrical: return "cylindrical";
        case cs_type::affine:      return "affine";
    }
    return "unknown";
}

const char* to_string(datum_type type) {
    switch (type) {
        case datum_type::geodetic:         return "geodetic";
        case datum_type::dynamic_geodetic: return "dynamic geodetic";
        case datum_type::vertical:         return "vertical";
        case datum_type::temporal:         return "temporal";
        case datum_type::engineering:      return "engineering";
        case datum_type::parametric:       return "parametric";
        case datum_type::ensemble:         return "ensemble";
    }
    return "unknown";
}

const char* to_string(parameter_value_type type) {
    switch (type) {
        case parameter_value_type::integer: return "integer";
        case parameter_value_type::real:    return "real";
        case parameter_value_type::uri:     return "uri";
    }
    return "unknown";
}

const char* to_string(operation_type type) {
    switch (type) {
        case operation_type::conversion:     return "conversion";
        case operation_type::transformation: return "transformation";
        case operation_type::concatenated:   return "concatenated operation";
        case operation_type::point_motion:   return "point motion operation";
    }
    return "unknown";
}

const char* to_string(crs_type type) {
    switch (type) {
        case crs_type::geographic_2d: return "geographic 2D";
        case crs_type::geographic_3d: return "geographic 3D";
        case crs_type::geocentric:    return "geocentric";
        case crs_type::projected:     return "projected";
        case crs_type::vertical:      return "vertical";
        case crs_type::temporal:      return "temporal";
        case crs_type::engineering:   return "engineering";
        case crs_type::parametric:    return "parametric";
        case crs_type::compound:      return "compound";
    }
    return "unknown";
}

// ============================================================================
// Identifiers and properties
// ============================================================================

std::optional<std::string> identifier::replacement_code() const {
    if (text::is_all_digits(replaced_by)) return replaced_by;
    return std::nullopt;
}

namespace {

json identifier_to_json(const identifier& id) {
    json j;
    j["codespace"] = id.codespace;
    j["code"] = id.code;
    j["version"] = id.version;
    if (!id.description.empty()) j["description"] = id.description;
    if (id.deprecated) {
        j["deprecated"] = true;
        j["replacedBy"] = id.replaced_by;
        j["remarks"] = id.remarks;
    }
    return j;
}

json unit_ref(const unit_ptr& u) {
    if (!u) return nullptr;
    return u->code();
}

json object_ref(const object_ptr& o) {
    if (!o) return nullptr;
    return o->to_json();
}

} // namespace

json to_json(const properties& props) {
    json j;
    j["name"] = props.name;
    j["identifier"] = identifier_to_json(props.id);
    if (!props.aliases.empty()) {
        json aliases = json::array();
        for (const auto& a : props.aliases) {
            json alias;
            alias["name"] = a.name;
            if (a.scope) alias["namespace"] = a.scope->name;
            aliases.push_back(alias);
        }
        j["aliases"] = aliases;
    }
    if (!props.remarks.empty()) j["remarks"] = props.remarks;
    if (props.deprecated) j["deprecated"] = true;
    if (!props.domains.empty()) {
        json domains = json::array();
        for (const auto& d : props.domains) {
            json dj;
            dj["scope"] = d.scope;
            dj["extent"] = d.domain_of_validity ? json(d.domain_of_validity->code()) : json(nullptr);
            domains.push_back(dj);
        }
        j["domains"] = domains;
    }
    return j;
}

json identified_object::to_json() const {
    json j = geodetic::to_json(props_);
    j["kind"] = to_string(kind());
    return j;
}

bool identified_object::equals(const identified_object& other) const {
    if (this == &other) return true;
    return kind() == other.kind() && to_json() == other.to_json();
}

// ============================================================================
// Per-type JSON forms
// ============================================================================

json unit::to_json() const {
    json j = identified_object::to_json();
    j["type"] = to_string(type_);
    j["symbol"] = symbol_;
    if (factor_to_base_) j["factorToBase"] = *factor_to_base_;
    j["baseUnit"] = base_code_;
    return j;
}

json extent::to_json() const {
    json j = identified_object::to_json();
    if (!description_.empty()) j["description"] = description_;
    if (bbox_) {
        j["bbox"] = {{"south", bbox_->south}, {"north", bbox_->north},
                     {"west", bbox_->west}, {"east", bbox_->east}};
    }
    if (vertical_) {
        json v;
        v["minimum"] = vertical_->minimum;
        v["maximum"] = vertical_->maximum;
        v["crs"] = vertical_->vertical_crs ? json(vertical_->vertical_crs->code()) : json(nullptr);
        j["vertical"] = v;
    }
    if (temporal_) {
        j["temporal"] = {{"begin", temporal_->begin}, {"end", temporal_->end}};
    }
    return j;
}

double ellipsoid::semi_minor_axis() const {
    if (!ivf_definitive_) return second_parameter_;
    if (std::isinf(second_parameter_) || second_parameter_ == 0) return semi_major_axis_;
    return semi_major_axis_ * (1 - 1 / second_parameter_);
}

double ellipsoid::inverse_flattening() const {
    if (ivf_definitive_) {
        return second_parameter_ == 0 ? std::numeric_limits<double>::infinity() : second_parameter_;
    }
    if (semi_major_axis_ == second_parameter_) return std::numeric_limits<double>::infinity();
    return semi_major_axis_ / (semi_major_axis_ - second_parameter_);
}

bool ellipsoid::is_sphere() const {
    return std::isinf(inverse_flattening());
}

json ellipsoid::to_json() const {
    json j = identified_object::to_json();
    j["semiMajorAxis"] = semi_major_axis_;
    if (ivf_definitive_) {
        j["inverseFlattening"] = is_sphere() ? json(nullptr) : json(second_parameter_);
    } else {
        j["semiMinorAxis"] = second_parameter_;
    }
    j["unit"] = unit_ref(axis_unit_);
    return j;
}

json prime_meridian::to_json() const {
    json j = identified_object::to_json();
    j["greenwichLongitude"] = greenwich_longitude_;
    j["unit"] = unit_ref(angular_unit_);
    return j;
}

json axis::to_json() const {
    json j = identified_object::to_json();
    j["abbreviation"] = abbreviation_;
    j["direction"] = direction_;
    j["unit"] = unit_ref(unit_);
    return j;
}

object_kind coordinate_system::kind() const {
    switch (type_) {
        case cs_type::ellipsoidal: return object_kind::ellipsoidal_cs;
        case cs_type::cartesian:   return object_kind::cartesian_cs;
        case cs_type::spherical:   return object_kind::spherical_cs;
        case cs_type::vertical:    return object_kind::vertical_cs;
        case cs_type::time:        return object_kind::time_cs;
        case cs_type::parametric:  return object_kind::parametric_cs;
        case cs_type::linear:      return object_kind::linear_cs;
        case cs_type::polar:       return object_kind::polar_cs;
        case cs_type::cylindrical: return object_kind::cylindrical_cs;
        case cs_type::affine:      return object_kind::affine_cs;
    }
    return object_kind::coordinate_system;
}

json coordinate_system::to_json() const {
    json j = identified_object::to_json();
    json axes = json::array();
    for (const auto& a : axes_) {
        axes.push_back(a->to_json());
    }
    j["axes"] = axes;
    return j;
}

// MARK: Datum

object_kind datum::kind() const {
    switch (type_) {
        case datum_type::geodetic:
        case datum_type::dynamic_geodetic: return object_kind::geodetic_datum;
        case datum_type::vertical:         return object_kind::vertical_datum;
        case datum_type::temporal:         return object_kind::temporal_datum;
        case datum_type::engineering:      return object_kind::engineering_datum;
        case datum_type::parametric:       return object_kind::parametric_datum;
        case datum_type::ensemble:         return object_kind::datum_ensemble;
    }
    return object_kind::datum;
}

datum_type datum::member_type() const {
    if (type_ == datum_type::ensemble && !fields_.members.empty()) {
        return fields_.members.front()->type();
    }
    return type_;
}

bool datum::is_geodetic() const {
    auto t = member_type();
    return t == datum_type::geodetic || t == datum_type::dynamic_geodetic;
}

json datum::to_json() const {
    json j = identified_object::to_json();
    j["type"] = to_string(type_);
    if (!fields_.anchor.empty()) j["anchor"] = fields_.anchor;
    if (fields_.anchor_epoch) j["anchorEpoch"] = *fields_.anchor_epoch;
    if (fields_.frame_reference_epoch) j["frameReferenceEpoch"] = *fields_.frame_reference_epoch;
    if (!fields_.publication_date.empty()) j["publicationDate"] = fields_.publication_date;
    if (fields_.ellipsoid) j["ellipsoid"] = fields_.ellipsoid->to_json();
    if (fields_.prime_meridian) j["primeMeridian"] = fields_.prime_meridian->to_json();
    if (!fields_.realization_method.empty()) j["realizationMethod"] = fields_.realization_method;
    if (fields_.conventional_rs) j["conventionalRS"] = fields_.conventional_rs->code();
    if (type_ == datum_type::ensemble) {
        json members = json::array();
        for (const auto& m : fields_.members) {
            members.push_back(m->code());
        }
        j["members"] = members;
        j["ensembleAccuracy"] = fields_.ensemble_accuracy ? json(*fields_.ensemble_accuracy) : json(nullptr);
    }
    return j;
}

// MARK: Operations

json parameter_descriptor::to_json() const {
    json j = identified_object::to_json();
    j["valueType"] = to_string(value_type_);
    j["unit"] = unit_ref(unit_);
    j["signReversal"] = sign_reversal_ ? json(*sign_reversal_) : json(nullptr);
    return j;
}

parameter_ptr operation_method::find_parameter(const std::string& code) const {
    for (const auto& p : parameters_) {
        if (p->code() == code) return p;
    }
    return nullptr;
}

json operation_method::to_json() const {
    json j = identified_object::to_json();
    json params = json::array();
    for (const auto& p : parameters_) {
        params.push_back(p->to_json());
    }
    j["parameters"] = params;
    return j;
}

std::optional<double> parameter_value::as_double() const {
    if (auto d = std::get_if<double>(&value)) return *d;
    if (auto i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
    return std::nullopt;
}

object_kind coordinate_operation::kind() const {
    switch (type_) {
        case operation_type::conversion:     return object_kind::conversion;
        case operation_type::transformation: return object_kind::transformation;
        case operation_type::concatenated:   return object_kind::concatenated_operation;
        case operation_type::point_motion:   return object_kind::point_motion_operation;
    }
    return object_kind::coordinate_operation;
}

const parameter_value* coordinate_operation::find_value(const std::string& parameter_code) const {
    for (const auto& v : fields_.values) {
        if (v.descriptor && v.descriptor->code() == parameter_code) return &v;
    }
    return nullptr;
}

json coordinate_operation::to_json() const {
    json j = identified_object::to_json();
    j["source"] = fields_.source ? json(fields_.source->code()) : json(nullptr);
    j["target"] = fields_.target ? json(fields_.target->code()) : json(nullptr);
    if (fields_.method) j["method"] = fields_.method->to_json();
    json values = json::array();
    for (const auto& v : fields_.values) {
        json vj;
        vj["parameter"] = v.descriptor ? json(v.descriptor->code()) : json(nullptr);
        std::visit([&](auto&& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                vj["value"] = nullptr;
            } else {
                vj["value"] = value;
            }
        }, v.value);
        vj["unit"] = unit_ref(v.value_unit);
        values.push_back(vj);
    }
    j["values"] = values;
    if (!fields_.version.empty()) j["version"] = fields_.version;
    j["accuracy"] = fields_.accuracy ? json(*fields_.accuracy) : json(nullptr);
    if (!fields_.steps.empty()) {
        json steps = json::array();
        for (const auto& s : fields_.steps) {
            steps.push_back(s->code());
        }
        j["steps"] = steps;
    }
    return j;
}

// MARK: CRS

object_kind crs::kind() const {
    switch (type_) {
        case crs_type::geographic_2d:
        case crs_type::geographic_3d: return object_kind::geographic_crs;
        case crs_type::geocentric:    return object_kind::geocentric_crs;
        case crs_type::projected:     return object_kind::projected_crs;
        case crs_type::vertical:      return object_kind::vertical_crs;
        case crs_type::temporal:      return object_kind::temporal_crs;
        case crs_type::engineering:   return object_kind::engineering_crs;
        case crs_type::parametric:    return object_kind::parametric_crs;
        case crs_type::compound:      return object_kind::compound_crs;
    }
    return object_kind::crs;
}

datum_ptr crs::datum_of() const {
    if (fields_.datum) return fields_.datum;
    if (fields_.base) return fields_.base->datum_of();
    return nullptr;
}

datum_ptr crs::datum_ensemble() const {
    auto d = datum_of();
    return (d && d->is_ensemble()) ? d : nullptr;
}

size_t crs::dimension() const {
    if (type_ == crs_type::compound) {
        size_t n = 0;
        for (const auto& c : fields_.components) {
            n += c->dimension();
        }
        return n;
    }
    return fields_.coordinate_system ? fields_.coordinate_system->dimension() : 0;
}

json crs::to_json() const {
    json j = identified_object::to_json();
    j["type"] = to_string(type_);
    if (fields_.datum) j["datum"] = fields_.datum->to_json();
    if (fields_.coordinate_system) j["coordinateSystem"] = fields_.coordinate_system->to_json();
    if (fields_.base) j["base"] = fields_.base->to_json();
    if (fields_.conversion) j["conversion"] = object_ref(fields_.conversion);
    if (!fields_.components.empty()) {
        json components = json::array();
        for (const auto& c : fields_.components) {
            components.push_back(c->to_json());
        }
        j["components"] = components;
    }
    return j;
}

} // namespace geodetic
