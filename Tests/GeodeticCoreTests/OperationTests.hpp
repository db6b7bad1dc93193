#pragma once

#include <geodetic/resolver.hpp>
#include "FixtureDatabase.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace operation_tests {

using namespace geodetic;

namespace {

std::vector<std::string> codes_of(const std::vector<operation_ptr>& operations) {
    std::vector<std::string> codes;
    for (const auto& op : operations) {
        codes.push_back(op->code());
    }
    return codes;
}

/// The fixture plus projected CRS with invalid conversion parameters.
/// 4999 uses the sexagesimal CS 6402; 29999 is deprecated and based on it.
std::unique_ptr<epsg_resolver> projections_resolver() {
    auto db = fixture::open_memory();
    db->execute("INSERT INTO \"Coordinate System\" VALUES (6402, 'Ellipsoidal 2D CS. Axes: latitude, longitude."
                " Orientations: north, east. UoM: DMSH.', 'ellipsoidal', 2, NULL, 0)");
    db->execute("INSERT INTO \"Coordinate Axis\" VALUES (108, 6402, 9901, 'north', 'Lat', 9110, 1),"
                " (109, 6402, 9902, 'east', 'Lon', 9110, 2)");
    db->execute("INSERT INTO \"Coordinate Reference System\" VALUES"
                " (4999, 'OSGB36 (DMS)', NULL, NULL, NULL, 1, 'geographic 2D', 6402, 6277, NULL, NULL, NULL, NULL),"
                " (29999, 'OSGB36 (DMS) / Pole Grid', NULL, NULL, NULL, 1, 'projected', 4400, NULL, 4999, 19999, NULL, NULL),"
                " (29998, 'OSGB36 / Pole Grid', NULL, NULL, NULL, 0, 'projected', 4400, NULL, 4277, 19999, NULL, NULL),"
                " (29997, 'OSGB36 / Flat Grid', NULL, NULL, NULL, 0, 'projected', 4400, NULL, 4277, 19998, NULL, NULL)");
    db->execute("INSERT INTO \"Coordinate_Operation\" VALUES"
                " (19999, 'Pole Grid', 'conversion', NULL, NULL, NULL, NULL, NULL, NULL, NULL, 9807, NULL, 0),"
                " (19998, 'Flat Grid', 'conversion', NULL, NULL, NULL, NULL, NULL, NULL, NULL, 9807, NULL, 0)");
    db->execute("INSERT INTO \"Coordinate_Operation Parameter Value\" VALUES"
                " (19999, 9807, 8801, 95, NULL, 9102), (19999, 9807, 8802, 0, NULL, 9102),"
                " (19999, 9807, 8805, 1, NULL, 9201), (19999, 9807, 8806, 0, NULL, 9001),"
                " (19999, 9807, 8807, 0, NULL, 9001),"
                " (19998, 9807, 8801, 49, NULL, 9102), (19998, 9807, 8802, -2, NULL, 9102),"
                " (19998, 9807, 8805, 0, NULL, 9201), (19998, 9807, 8806, 0, NULL, 9001),"
                " (19998, 9807, 8807, 0, NULL, 9001)");
    return std::make_unique<epsg_resolver>(std::move(db));
}

} // namespace

// ============================================================================
// test_transformation - source, target, method and values
// ============================================================================

void test_transformation() {
    std::cout << "  test_transformation..." << std::flush;

    auto epsg = fixture::make_resolver();
    auto op = epsg->resolve_operation("1314");
    assert(op->type() == operation_type::transformation);
    assert(op->kind() == object_kind::transformation);
    assert(op->source()->code() == "4277");
    assert(op->target() == epsg->resolve_crs("4326"));
    assert(op->version() == "OSGB-UK Gbr04");
    assert(op->accuracy() && *op->accuracy() == 5.0);
    assert(!op->is_defining_conversion());

    assert(op->method()->name() == "Geocentric translations (geog2D domain)");
    assert(op->method()->parameters().size() == 3);
    assert(op->values().size() == 3);
    assert(*op->find_value("8605")->as_double() == 446.448);
    assert(op->find_value("8606")->value_unit->code() == "9001");
    assert(op->find_value("9999") == nullptr);

    // Translations change sign when the operation is reversed
    auto x = op->values()[0].descriptor;
    assert(x->code() == "8605");
    assert(x->sign_reversal() == std::optional<bool>(true));
    assert(x->value_type() == parameter_value_type::real);

    assert(op->props().domains.size() == 1);
    assert(op->props().domains[0].scope == "Engineering survey, topographic mapping.");

    // Unknown accuracy
    assert(!epsg->resolve_operation("7710")->accuracy());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_parameter_variants - descriptors shared unless the unit differs
// ============================================================================

void test_parameter_variants() {
    std::cout << "  test_parameter_variants..." << std::flush;

    auto epsg = fixture::make_resolver();

    auto generic = epsg->resolve_parameter("8617");
    // Most values of this parameter are in metres
    assert(generic->default_unit()->code() == "9001");
    assert(generic->sign_reversal() == std::optional<bool>(false));

    auto first = epsg->resolve_operation("15001");
    auto third = epsg->resolve_operation("15003");
    assert(first->find_value("8617")->descriptor == generic);
    assert(third->find_value("8617")->descriptor == generic);

    // Same descriptors as the method: the method instance is shared
    assert(first->method() == epsg->resolve_operation_method("9636"));
    assert(third->method() == first->method());

    // A value in degrees gets a descriptor defaulting to degrees
    auto second = epsg->resolve_operation("15002");
    const auto* angular = second->find_value("8617");
    assert(angular->descriptor != generic);
    assert(angular->descriptor->default_unit()->code() == "9102");
    assert(angular->descriptor->name() == generic->name());
    assert(angular->value_unit->type() == unit_type::angle);

    // ... and a method of its own
    assert(second->method() != first->method());
    assert(second->method()->code() == "9636");
    assert(second->method()->parameters()[1] == angular->descriptor);
    assert(second->method()->parameters()[0] == first->method()->parameters()[0]);

    // Descriptor defaulting to degrees built once
    assert(epsg->resolve_operation("15002")->find_value("8617")->descriptor == angular->descriptor);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_file_reference - values given as a file name
// ============================================================================

void test_file_reference() {
    std::cout << "  test_file_reference..." << std::flush;

    auto epsg = fixture::make_resolver();
    auto grid = epsg->resolve_operation("15200");
    assert(grid->values().size() == 1);

    const auto& value = grid->values()[0];
    assert(std::holds_alternative<std::string>(value.value));
    assert(std::get<std::string>(value.value) == "ntf_r93.gsb");
    assert(!value.as_double());
    assert(!value.value_unit);
    assert(value.descriptor->value_type() == parameter_value_type::uri);
    assert(!value.descriptor->default_unit());
    assert(epsg->resolve_parameter("8656")->value_type() == parameter_value_type::uri);

    // Extent and scope stored on the operation row
    const auto& domains = grid->props().domains;
    assert(domains.size() == 1);
    assert(domains[0].scope == "Geodesy.");
    assert(domains[0].domain_of_validity->code() == "3295");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_concatenated_operation - steps in path order
// ============================================================================

void test_concatenated_operation() {
    std::cout << "  test_concatenated_operation..." << std::flush;

    auto epsg = fixture::make_resolver();
    auto chain = epsg->resolve_operation("15100");
    assert(chain->type() == operation_type::concatenated);
    assert(chain->kind() == object_kind::concatenated_operation);
    assert(!chain->method());
    assert(chain->values().empty());
    assert(chain->steps().size() == 2);
    assert(chain->steps()[0]->code() == "15001");
    assert(chain->steps()[1]->code() == "15003");
    assert(chain->steps()[0] == epsg->resolve_operation("15001"));

    bool threw = false;
    try {
        epsg->resolve_operation("15101");
    } catch (const unsupported_operation_error& e) {
        threw = true;
        assert(std::string(e.what()).find("15101") != std::string::npos);
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_operations_between - conversions first, then by accuracy and supersession
// ============================================================================

void test_operations_between() {
    std::cout << "  test_operations_between..." << std::flush;

    auto epsg = fixture::make_resolver();

    // 1195 is superseded by 1314; 1196 is deprecated; 7710 has no accuracy
    auto ops = epsg->operations_between("4277", "4326");
    assert((codes_of(ops) == std::vector<std::string>{"1314", "1195", "7710"}));

    // Names are accepted
    assert(codes_of(epsg->operations_between("OSGB36", "WGS 84")) == codes_of(ops));

    auto conversions = epsg->operations_between("4277", "27700");
    assert(conversions.size() == 1);
    assert(conversions[0]->code() == "19916");
    assert(conversions[0] == epsg->resolve_crs("27700")->conversion());

    assert(epsg->operations_between("4326", "4277").empty());

    bool threw = false;
    try {
        epsg->operations_between("4277", "Nowhere 1900");
    } catch (const no_such_code_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_supersession_sort
// ============================================================================

void test_supersession_sort() {
    std::cout << "  test_supersession_sort..." << std::flush;

    auto epsg = fixture::make_resolver();

    std::vector<std::string> codes = {"1195", "1314", "7710"};
    assert(epsg->sort_by_supersession(object_kind::coordinate_operation, codes));
    assert((codes == std::vector<std::string>{"1314", "1195", "7710"}));

    // Already ordered
    assert(!epsg->sort_by_supersession(object_kind::coordinate_operation, codes));
    assert((codes == std::vector<std::string>{"1314", "1195", "7710"}));

    // Supersession rows of another table are not looked at
    std::vector<std::string> crs_codes = {"1195", "1314"};
    assert(!epsg->sort_by_supersession(object_kind::crs, crs_codes));
    assert(crs_codes.front() == "1195");

    std::vector<std::string> single = {"1195"};
    assert(!epsg->sort_by_supersession(object_kind::coordinate_operation, single));

    // Cyclic rows terminate with some order of the same codes
    std::vector<std::string> cyclic = {"8001", "8002"};
    assert(epsg->sort_by_supersession(object_kind::coordinate_operation, cyclic));
    assert(cyclic.size() == 2);
    assert((cyclic == std::vector<std::string>{"8001", "8002"} ||
            cyclic == std::vector<std::string>{"8002", "8001"}));

    // Names and other text are kept in place
    std::vector<std::string> mixed = {"not a code", "1195", "1314"};
    assert(epsg->sort_by_supersession(object_kind::coordinate_operation, mixed));
    assert((mixed == std::vector<std::string>{"not a code", "1314", "1195"}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_deprecated_operation
// ============================================================================

void test_deprecated_operation() {
    std::cout << "  test_deprecated_operation..." << std::flush;

    auto epsg = fixture::make_resolver();
    auto op = epsg->resolve_operation("1196");
    assert(op->is_deprecated());
    // No Deprecation row
    assert(op->id().replaced_by == "(none)");
    assert(!op->id().replacement_code());
    assert(op->id().remarks == "Superseded by (none).");

    auto codes = epsg->authority_codes(object_kind::transformation);
    assert(codes->is_deprecated("1196"));
    assert(!codes->name_of("1196"));
    assert(codes->name_of("1195") == std::optional<std::string>("OSGB36 to WGS 84 (1)"));
    assert(epsg->authority_codes(object_kind::concatenated_operation)->size() == 2);
    assert(epsg->authority_codes(object_kind::conversion)->codes() == std::vector<std::string>{"19916"});

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_deprecated_projected_base - sexagesimal base CS replaced, checks relaxed
// ============================================================================

void test_deprecated_projected_base() {
    std::cout << "  test_deprecated_projected_base..." << std::flush;

    auto epsg = projections_resolver();
    auto pole = epsg->resolve_crs("29999");
    assert(pole->is_deprecated());
    assert(pole->type() == crs_type::projected);
    // Accepted despite the latitude of origin beyond the pole
    assert(pole->conversion()->code() == "19999");

    // The base uses the decimal degree CS instead of the deprecated one
    auto base = pole->base();
    assert(base->code() == "4999");
    assert(base->coordinate_system()->code() == "6422");
    assert(base->datum_of()->code() == "6277");

    // The substituted base is not the EPSG definition and is not cached
    auto dms = epsg->resolve_crs("4999");
    assert(dms != base);
    assert(dms->coordinate_system()->code() == "6402");
    assert(dms->coordinate_system()->axes()[0]->axis_unit()->code() == "9110");
    assert(epsg->resolve_crs("4999") == dms);

    // The deprecated projected CRS itself is cached
    assert(epsg->resolve_crs("29999") == pole);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_conversion_parameter_checks - invalid projection parameters
// ============================================================================

void test_conversion_parameter_checks() {
    std::cout << "  test_conversion_parameter_checks..." << std::flush;

    auto epsg = projections_resolver();

    bool threw = false;
    try {
        epsg->resolve_crs("29998");
    } catch (const malformed_data_error& e) {
        threw = true;
        std::string message = e.what();
        assert(message.find("Latitude of natural origin") != std::string::npos);
        assert(message.find("latitude out of range") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        epsg->resolve_crs("29997");
    } catch (const malformed_data_error& e) {
        threw = true;
        std::string message = e.what();
        assert(message.find("Scale factor at natural origin") != std::string::npos);
        assert(message.find("scale factor must be positive") != std::string::npos);
    }
    assert(threw);

    // The conversions alone are not checked
    assert(epsg->resolve_operation("19999")->values().size() == 5);
    assert(epsg->resolve_operation("19998")->type() == operation_type::conversion);

    // Valid parameters still pass
    assert(epsg->resolve_crs("27700")->conversion()->code() == "19916");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all operation tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Operation Tests ---" << std::endl;

    test_transformation();
    test_parameter_variants();
    test_file_reference();
    test_concatenated_operation();
    test_operations_between();
    test_supersession_sort();
    test_deprecated_operation();
    test_deprecated_projected_base();
    test_conversion_parameter_checks();

    std::cout << "--- Operation Tests: All passed ---" << std::endl;
}

} // namespace operation_tests
