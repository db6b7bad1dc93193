#include <GeodeticCore.hpp>
#include "FixtureDatabase.hpp"
#include "ConfigurationTests.hpp"
#include "DatabaseTests.hpp"
#include "OperationTests.hpp"
#include "LifecycleTests.hpp"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <vector>

using namespace geodetic;

// ============================================================================
// Test: Citation
// ============================================================================

void test_authority_citation() {
    std::cout << "Testing authority citation..." << std::endl;

    auto epsg = fixture::make_resolver();
    auto c = epsg->authority();
    assert(c.title == "EPSG Geodetic Parameter Dataset");
    // Newest row of the version history
    assert(c.edition == "11.004");
    assert(c.edition_date == "2024-03-02");

    auto crs = epsg->resolve_crs("4326");
    assert(crs->id().codespace == "EPSG");
    assert(crs->id().version == "11.004");

    std::cout << "  Authority citation test passed!" << std::endl;
}

// ============================================================================
// Test: Geographic CRS with a datum ensemble
// ============================================================================

void test_geographic_crs() {
    std::cout << "Testing geographic CRS..." << std::endl;

    auto epsg = fixture::make_resolver();
    auto wgs84 = epsg->resolve_crs("4326");
    assert(wgs84->name() == "WGS 84");
    assert(wgs84->code() == "4326");
    assert(wgs84->kind() == object_kind::geographic_crs);
    assert(wgs84->type() == crs_type::geographic_2d);
    assert(!wgs84->is_deprecated());
    assert(wgs84->dimension() == 2);

    // Axes in COORD_AXIS_ORDER, not in row order
    const auto& cs = wgs84->coordinate_system();
    assert(cs->type() == cs_type::ellipsoidal);
    assert(cs->axes().size() == 2);
    assert(cs->axes()[0]->abbreviation() == "Lat");
    assert(cs->axes()[0]->direction() == "north");
    assert(cs->axes()[0]->name() == "Geodetic latitude");
    assert(cs->axes()[1]->abbreviation() == "Lon");
    assert(cs->axes()[1]->axis_unit()->code() == "9122");

    auto ensemble = wgs84->datum_ensemble();
    assert(ensemble);
    assert(ensemble->is_ensemble());
    assert(ensemble->is_geodetic());
    assert(ensemble->ensemble_accuracy() && *ensemble->ensemble_accuracy() == 2.0);
    assert(ensemble->members().size() == 2);
    assert(ensemble->members()[0]->code() == "1166");
    assert(ensemble->members()[1]->code() == "1309");
    assert(ensemble->members()[1]->type() == datum_type::dynamic_geodetic);
    assert(ensemble->members()[1]->frame_reference_epoch() == 2016.0);
    assert(ensemble->members()[0]->conventional_rs_of()->name() == "World Geodetic System 1984");

    // Usage with its scope
    assert(wgs84->props().domains.size() == 1);
    assert(wgs84->props().domains[0].scope == "Horizontal component of 3D system.");
    assert(wgs84->props().domains[0].domain_of_validity->name() == "World");

    std::cout << "  Geographic CRS test passed!" << std::endl;
}

// ============================================================================
// Test: Projected and compound CRS
// ============================================================================

void test_projected_and_compound_crs() {
    std::cout << "Testing projected and compound CRS..." << std::endl;

    auto epsg = fixture::make_resolver();
    auto bng = epsg->resolve_crs("27700");
    assert(bng->kind() == object_kind::projected_crs);
    assert(bng->base()->code() == "4277");
    assert(bng->datum_of()->name() == "Ordnance Survey of Great Britain 1936");
    assert(bng->coordinate_system()->type() == cs_type::cartesian);
    assert(bng->coordinate_system()->axes()[0]->abbreviation() == "E");

    const auto& conversion = bng->conversion();
    assert(conversion->is_defining_conversion());
    assert(conversion->method()->name() == "Transverse Mercator");
    assert(conversion->values().size() == 5);
    assert(conversion->values()[0].descriptor->code() == "8801");
    assert(*conversion->find_value("8806")->as_double() == 400000.0);
    assert(conversion->find_value("8805")->value_unit->code() == "9201");

    auto compound = epsg->resolve_crs("7405");
    assert(compound->kind() == object_kind::compound_crs);
    assert(compound->components().size() == 2);
    // Same instance as the one resolved above
    assert(compound->components()[0] == bng);
    assert(compound->components()[1]->kind() == object_kind::vertical_crs);
    assert(compound->dimension() == 3);

    auto odn = compound->components()[1]->datum_of();
    assert(odn->type() == datum_type::vertical);
    assert(odn->realization_method() == "levelling");

    std::cout << "  Projected and compound CRS test passed!" << std::endl;
}

// ============================================================================
// Test: Idempotent resolution
// ============================================================================

void test_idempotent_resolution() {
    std::cout << "Testing idempotent resolution..." << std::endl;

    std::string path = "/tmp/geodetic_idempotence_fixture.db";
    fixture::create_file(path);
    {
        configuration config(path);
        epsg_resolver first(config);
        epsg_resolver second(config);

        auto a = first.resolve_crs("27700");
        auto b = first.resolve_crs("27700");
        assert(a == b);

        // Another resolver builds another instance with the same content
        auto c = second.resolve_crs("27700");
        assert(a != c);
        assert(a->equals(*c));
        assert(a->to_json() == c->to_json());

        auto d = first.resolve_datum("6326");
        auto e = second.resolve_datum("6326");
        assert(d->equals(*e));
    }
    std::filesystem::remove(path);

    std::cout << "  Idempotent resolution test passed!" << std::endl;
}

// ============================================================================
// Test: Names and aliases
// ============================================================================

void test_name_lookup() {
    std::cout << "Testing name lookup..." << std::endl;

    auto epsg = fixture::make_resolver();

    // One key for the name
    auto by_name = epsg->resolve_crs("WGS 84");
    assert(by_name->code() == "4326");
    assert(by_name == epsg->resolve_crs("4326"));
    assert(epsg->resolve_crs("  wgs-84 ")->code() == "4326");

    // Found through the Alias table
    auto osgb = epsg->resolve_crs("OSGB 1936");
    assert(osgb->code() == "4277");
    assert(osgb->props().aliases.size() == 1);
    assert(osgb->props().aliases[0].name == "OSGB 1936");
    assert(osgb->props().aliases[0].scope->name == "EPSG abbreviation");

    // Accents are ignored, and an accented alias replaces the ASCII name
    auto ntf = epsg->resolve_datum("Nouvelle Triangulation Française (Paris)");
    assert(ntf->code() == "6807");
    assert(ntf->name() == "Nouvelle Triangulation Française (Paris)");
    assert(ntf->props().aliases.empty());

    // Two keys for the name
    bool threw = false;
    try {
        epsg->resolve_crs("NTF (Paris)");
    } catch (const ambiguous_name_error& e) {
        threw = true;
        assert(e.candidates().size() == 2);
        assert(e.candidates()[0] == "4807");
        assert(e.candidates()[1] == "4902");
    }
    assert(threw);

    threw = false;
    try {
        epsg->resolve_crs("Nowhere 1900");
    } catch (const no_such_code_error& e) {
        threw = true;
        assert(e.code() == "Nowhere 1900");
    }
    assert(threw);

    threw = false;
    try {
        epsg->resolve_crs("99999999999999999999999");
    } catch (const no_such_code_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Name lookup test passed!" << std::endl;
}

// ============================================================================
// Test: Cyclic references
// ============================================================================

void test_recursive_resolution() {
    std::cout << "Testing recursive resolution detection..." << std::endl;

    auto epsg = fixture::make_resolver();
    bool threw = false;
    try {
        epsg->resolve_crs("9990");
    } catch (const recursive_resolution_error& e) {
        threw = true;
        assert(e.table() == "Coordinate Reference System");
        assert(e.code() == "9990");
    }
    assert(threw);

    // The in-flight set is per call, so the resolver is still usable
    assert(epsg->resolve_crs("4326")->name() == "WGS 84");

    threw = false;
    try {
        epsg->resolve_crs("9991");
    } catch (const recursive_resolution_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Recursive resolution test passed!" << std::endl;
}

// ============================================================================
// Test: Deprecated codes
// ============================================================================

void test_deprecated_code() {
    std::cout << "Testing deprecated code..." << std::endl;

    auto epsg = fixture::make_resolver();
    auto old = epsg->resolve_crs("4902");
    assert(old->is_deprecated());
    assert(old->id().deprecated);
    assert(old->id().replaced_by == "4807");
    assert(old->id().replacement_code() == std::optional<std::string>("4807"));
    assert(old->id().remarks.find("Superseded by 4807.") == 0);
    assert(old->id().remarks.find("Wrong prime meridian unit.") != std::string::npos);
    assert(old->props().remarks == "Uses grads.");

    auto replacement = epsg->resolve_crs(*old->id().replacement_code());
    assert(!replacement->is_deprecated());
    assert(replacement->name() == "NTF (Paris)");
    assert(replacement->id().replaced_by.empty());

    // Legacy extent and scope come first
    const auto& domains = replacement->props().domains;
    assert(domains.size() == 1);
    assert(domains[0].scope == "Geodesy.");
    const auto& france = domains[0].domain_of_validity;
    assert(france->bbox());
    // Inverted latitudes are swapped
    assert(france->bbox()->south == 41.31);
    assert(france->bbox()->north == 51.14);

    std::cout << "  Deprecated code test passed!" << std::endl;
}

// ============================================================================
// Test: Kind checks
// ============================================================================

void test_resolve_by_kind() {
    std::cout << "Testing resolution by kind..." << std::endl;

    auto epsg = fixture::make_resolver();
    auto object = epsg->resolve(object_kind::projected_crs, "27700");
    assert(object->kind() == object_kind::projected_crs);
    assert(epsg->resolve(object_kind::crs, "27700") == object);

    bool threw = false;
    try {
        epsg->resolve(object_kind::geographic_crs, "27700");
    } catch (const no_such_code_error& e) {
        threw = true;
        assert(e.kind() == "geographic CRS");
    }
    assert(threw);

    assert(epsg->resolve(object_kind::vertical_datum, "5101")->kind() == object_kind::vertical_datum);
    threw = false;
    try {
        epsg->resolve(object_kind::geodetic_datum, "5101");
    } catch (const no_such_code_error&) {
        threw = true;
    }
    assert(threw);

    // An ensemble of geodetic datums is accepted where a geodetic datum is asked
    auto ensemble = epsg->resolve(object_kind::geodetic_datum, "6326");
    assert(ensemble->kind() == object_kind::datum_ensemble);
    assert(epsg->resolve(object_kind::datum_ensemble, "6326") == ensemble);
    assert(!epsg->authority_codes(object_kind::geodetic_datum)->name_of("6326"));
    threw = false;
    try {
        epsg->resolve(object_kind::vertical_datum, "6326");
    } catch (const no_such_code_error& e) {
        threw = true;
        assert(e.kind() == to_string(object_kind::vertical_datum));
    }
    assert(threw);

    assert(epsg->resolve(object_kind::cartesian_cs, "4400")->name().find("Cartesian 2D CS") == 0);
    assert(epsg->resolve(object_kind::unit, "9001")->name() == "metre");

    // Codes of the single-table kinds
    assert(epsg->resolve_object("7030")->kind() == object_kind::ellipsoid);
    assert(epsg->resolve_object("8903")->kind() == object_kind::prime_meridian);
    assert(epsg->resolve_object("9807")->kind() == object_kind::operation_method);
    assert(epsg->resolve_object("OSGB36 / British National Grid")->code() == "27700");

    // Units are not probed
    threw = false;
    try {
        epsg->resolve_object("9001");
    } catch (const no_such_code_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Resolution by kind test passed!" << std::endl;
}

// ============================================================================
// Test: Ellipsoids, prime meridians and units
// ============================================================================

void test_ellipsoids_and_units() {
    std::cout << "Testing ellipsoids, prime meridians and units..." << std::endl;

    auto epsg = fixture::make_resolver();

    auto wgs84 = epsg->resolve_ellipsoid("7030");
    assert(wgs84->is_ivf_definitive());
    assert(wgs84->inverse_flattening() == 298.257223563);
    assert(std::abs(wgs84->semi_minor_axis() - 6356752.314245) < 1e-5);
    assert(wgs84->axis_unit()->code() == "9001");
    assert(wgs84->props().aliases.size() == 1);

    auto sphere = epsg->resolve_ellipsoid("Sphere");
    assert(!sphere->is_ivf_definitive());
    assert(sphere->is_sphere());

    // Both parameters given: the inverse flattening wins
    auto clarke = epsg->resolve_ellipsoid("7008");
    assert(clarke->is_ivf_definitive());
    assert(clarke->inverse_flattening() == 294.978698213898);

    auto paris = epsg->resolve_prime_meridian("8903");
    assert(paris->greenwich_longitude() == 2.5969213);
    assert(paris->angular_unit()->name() == "grad");
    assert(paris->props().remarks == "Value adopted by IGN (Paris) in 1936.");

    // Not hard-coded: derived from the target unit and the factors
    auto gold_coast = epsg->resolve_unit("9094");
    assert(gold_coast->type() == unit_type::length);
    assert(gold_coast->code() == "9094");
    assert(std::abs(*gold_coast->factor_to_base() - 6378300.0 / 20925828.0) < 1e-15);

    auto dms = epsg->resolve_unit("9110");
    assert(dms->type() == unit_type::angle);
    assert(!dms->is_linear());

    auto axis = epsg->resolve_axis("114");
    assert(axis->name() == "Gravity-related height");
    assert(axis->props().id.description == "Height along the direction of gravity.");
    assert(axis->direction() == "up");

    std::cout << "  Ellipsoids, prime meridians and units test passed!" << std::endl;
}

// ============================================================================
// Test: Extents
// ============================================================================

void test_extents() {
    std::cout << "Testing extents..." << std::endl;

    auto epsg = fixture::make_resolver();

    // The vertical CRS of the extent is the CRS being built: it is left out
    auto odn = epsg->resolve_crs("5701");
    const auto& domain = odn->props().domains.at(0);
    // "?" denotes an unknown scope
    assert(domain.scope.empty());
    auto partial = domain.domain_of_validity;
    assert(partial->vertical());
    assert(partial->vertical()->minimum == -100.0);
    assert(!partial->vertical()->vertical_crs);

    // Resolved on its own, the extent has its vertical CRS
    auto full = epsg->resolve_extent("4000");
    assert(full != partial);
    assert(full->vertical()->vertical_crs == odn);
    assert(full->temporal());
    assert(full->temporal()->begin == "1915-01-01");
    assert(epsg->resolve_extent("4000") == full);

    auto world = epsg->resolve_extent("1262");
    assert(*world->bbox() == geographic_bbox(-90.0, 90.0, -180.0, 180.0));
    assert(world->description() == "World.");
    assert(!world->vertical());

    std::cout << "  Extents test passed!" << std::endl;
}

// ============================================================================
// Test: Code enumeration and description
// ============================================================================

void test_authority_codes() {
    std::cout << "Testing authority codes..." << std::endl;

    auto epsg = fixture::make_resolver();
    auto all = epsg->authority_codes(object_kind::crs);
    assert(all->size() == 8);
    assert(!all->is_deprecated("4326"));
    // Deprecated codes are hidden but known
    assert(all->is_deprecated("4902"));
    assert(all->contains("4902"));
    assert(!all->name_of("4902"));
    assert(*all->name_of("27700") == "OSGB36 / British National Grid");

    // Ordered by code
    auto codes = all->codes();
    assert(codes.front() == "4277");
    assert(codes.back() == "27700");

    // The family is the union of its subtypes
    std::set<std::string> from_subtypes;
    for (auto kind : subtypes_of(object_kind::crs)) {
        auto subset = epsg->authority_codes(kind);
        for (const auto& entry : *subset) {
            assert(from_subtypes.insert(entry.code).second);
        }
    }
    assert(from_subtypes == std::set<std::string>(codes.begin(), codes.end()));
    assert(epsg->authority_codes(object_kind::geographic_crs)->size() == 5);
    assert(epsg->authority_codes(object_kind::compound_crs)->codes() == std::vector<std::string>{"7405"});

    // Same set while it is held
    assert(epsg->authority_codes(object_kind::crs) == all);

    assert(epsg->describe(object_kind::crs, "27700") == std::optional<std::string>("OSGB36 / British National Grid"));
    assert(epsg->describe(object_kind::projected_crs, "27700"));
    assert(!epsg->describe(object_kind::projected_crs, "4326"));
    assert(!epsg->describe(object_kind::crs, "1234"));
    assert(!epsg->describe(object_kind::crs, "No such name"));
    assert(epsg->describe(object_kind::axis, "106") == std::optional<std::string>("Geodetic latitude"));

    std::cout << "  Authority codes test passed!" << std::endl;
}

// ============================================================================
// Test: Duplicated rows and identifiers
// ============================================================================

void test_duplicates() {
    std::cout << "Testing duplicated rows..." << std::endl;

    {
        auto db = fixture::open_memory();
        // Identical copy of a row: accepted with a warning
        db->execute("INSERT INTO \"Ellipsoid\" SELECT * FROM \"Ellipsoid\" WHERE ELLIPSOID_CODE = 7001");
        // Different content under the same code
        db->execute("INSERT INTO \"Prime Meridian\" VALUES (8901, 'Greenwich bis', 0, 9102, NULL, 0)");
        // Same code in two tables
        db->execute("INSERT INTO \"Prime Meridian\" VALUES (7030, 'Clash', 0, 9102, NULL, 0)");
        epsg_resolver epsg(std::move(db));

        assert(epsg.resolve_ellipsoid("7001")->name() == "Airy 1830");

        bool threw = false;
        try {
            epsg.resolve_prime_meridian("8901");
        } catch (const duplicate_identifier_error& e) {
            threw = true;
            assert(e.code() == "8901");
        }
        assert(threw);

        threw = false;
        try {
            epsg.resolve_object("7030");
        } catch (const duplicate_identifier_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "  Duplicated rows test passed!" << std::endl;
}

// ============================================================================
// Test: Malformed rows
// ============================================================================

void test_malformed_data() {
    std::cout << "Testing malformed data..." << std::endl;

    auto db = fixture::open_memory();
    db->execute("INSERT INTO \"Coordinate System\" VALUES (9999, 'Broken CS', 'ellipsoidal', 3, NULL, 0)");
    db->execute("INSERT INTO \"Coordinate Axis\" VALUES (9998, 9999, 9901, 'north', 'Lat', 9122, 1)");
    db->execute("INSERT INTO \"Ellipsoid\" VALUES (7999, 'No shape', 6378000, 9001, NULL, NULL, 1, NULL, 0)");
    db->execute("INSERT INTO \"Datum\" (DATUM_CODE, DATUM_NAME, DATUM_TYPE, DEPRECATED)"
                " VALUES (9997, 'Time origin missing', 'temporal', 0)");
    epsg_resolver epsg(std::move(db));

    bool threw = false;
    try {
        epsg.resolve_coordinate_system("9999");
    } catch (const malformed_data_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        epsg.resolve_ellipsoid("7999");
    } catch (const malformed_data_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        epsg.resolve_datum("9997");
    } catch (const malformed_data_error& e) {
        threw = true;
        assert(std::string(e.what()).find("origin shall be a date") != std::string::npos);
    }
    assert(threw);

    // Every malformed row is a factory_error
    threw = false;
    try {
        epsg.resolve_coordinate_system("9999");
    } catch (const factory_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Malformed data test passed!" << std::endl;
}

// ============================================================================
// Test: Table prefix of the SQL scripts
// ============================================================================

void test_prefixed_tables() {
    std::cout << "Testing prefixed table names..." << std::endl;

    configuration config;
    config.table_prefix = "epsg_";
    auto epsg = fixture::make_resolver(config);

    auto bng = epsg->resolve_crs("27700");
    assert(bng->conversion()->values().size() == 5);
    assert(bng->props().domains.size() == 1);
    assert(epsg->resolve_crs("OSGB 1936")->code() == "4277");
    assert(epsg->resolve_crs("4902")->id().replaced_by == "4807");
    assert(epsg->authority().edition == "11.004");

    std::vector<std::string> codes = {"1195", "1314"};
    assert(epsg->sort_by_supersession(object_kind::coordinate_operation, codes));
    assert(codes.front() == "1314");

    std::cout << "  Prefixed table names test passed!" << std::endl;
}

int main() {
    std::cout << "=== GeodeticCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Support code
        configuration_tests::run_all();
        database_tests::run_all();

        // Object construction
        test_authority_citation();
        test_geographic_crs();
        test_projected_and_compound_crs();
        test_idempotent_resolution();
        test_name_lookup();
        test_recursive_resolution();
        test_deprecated_code();
        test_resolve_by_kind();
        test_ellipsoids_and_units();
        test_extents();
        test_authority_codes();
        test_duplicates();
        test_malformed_data();
        test_prefixed_tables();

        // Operations, parameters and supersession
        operation_tests::run_all();

        // Close, code sets and pool
        lifecycle_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
