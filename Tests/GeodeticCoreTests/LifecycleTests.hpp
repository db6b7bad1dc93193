#pragma once

#include <geodetic/pool.hpp>
#include <geodetic/resolver.hpp>
#include "FixtureDatabase.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace lifecycle_tests {

using namespace geodetic;

// ============================================================================
// test_close - a closed resolver refuses every call
// ============================================================================

void test_close() {
    std::cout << "  test_close..." << std::flush;

    auto epsg = fixture::make_resolver();
    auto wgs84 = epsg->resolve_crs("4326");
    assert(!epsg->is_closed());
    assert(epsg->can_close());

    epsg->close();
    assert(epsg->is_closed());

    bool threw = false;
    try {
        epsg->resolve_crs("4326");
    } catch (const connectivity_error& e) {
        threw = true;
        assert(e.kind() == "coordinate reference system");
        assert(e.code() == "4326");
    }
    assert(threw);

    threw = false;
    try {
        epsg->authority_codes(object_kind::crs);
    } catch (const connectivity_error&) {
        threw = true;
    }
    assert(threw);

    // Objects built before closing stay valid
    assert(wgs84->name() == "WGS 84");
    assert(wgs84->coordinate_system()->axes().size() == 2);

    // Second close does nothing
    epsg->close();
    assert(epsg->is_closed());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_code_sets_block_close - held enumerations are reported
// ============================================================================

void test_code_sets_block_close() {
    std::cout << "  test_code_sets_block_close..." << std::flush;

    auto epsg = fixture::make_resolver();
    {
        auto crs_codes = epsg->authority_codes(object_kind::crs);
        auto datum_codes = epsg->authority_codes(object_kind::datum);
        assert(epsg->live_code_sets() == 2);
        assert(!epsg->can_close());
        assert(datum_codes->contains("6326"));
    }
    assert(epsg->live_code_sets() == 0);
    assert(epsg->can_close());

    // A set held across close() keeps its codes
    auto held = epsg->authority_codes(object_kind::ellipsoid);
    assert(!epsg->can_close());
    epsg->close();
    assert(held->size() == 4);
    assert(held->name_of("7030") == std::optional<std::string>("WGS 84"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_open_failures
// ============================================================================

void test_open_failures() {
    std::cout << "  test_open_failures..." << std::flush;

    bool threw = false;
    try {
        epsg_resolver missing(configuration("/nonexistent/geodetic/epsg.db"));
    } catch (const connectivity_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        epsg_resolver none(std::unique_ptr<database>{});
    } catch (const connectivity_error&) {
        threw = true;
    }
    assert(threw);

    // Tables missing: the failure names the object being built
    auto empty = std::make_unique<database>(":memory:", database::open_mode::read_write);
    epsg_resolver epsg(std::move(empty));
    threw = false;
    try {
        epsg.resolve_crs("4326");
    } catch (const connectivity_error& e) {
        threw = true;
        assert(e.kind() == "coordinate reference system");
    }
    assert(threw);

    // Optional tables missing: no edition
    assert(epsg.authority().edition.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_read_only_file - resolvers over a dataset file
// ============================================================================

void test_read_only_file() {
    std::cout << "  test_read_only_file..." << std::flush;

    std::string path = "/tmp/geodetic_read_only_fixture.db";
    fixture::create_file(path);
    {
        configuration config(path);
        config.statement_cache_size = 2;
        epsg_resolver epsg(config);
        // Far more statements than the cache holds
        auto compound = epsg.resolve_crs("7405");
        assert(compound->components().size() == 2);
        assert(epsg.operations_between("4277", "4326").size() == 3);

        config.immutable = true;
        epsg_resolver immutable(config);
        assert(immutable.resolve_crs("7405")->equals(*compound));
    }
    std::filesystem::remove(path);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_uri_path_escaping - immutable datasets at paths with URI delimiters
// ============================================================================

void test_uri_path_escaping() {
    std::cout << "  test_uri_path_escaping..." << std::flush;

    assert(database::file_uri("/data/epsg.db") == "file:/data/epsg.db");
    assert(database::file_uri("/data/v11?#%.db") == "file:/data/v11%3F%23%25.db");

    std::string path = "/tmp/geodetic_v11?draft#2%.db";
    fixture::create_file(path);
    {
        configuration config(path);
        config.immutable = true;
        epsg_resolver epsg(config);
        assert(epsg.authority().edition == "11.004");
        assert(epsg.resolve_crs("4326")->name() == "WGS 84");
    }
    std::filesystem::remove(path);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pool_leases - bounded lending and reuse
// ============================================================================

void test_pool_leases() {
    std::cout << "  test_pool_leases..." << std::flush;

    std::string path = "/tmp/geodetic_pool_fixture.db";
    fixture::create_file(path);

    configuration config(path);
    config.max_pool_size = 2;
    config.idle_timeout = std::chrono::minutes(1);
    {
        resolver_pool pool(config);
        auto first = pool.acquire();
        auto second = pool.acquire();
        assert(first && second);
        assert(first.get() != second.get());
        assert(pool.active_count() == 2);

        // Full
        auto third = pool.try_acquire();
        assert(!third);

        std::atomic<bool> acquired{false};
        epsg_resolver* reused = first.get();
        epsg_resolver* lent = nullptr;
        std::thread waiter([&]() {
            auto lease = pool.acquire();
            lent = lease.get();
            assert(lease->resolve_crs("4326")->name() == "WGS 84");
            acquired = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(!acquired);

        first.release();
        assert(!first);
        waiter.join();
        assert(acquired);
        // The resolver given back was lent again
        assert(lent == reused);

        second.release();
        assert(pool.active_count() == 0);
        assert(pool.idle_count() == 2);
    }
    std::filesystem::remove(path);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pool_idle_retirement
// ============================================================================

void test_pool_idle_retirement() {
    std::cout << "  test_pool_idle_retirement..." << std::flush;

    std::string path = "/tmp/geodetic_pool_idle_fixture.db";
    fixture::create_file(path);

    configuration config(path);
    config.max_pool_size = 2;
    config.idle_timeout = std::chrono::minutes(1);
    {
        resolver_pool pool(config);
        code_set_ptr held;
        {
            auto a = pool.acquire();
            auto b = pool.acquire();
            held = a->authority_codes(object_kind::crs);
        }
        assert(pool.idle_count() == 2);

        auto now = resolver_pool::clock::now();
        // Not idle long enough
        assert(pool.retire_idle(now) == 0);
        assert(pool.idle_count() == 2);

        // The resolver whose code set is held stays
        auto later = now + std::chrono::minutes(2);
        assert(pool.retire_idle(later) == 1);
        assert(pool.idle_count() == 1);
        assert(held->size() == 8);

        held.reset();
        assert(pool.retire_idle(later) == 1);
        assert(pool.idle_count() == 0);

        // A new resolver is opened on demand
        auto lease = pool.acquire();
        assert(lease->resolve_crs("27700")->base()->code() == "4277");
    }
    std::filesystem::remove(path);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pool_factory_and_shutdown
// ============================================================================

void test_pool_factory_and_shutdown() {
    std::cout << "  test_pool_factory_and_shutdown..." << std::flush;

    configuration config;
    config.max_pool_size = 1;

    int created = 0;
    resolver_pool pool(config, [&]() {
        ++created;
        return fixture::make_resolver();
    });

    {
        auto lease = pool.acquire();
        assert(lease->authority().edition == "11.004");
    }
    {
        auto lease = pool.acquire();
        assert(lease->resolve_datum("6326")->is_ensemble());
    }
    assert(created == 1);

    // A resolver closed by its borrower is not kept
    {
        auto lease = pool.acquire();
        lease->close();
    }
    assert(pool.idle_count() == 0);
    {
        auto lease = pool.acquire();
        assert(!lease->is_closed());
    }
    assert(created == 2);

    pool.shutdown();
    assert(pool.idle_count() == 0);

    bool threw = false;
    try {
        auto lease = pool.acquire();
    } catch (const connectivity_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        auto lease = pool.try_acquire();
    } catch (const connectivity_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pool_factory_failure
// ============================================================================

void test_pool_factory_failure() {
    std::cout << "  test_pool_factory_failure..." << std::flush;

    configuration config("/nonexistent/geodetic/epsg.db");
    config.max_pool_size = 1;
    resolver_pool pool(config);

    bool threw = false;
    try {
        auto lease = pool.acquire();
    } catch (const connectivity_error&) {
        threw = true;
    }
    assert(threw);
    // The failed slot is free again
    assert(pool.active_count() == 0);

    threw = false;
    try {
        configuration zero;
        zero.max_pool_size = 0;
        resolver_pool invalid(zero);
    } catch (const configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pool_factory_exception - any factory exception frees its slot
// ============================================================================

void test_pool_factory_exception() {
    std::cout << "  test_pool_factory_exception..." << std::flush;

    configuration config;
    config.max_pool_size = 1;

    int attempts = 0;
    resolver_pool pool(config, [&]() -> std::unique_ptr<epsg_resolver> {
        if (++attempts <= 2) {
            throw std::runtime_error("dataset not installed");
        }
        return fixture::make_resolver();
    });

    for (int i = 0; i < 2; ++i) {
        bool threw = false;
        try {
            auto lease = pool.try_acquire();
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "dataset not installed";
        }
        assert(threw);
        assert(pool.active_count() == 0);
    }

    // A null resolver from the factory frees its slot as well
    resolver_pool empty(config, []() { return std::unique_ptr<epsg_resolver>(); });
    bool threw = false;
    try {
        auto lease = empty.acquire();
    } catch (const connectivity_error&) {
        threw = true;
    }
    assert(threw);
    assert(empty.active_count() == 0);

    auto lease = pool.try_acquire();
    assert(lease);
    assert(pool.active_count() == 1);
    assert(lease->resolve_crs("4326")->name() == "WGS 84");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all lifecycle tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Lifecycle Tests ---" << std::endl;

    test_close();
    test_code_sets_block_close();
    test_open_failures();
    test_read_only_file();
    test_uri_path_escaping();
    test_pool_leases();
    test_pool_idle_retirement();
    test_pool_factory_and_shutdown();
    test_pool_factory_failure();
    test_pool_factory_exception();

    std::cout << "--- Lifecycle Tests: All passed ---" << std::endl;
}

} // namespace lifecycle_tests
