#pragma once

#include <geodetic/configuration.hpp>
#include <geodetic/errors.hpp>
#include <geodetic/log.hpp>
#include <geodetic/resolver.hpp>
#include <geodetic/text.hpp>
#include "FixtureDatabase.hpp"
#include <nlohmann/json.hpp>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace configuration_tests {

using namespace geodetic;

namespace {

bool rejects(const std::string& text) {
    try {
        configuration::from_json(text);
    } catch (const configuration_error&) {
        return true;
    }
    return false;
}

} // namespace

// ============================================================================
// test_defaults
// ============================================================================

void test_defaults() {
    std::cout << "  test_defaults..." << std::flush;

    configuration config;
    assert(config.path == ":memory:");
    assert(config.read_only);
    assert(!config.immutable);
    assert(config.table_prefix.empty());
    assert(!config.level);
    assert(config.statement_cache_size == 20);
    assert(config.max_pool_size == 4);
    assert(config.open_mode() == database::open_mode::read_only);

    config.immutable = true;
    assert(config.open_mode() == database::open_mode::read_only_immutable);
    config.read_only = false;
    assert(config.open_mode() == database::open_mode::read_write);

    configuration scripts("/data/epsg.db", "epsg_");
    assert(scripts.path == "/data/epsg.db");
    assert(scripts.table_prefix == "epsg_");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_from_json - keys, missing keys and invalid values
// ============================================================================

void test_from_json() {
    std::cout << "  test_from_json..." << std::flush;

    auto config = configuration::from_json(R"({
        "path": "/usr/share/epsg/epsg.db",
        "readOnly": true,
        "immutable": true,
        "tablePrefix": "epsg_",
        "logLevel": "Info",
        "statementCacheSize": 64,
        "idleTimeoutMs": 1500,
        "maxPoolSize": 8
    })");
    assert(config.path == "/usr/share/epsg/epsg.db");
    assert(config.immutable);
    assert(config.table_prefix == "epsg_");
    assert(config.schema.empty());
    assert(config.level == log_level::info);
    assert(config.statement_cache_size == 64);
    assert(config.idle_timeout == std::chrono::milliseconds(1500));
    assert(config.max_pool_size == 8);

    // Missing keys keep their defaults
    auto minimal = configuration::from_json(R"({"path": "epsg.db"})");
    assert(minimal.read_only);
    assert(minimal.statement_cache_size == 20);
    assert(minimal.idle_timeout == std::chrono::milliseconds(60000));
    assert(!minimal.level);

    assert(rejects("{ not json"));
    assert(rejects("[1, 2]"));
    assert(rejects(R"({"path": ""})"));
    assert(rejects(R"({"logLevel": "verbose"})"));
    assert(rejects(R"({"readOnly": "yes"})"));
    assert(rejects(R"({"statementCacheSize": 0})"));
    assert(rejects(R"({"idleTimeoutMs": -1})"));
    assert(rejects(R"({"maxPoolSize": 0})"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_to_json_and_file
// ============================================================================

void test_to_json_and_file() {
    std::cout << "  test_to_json_and_file..." << std::flush;

    configuration config("/tmp/epsg.db", "epsg_");
    config.level = log_level::error;
    config.max_pool_size = 3;

    auto j = nlohmann::json::parse(config.to_json());
    assert(j["path"] == "/tmp/epsg.db");
    assert(j["tablePrefix"] == "epsg_");
    assert(j["logLevel"] == "error");
    assert(j["maxPoolSize"] == 3);
    assert(j["readOnly"] == true);

    auto again = configuration::from_json(config.to_json());
    assert(again.to_json() == config.to_json());

    std::string file = "/tmp/geodetic_configuration_test.json";
    {
        std::ofstream out(file);
        out << config.to_json();
    }
    auto loaded = configuration::from_file(file);
    assert(loaded.table_prefix == "epsg_");
    assert(loaded.level == log_level::error);
    std::filesystem::remove(file);

    bool threw = false;
    try {
        configuration::from_file("/nonexistent/geodetic.json");
    } catch (const configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_log_level - parsed names and the level set by a resolver
// ============================================================================

void test_log_level() {
    std::cout << "  test_log_level..." << std::flush;

    assert(parse_log_level("off") == log_level::off);
    assert(parse_log_level("WARNING") == log_level::warn);
    assert(parse_log_level("debug") == log_level::debug);
    assert(!parse_log_level("trace"));
    assert(std::string(to_string(log_level::warn)) == "warn");

    auto previous = get_log_level();
    {
        configuration config;
        config.level = log_level::off;
        auto epsg = fixture::make_resolver(config);
        assert(get_log_level() == log_level::off);
        // Deprecated objects log nothing at this level
        assert(epsg->resolve_crs("4902")->is_deprecated());
    }
    {
        // No level: left unchanged
        auto epsg = fixture::make_resolver();
        assert(get_log_level() == log_level::off);
    }
    set_log_level(previous);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_name_folding - case, accents and punctuation
// ============================================================================

void test_name_folding() {
    std::cout << "  test_name_folding..." << std::flush;

    assert(text::to_ascii("Réseau Géodésique Français") == "Reseau Geodesique Francais");
    assert(text::to_ascii("Łódź") == "Lodz");
    assert(text::to_ascii("WGS 84") == "WGS 84");
    assert(text::to_lower("NTF (Paris)") == "ntf (paris)");

    assert(text::is_all_digits("4326"));
    assert(!text::is_all_digits(""));
    assert(!text::is_all_digits("43a6"));

    assert(text::to_like_pattern("NTF (Paris)") == "NTF%Paris%");
    assert(text::to_like_pattern("Nouvelle Triangulation Française") == "Nouvelle%Triangulation%Francaise");

    assert(text::same_ignoring_punctuation("NTF (Paris)", "ntf paris"));
    assert(text::same_ignoring_punctuation("wgs-84", "WGS 84"));
    assert(text::same_ignoring_punctuation("Réseau", "RESEAU"));
    assert(!text::same_ignoring_punctuation("NTF", "NTF Paris"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all configuration tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Configuration Tests ---" << std::endl;

    test_defaults();
    test_from_json();
    test_to_json_and_file();
    test_log_level();
    test_name_folding();

    std::cout << "--- Configuration Tests: All passed ---" << std::endl;
}

} // namespace configuration_tests
