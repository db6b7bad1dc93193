#include "geodetic/resolver.hpp"
#include "geodetic/row_reader.hpp"
#include "geodetic/text.hpp"
#include <algorithm>

namespace geodetic {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

// ============================================================================
// Construction and lifecycle
// ============================================================================

epsg_resolver::epsg_resolver(const configuration& config)
    : config_(config), translator_(config.table_prefix, config.schema) {
    if (config_.level) {
        set_log_level(*config_.level);
    }
    try {
        db_ = std::make_unique<database>(config_.path, config_.open_mode());
    } catch (const db_error& e) {
        LOG_ERROR("resolver", "Cannot open EPSG dataset %s: %s", config_.path.c_str(), e.what());
        throw connectivity_error(e.what());
    }
    statements_ = std::make_unique<statement_cache>(*db_, config_.statement_cache_size);
    LOG_DEBUG("resolver", "Opened EPSG dataset %s", config_.path.c_str());
}

epsg_resolver::epsg_resolver(std::unique_ptr<database> db, const configuration& config)
    : config_(config), translator_(config.table_prefix, config.schema), db_(std::move(db)) {
    if (!db_ || !db_->is_open()) {
        throw connectivity_error("No open database given to the resolver");
    }
    if (config_.level) {
        set_log_level(*config_.level);
    }
    statements_ = std::make_unique<statement_cache>(*db_, config_.statement_cache_size);
}

epsg_resolver::~epsg_resolver() {
    try {
        close();
    } catch (const factory_error& e) {
        LOG_ERROR("resolver", "Error while closing the resolver: %s", e.what());
    }
}

bool epsg_resolver::can_close() {
    return live_code_sets() == 0;
}

size_t epsg_resolver::live_code_sets() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t live = 0;
    for (auto it = code_sets_.begin(); it != code_sets_.end();) {
        if (it->second.expired()) {
            it = code_sets_.erase(it);
        } else {
            ++live;
            ++it;
        }
    }
    return live;
}

void epsg_resolver::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;

    std::vector<std::exception_ptr> failures;
    std::string first_message;
    auto record = [&](const std::exception& e) {
        if (failures.empty()) first_message = e.what();
        failures.push_back(std::current_exception());
        LOG_ERROR("resolver", "Close failure: %s", e.what());
    };

    // 1. Prepared statements
    if (statements_) {
        try {
            statements_->close();
        } catch (const db_error& e) {
            record(e);
        }
        statements_.reset();
    }

    // 2. Enumerations. A held code_set keeps its own copy of the codes.
    size_t live = 0;
    for (const auto& entry : code_sets_) {
        if (!entry.second.expired()) ++live;
    }
    if (live != 0) {
        LOG_WARN("resolver", "Closing while %zu code set(s) are still in use", live);
    }
    code_sets_.clear();

    // 3. Connection
    if (db_) {
        try {
            db_->close();
        } catch (const db_error& e) {
            record(e);
        }
        db_.reset();
    }

    objects_.clear();
    axis_names_.clear();
    realization_methods_.clear();
    scopes_.clear();
    name_spaces_.clear();
    parameter_variants_.clear();
    tables_found_.clear();
    citation_.reset();

    if (!failures.empty()) {
        throw close_error(first_message, std::move(failures));
    }
}

bool epsg_resolver::is_closed() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return closed_;
}

// ============================================================================
// Call plumbing
// ============================================================================

void epsg_resolver::ensure_open(const char* what, const std::string& code) const {
    if (closed_ || !db_ || !statements_) {
        throw connectivity_error("The resolver is closed", what, code);
    }
}

std::vector<row_t> epsg_resolver::run(const std::string& key, const std::string& sql,
                                      const std::vector<column_value_t>& params) {
    return statements_->query(key, translator_.apply(sql), params);
}

bool epsg_resolver::table_found(const std::string& access_name) {
    auto it = tables_found_.find(access_name);
    if (it != tables_found_.end()) return it->second;

    std::string master = config_.schema.empty()
        ? std::string("sqlite_master")
        : "\"" + config_.schema + "\".sqlite_master";
    auto rows = statements_->query(
        "table exists:" + master,
        "SELECT name FROM " + master + " WHERE type = 'table' AND name = ? COLLATE NOCASE",
        {translator_.table_name(access_name)});
    bool found = !rows.empty();
    if (!found) {
        LOG_DEBUG("resolver", "Table \"%s\" not found, related metadata is skipped", access_name.c_str());
    }
    tables_found_[access_name] = found;
    return found;
}

std::string epsg_resolver::object_table_name(const table_info& info) const {
    return translator_.to_object_table_name(info.table);
}

primary_key_t epsg_resolver::to_primary_key(object_kind kind, const std::string& code) {
    const auto& info = table_for(kind);
    auto trimmed = trim(code);
    if (text::is_all_digits(trimmed)) {
        try {
            return std::stoll(trimmed);
        } catch (const std::out_of_range&) {
            throw no_such_code_error(to_string(kind), code);
        }
    }
    if (trimmed.empty()) {
        throw no_such_code_error(to_string(kind), code);
    }
    auto keys = find_codes_from_name(info, trimmed, true);
    if (keys.empty()) {
        throw no_such_code_error(to_string(kind), code);
    }
    if (keys.size() > 1) {
        std::vector<std::string> candidates;
        for (auto key : keys) {
            candidates.push_back(std::to_string(key));
        }
        throw ambiguous_name_error(code, candidates);
    }
    return keys.front();
}

std::vector<primary_key_t> epsg_resolver::find_codes_from_name(const table_info& info,
                                                               const std::string& name,
                                                               bool search_aliases) {
    std::set<primary_key_t> keys;
    auto pattern = text::to_like_pattern(name);

    std::string sql = std::string("SELECT ") + info.code_column + " AS CODE, " + info.name_column +
                      " AS NAME FROM " + info.from_clause + " WHERE " + info.name_column + " LIKE ?";
    for (const auto& row : run(std::string("name search:") + info.table, sql, {pattern})) {
        row_reader r(row, info.table, name);
        auto key = r.optional_integer("CODE");
        if (key && text::same_ignoring_punctuation(name, r.string_or_empty("NAME"))) {
            keys.insert(*key);
        }
    }

    if (keys.empty() && search_aliases && table_found("Alias")) {
        auto rows = run("alias search",
                        "SELECT OBJECT_CODE, ALIAS FROM [Alias] WHERE OBJECT_TABLE_NAME = ? AND ALIAS LIKE ?",
                        {object_table_name(info), pattern});
        for (const auto& row : rows) {
            row_reader r(row, "Alias", name);
            auto key = r.optional_integer("OBJECT_CODE");
            if (key && text::same_ignoring_punctuation(name, r.string_or_empty("ALIAS"))) {
                keys.insert(*key);
            }
        }
    }
    return std::vector<primary_key_t>(keys.begin(), keys.end());
}

// ============================================================================
// Properties shared by every object
// ============================================================================

citation epsg_resolver::authority_impl() {
    if (citation_) return *citation_;
    citation result;
    if (table_found("Version History")) {
        auto rows = run("version history",
                        "SELECT VERSION_NUMBER, VERSION_DATE FROM [Version History] ORDER BY VERSION_DATE DESC");
        if (!rows.empty()) {
            row_reader r(rows.front(), "Version History", "");
            result.edition = r.string_or_empty("VERSION_NUMBER");
            result.edition_date = r.string_or_empty("VERSION_DATE");
        }
    }
    citation_ = result;
    return result;
}

std::string epsg_resolver::scope_text(primary_key_t scope_code) {
    auto it = scopes_.find(scope_code);
    if (it != scopes_.end()) return it->second;

    std::string scope;
    if (table_found("Scope")) {
        auto rows = run("scope", "SELECT SCOPE FROM [Scope] WHERE SCOPE_CODE = ?", {scope_code});
        if (rows.empty()) {
            throw no_such_code_error("scope", std::to_string(scope_code));
        }
        scope = row_reader(rows.front(), "Scope", std::to_string(scope_code)).string_or_empty("SCOPE");
    }
    // "?" is how the dataset spells an unknown scope
    if (scope == "?") scope.clear();
    scopes_[scope_code] = scope;
    return scope;
}

std::string epsg_resolver::replacement_of(resolution_context& ctx, const table_info& info,
                                          primary_key_t code, std::string& reason) {
    std::string replaced_by = "(none)";
    if (table_found("Deprecation")) {
        auto rows = run("deprecation",
                        "SELECT DEPRECATION_REASON, REPLACED_BY FROM [Deprecation]"
                        " WHERE OBJECT_TABLE_NAME = ? AND OBJECT_CODE = ?",
                        {object_table_name(info), code});
        for (const auto& row : rows) {
            row_reader r(row, "Deprecation", std::to_string(code));
            auto replacement = r.optional_integer("REPLACED_BY");
            if (reason.empty()) reason = r.string_or_empty("DEPRECATION_REASON");
            if (replacement) {
                reason = r.string_or_empty("DEPRECATION_REASON");
                replaced_by = std::to_string(*replacement);
                break;
            }
        }
    }
    if (!ctx.quiet) {
        LOG_WARN("epsg", "%s EPSG:%lld is deprecated and replaced by %s.%s%s",
                 info.table, static_cast<long long>(code), replaced_by.c_str(),
                 reason.empty() ? "" : " Reason: ", reason.c_str());
    }
    return replaced_by;
}

identifier epsg_resolver::make_identifier(resolution_context& ctx, const table_info& info,
                                          primary_key_t code, const std::string& description,
                                          bool deprecated) {
    identifier id;
    id.code = std::to_string(code);
    id.version = authority_impl().edition;
    id.description = description;
    if (deprecated) {
        std::string reason;
        id.deprecated = true;
        id.replaced_by = replacement_of(ctx, info, code, reason);
        id.remarks = "Superseded by " + id.replaced_by + ".";
        if (!reason.empty()) id.remarks += " " + reason;
    }
    return id;
}

properties epsg_resolver::make_properties(resolution_context& ctx, const table_info& info,
                                          primary_key_t code, property_source source) {
    properties props;

    // Legacy single scope and extent stored on the object row
    extent_ptr legacy_extent;
    if (source.legacy_extent) {
        legacy_extent = extent_impl(ctx, *source.legacy_extent);
    }

    // Usages: collect the rows first, extents are resolved afterwards
    std::vector<std::pair<std::string, std::optional<int64_t>>> usages;
    if (table_found("Usage")) {
        auto rows = run("usage",
                        "SELECT EXTENT_CODE, SCOPE_CODE FROM [Usage] WHERE OBJECT_TABLE_NAME = ? AND OBJECT_CODE = ?",
                        {object_table_name(info), code});
        for (const auto& row : rows) {
            row_reader r(row, "Usage", std::to_string(code));
            usages.emplace_back(r.required_string("EXTENT_CODE"), r.optional_integer("SCOPE_CODE"));
        }
    }
    for (const auto& usage : usages) {
        domain d;
        if (usage.second) d.scope = scope_text(*usage.second);
        d.domain_of_validity = extent_impl(ctx, usage.first);
        props.domains.push_back(std::move(d));
    }
    if (legacy_extent || source.legacy_scope) {
        domain d;
        if (source.legacy_scope && *source.legacy_scope != "?") d.scope = *source.legacy_scope;
        d.domain_of_validity = legacy_extent;
        props.domains.insert(props.domains.begin(), std::move(d));
    }

    // Aliases. One equal to the name once accents are removed replaces the name.
    std::string name = source.name;
    if (table_found("Alias") && table_found("Naming System")) {
        auto rows = run("aliases",
                        "SELECT NAMING_SYSTEM_NAME, ALIAS FROM [Alias] INNER JOIN [Naming System]"
                        " ON [Alias].NAMING_SYSTEM_CODE = [Naming System].NAMING_SYSTEM_CODE"
                        " WHERE OBJECT_TABLE_NAME = ? AND OBJECT_CODE = ?",
                        {object_table_name(info), code});
        for (const auto& row : rows) {
            row_reader r(row, "Alias", std::to_string(code));
            auto alias = r.optional_string("ALIAS");
            if (!alias) continue;
            if (text::to_ascii(*alias) == name) {
                name = *alias;
                continue;
            }
            alias_name entry;
            entry.name = *alias;
            if (auto system = r.optional_string("NAMING_SYSTEM_NAME")) {
                auto& scope = name_spaces_[*system];
                if (!scope) scope = std::make_shared<const name_space>(name_space{*system});
                entry.scope = scope;
            }
            props.aliases.push_back(std::move(entry));
        }
    }

    props.name = name;
    props.id = make_identifier(ctx, info, code, source.description, source.deprecated);
    props.remarks = source.remarks;
    props.deprecated = source.deprecated;
    return props;
}

// ============================================================================
// Public entry points
// ============================================================================

citation epsg_resolver::authority() {
    return guarded("citation", "", [&](resolution_context&) { return authority_impl(); });
}

crs_ptr epsg_resolver::resolve_crs(const std::string& code) {
    return guarded("coordinate reference system", code,
                   [&](resolution_context& ctx) { return crs_impl(ctx, code); });
}

datum_ptr epsg_resolver::resolve_datum(const std::string& code) {
    return guarded("datum", code, [&](resolution_context& ctx) { return datum_impl(ctx, code); });
}

ellipsoid_ptr epsg_resolver::resolve_ellipsoid(const std::string& code) {
    return guarded("ellipsoid", code, [&](resolution_context& ctx) { return ellipsoid_impl(ctx, code); });
}

prime_meridian_ptr epsg_resolver::resolve_prime_meridian(const std::string& code) {
    return guarded("prime meridian", code,
                   [&](resolution_context& ctx) { return prime_meridian_impl(ctx, code); });
}

cs_ptr epsg_resolver::resolve_coordinate_system(const std::string& code) {
    return guarded("coordinate system", code, [&](resolution_context& ctx) { return cs_impl(ctx, code); });
}

axis_ptr epsg_resolver::resolve_axis(const std::string& code) {
    return guarded("axis", code, [&](resolution_context& ctx) { return axis_impl(ctx, code); });
}

unit_ptr epsg_resolver::resolve_unit(const std::string& code) {
    return guarded("unit", code, [&](resolution_context& ctx) { return unit_impl(ctx, code); });
}

parameter_ptr epsg_resolver::resolve_parameter(const std::string& code) {
    return guarded("parameter", code, [&](resolution_context& ctx) { return parameter_impl(ctx, code); });
}

method_ptr epsg_resolver::resolve_operation_method(const std::string& code) {
    return guarded("operation method", code, [&](resolution_context& ctx) { return method_impl(ctx, code); });
}

operation_ptr epsg_resolver::resolve_operation(const std::string& code) {
    return guarded("coordinate operation", code,
                   [&](resolution_context& ctx) { return operation_impl(ctx, code); });
}

extent_ptr epsg_resolver::resolve_extent(const std::string& code) {
    return guarded("extent", code, [&](resolution_context& ctx) { return extent_impl(ctx, code); });
}

conventional_rs_ptr epsg_resolver::resolve_conventional_rs(const std::string& code) {
    return guarded("conventional RS", code,
                   [&](resolution_context& ctx) { return conventional_rs_impl(ctx, code); });
}

object_ptr epsg_resolver::dispatch(resolution_context& ctx, object_kind family, const std::string& code) {
    switch (family) {
        case object_kind::crs:                  return crs_impl(ctx, code);
        case object_kind::datum:                return datum_impl(ctx, code);
        case object_kind::coordinate_system:    return cs_impl(ctx, code);
        case object_kind::coordinate_operation: return operation_impl(ctx, code);
        case object_kind::axis:                 return axis_impl(ctx, code);
        case object_kind::ellipsoid:            return ellipsoid_impl(ctx, code);
        case object_kind::prime_meridian:       return prime_meridian_impl(ctx, code);
        case object_kind::unit:                 return unit_impl(ctx, code);
        case object_kind::parameter:            return parameter_impl(ctx, code);
        case object_kind::operation_method:     return method_impl(ctx, code);
        case object_kind::conventional_rs:      return conventional_rs_impl(ctx, code);
        case object_kind::extent:               return extent_impl(ctx, code);
        default:
            throw unsupported_operation_error(std::string("No table for kind ") + to_string(family));
    }
}

object_ptr epsg_resolver::resolve(object_kind kind, const std::string& code) {
    return guarded(to_string(kind), code, [&](resolution_context& ctx) -> object_ptr {
        auto family = family_of(kind);
        if (family == object_kind::datum) {
            // An ensemble stands for a datum of its members' type, as in CRS definitions
            return datum_of_kind(ctx, code, kind);
        }
        auto object = dispatch(ctx, family, code);
        if (kind != family && object->kind() != kind) {
            throw no_such_code_error(to_string(kind), code);
        }
        return object;
    });
}

object_ptr epsg_resolver::resolve_object(const std::string& code) {
    return guarded("object", code, [&](resolution_context& ctx) -> object_ptr {
        auto trimmed = trim(code);
        bool numeric = text::is_all_digits(trimmed);
        primary_key_t key = 0;
        if (numeric) {
            try {
                key = std::stoll(trimmed);
            } catch (const std::out_of_range&) {
                throw no_such_code_error("object", code);
            }
        }

        std::optional<object_kind> found;
        for (auto family : probed_families()) {
            const auto& info = table_for(family);
            bool present;
            if (numeric) {
                std::string sql = std::string("SELECT ") + info.code_column + " FROM " +
                                  info.from_clause + " WHERE " + info.code_column + " = ?";
                present = !run(std::string("exists:") + info.table, sql, {key}).empty();
            } else {
                present = !find_codes_from_name(info, trimmed, false).empty();
            }
            if (!present) continue;
            if (found) {
                throw duplicate_identifier_error(code);
            }
            found = family;
        }
        if (!found) {
            throw no_such_code_error("object", code);
        }
        return dispatch(ctx, *found, code);
    });
}

std::vector<operation_ptr> epsg_resolver::operations_between(const std::string& source,
                                                             const std::string& target) {
    return guarded("coordinate operation", source + " -> " + target,
                   [&](resolution_context& ctx) {
        auto source_key = to_primary_key(object_kind::crs, source);
        auto target_key = to_primary_key(object_kind::crs, target);

        // Defining conversion of a projected CRS built on the source
        std::vector<std::string> conversions;
        auto rows = run("conversion between",
                        "SELECT PROJECTION_CONV_CODE FROM [Coordinate Reference System]"
                        " WHERE BASE_CRS_CODE = ? AND COORD_REF_SYS_CODE = ?",
                        {source_key, target_key});
        for (const auto& row : rows) {
            if (auto c = row_reader(row, "Coordinate Reference System", target).optional_string("PROJECTION_CONV_CODE")) {
                conversions.push_back(*c);
            }
        }

        std::vector<std::string> transformations;
        rows = run("operations between",
                   "SELECT COORD_OP_CODE FROM [Coordinate_Operation]"
                   " WHERE DEPRECATED = 0 AND SOURCE_CRS_CODE = ? AND TARGET_CRS_CODE = ?"
                   " ORDER BY COORD_OP_ACCURACY IS NULL, COORD_OP_ACCURACY ASC",
                   {source_key, target_key});
        for (const auto& row : rows) {
            if (auto c = row_reader(row, "Coordinate_Operation", source).optional_string("COORD_OP_CODE")) {
                transformations.push_back(*c);
            }
        }
        sort_impl(table_for(object_kind::coordinate_operation), transformations);

        std::vector<operation_ptr> result;
        std::set<std::string> seen;
        for (const auto* list : {&conversions, &transformations}) {
            for (const auto& c : *list) {
                if (seen.insert(c).second) {
                    result.push_back(operation_impl(ctx, c));
                }
            }
        }
        return result;
    });
}

code_set_ptr epsg_resolver::authority_codes(object_kind kind) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open(to_string(kind), "*");

    auto it = code_sets_.find(kind);
    if (it != code_sets_.end()) {
        if (auto live = it->second.lock()) return live;
    }

    const auto& info = table_for(kind);
    std::string sql = std::string("SELECT ") + info.code_column + " AS CODE, " + info.name_column + " AS NAME";
    if (info.has_deprecated) sql += ", DEPRECATED";
    sql += std::string(" FROM ") + info.from_clause;
    auto condition = subtype_condition(kind);
    if (!condition.empty()) sql += " WHERE " + condition;
    sql += std::string(" ORDER BY ") + info.code_column;

    std::vector<code_set::entry> entries;
    std::set<std::string> deprecated;
    try {
        for (const auto& row : run(std::string("codes:") + to_string(kind), sql)) {
            row_reader r(row, info.table, "*");
            auto c = r.optional_string("CODE");
            if (!c) continue;
            if (info.has_deprecated && r.flag("DEPRECATED")) {
                deprecated.insert(*c);
            } else {
                entries.push_back({*c, r.string_or_empty("NAME")});
            }
        }
    } catch (const db_error& e) {
        throw connectivity_error(e.what(), to_string(kind), "*");
    }

    auto result = std::make_shared<const code_set>(kind, std::move(entries), std::move(deprecated));
    code_sets_[kind] = result;
    return result;
}

std::optional<std::string> epsg_resolver::describe(object_kind kind, const std::string& code) {
    return guarded(to_string(kind), code, [&](resolution_context&) -> std::optional<std::string> {
        const auto& info = table_for(kind);
        primary_key_t key;
        try {
            key = to_primary_key(kind, code);
        } catch (const no_such_code_error&) {
            return std::nullopt;
        }
        std::string sql = std::string("SELECT ") + info.name_column + " AS NAME FROM " + info.from_clause +
                          " WHERE " + info.code_column + " = ?";
        auto condition = subtype_condition(kind);
        if (!condition.empty()) sql += " AND " + condition;
        auto rows = run(std::string("describe:") + to_string(kind), sql, {key});
        if (rows.empty()) return std::nullopt;
        return row_reader(rows.front(), info.table, code).optional_string("NAME");
    });
}

bool epsg_resolver::sort_by_supersession(object_kind kind, std::vector<std::string>& codes) {
    return guarded(to_string(kind), "*", [&](resolution_context&) {
        return sort_impl(table_for(kind), codes);
    });
}

} // namespace geodetic
