#pragma once

#ifdef __cplusplus

#include "objects.hpp"
#include <string>
#include <vector>

namespace geodetic {

// ============================================================================
// Where each family of objects lives in the EPSG schema. Table names use the
// MS-Access spelling inside brackets; sql_translator rewrites them.
// ============================================================================

struct table_info {
    object_kind family;
    const char* table;        ///< Table name, e.g. "Coordinate Reference System"
    const char* from_clause;  ///< FROM clause (a join for axes)
    const char* code_column;
    const char* name_column;
    const char* type_column;  ///< Discriminator column, nullptr if none
    bool has_deprecated;      ///< Table has a DEPRECATED column
};

/// Table of the family of `kind`.
const table_info& table_for(object_kind kind);

/// Families probed by resolve_object(), in probe order. Units and extents
/// are left out: their codes overlap the codes of the other tables.
const std::vector<object_kind>& probed_families();

/// Subtypes of a family, empty for single-table kinds.
const std::vector<object_kind>& subtypes_of(object_kind family);

/// SQL condition on the discriminator column selecting `kind`,
/// or an empty string when `kind` is a family.
std::string subtype_condition(object_kind kind);

} // namespace geodetic

#endif // __cplusplus
