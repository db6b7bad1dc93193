#pragma once

#ifdef __cplusplus

#include <string>

namespace geodetic {

/// Adapts queries written against the MS-Access names of the EPSG tables
/// ("[Coordinate Reference System]") to the tables actually installed.
///
/// With an empty prefix the bracketed names are kept and quoted with
/// double quotes. With a prefix such as "epsg_" the names are converted to
/// the lower-case form of the SQL scripts: "[Coordinate Reference System]"
/// becomes "epsg_coordinatereferencesystem" and "[Coordinate_Operation
/// Parameter Value]" becomes "epsg_coordoperationparamvalue".
class sql_translator {
public:
    sql_translator() = default;
    sql_translator(std::string table_prefix, std::string schema)
        : prefix_(std::move(table_prefix)), schema_(std::move(schema)) {}

    /// Rewrites every [Table Name] occurrence of `sql`.
    std::string apply(const std::string& sql) const;

    /// Actual name of a table, without schema or quotes.
    std::string table_name(const std::string& access_name) const;

    /// Value stored in the OBJECT_TABLE_NAME columns ("Alias", "Usage",
    /// "Deprecation", "Supersession") for the given table. The dataset uses
    /// the same naming convention as its table names.
    std::string to_object_table_name(const std::string& access_name) const {
        return table_name(access_name);
    }

    const std::string& prefix() const { return prefix_; }
    const std::string& schema() const { return schema_; }

private:
    std::string prefix_;
    std::string schema_;
};

} // namespace geodetic

#endif // __cplusplus
