#pragma once

#ifdef __cplusplus

#include "objects.hpp"
#include <string>

namespace geodetic {
namespace units {

// EPSG codes of the base unit for each unit type
constexpr int metre = 9001;
constexpr int radian = 9101;
constexpr int unity = 9201;
constexpr int second = 1040;

/// Units known without a database query, or null if `code` is not one of them.
unit_ptr from_epsg(int code);

/// A unit derived from `base`: value_in_base = value * b / c.
unit_ptr derive(int code, const std::string& name, const unit& base, double b, double c);

/// Parses a unit name or symbol ("metre", "km", "degree", "sexagesimal DMS", ...).
/// Returns null if the text is not recognized.
unit_ptr parse(int code, const std::string& text);

} // namespace units
} // namespace geodetic

#endif // __cplusplus
