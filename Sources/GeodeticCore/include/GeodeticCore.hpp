#pragma once

// GeodeticCore - EPSG geodetic dataset resolver
//
// Usage:
//   #include <GeodeticCore.hpp>
//
//   int main() {
//       geodetic::configuration config("/usr/share/epsg/epsg.sqlite");
//       geodetic::epsg_resolver epsg(config);
//
//       auto crs = epsg.resolve_crs("4326");          // or "WGS 84"
//       std::cout << crs->name() << std::endl;
//
//       for (const auto& op : epsg.operations_between("4326", "32631")) {
//           std::cout << op->to_json().dump(2) << std::endl;
//       }
//   }

#include "geodetic/log.hpp"
#include "geodetic/types.hpp"
#include "geodetic/errors.hpp"
#include "geodetic/db.hpp"
#include "geodetic/configuration.hpp"
#include "geodetic/units.hpp"
#include "geodetic/objects.hpp"
#include "geodetic/code_set.hpp"
#include "geodetic/resolver.hpp"
#include "geodetic/pool.hpp"
