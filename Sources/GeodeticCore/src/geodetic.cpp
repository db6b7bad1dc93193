#include "geodetic/log.hpp"

namespace geodetic {

// Single definition of the global log level (declared extern in log.hpp).
// Warnings are on by default so that uses of deprecated codes are reported.
std::atomic<log_level> g_log_level{log_level::warn};

} // namespace geodetic
