#ifndef RANGEPOOL_LOG_HPP
#define RANGEPOOL_LOG_HPP

#include <string>

#include <boost/log/trivial.hpp>

namespace rangepool {
namespace log {

// Set the global severity filter: trace, debug, info, warning, error, fatal
// or off. Throws PoolError(INVALID_CONFIG) on an unknown name.
void init(const std::string& level);

// Parse a level name without touching the logging core
boost::log::trivial::severity_level parse_level(const std::string& level);

} // namespace log
} // namespace rangepool

#endif // RANGEPOOL_LOG_HPP
