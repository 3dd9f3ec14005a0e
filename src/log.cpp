// =============================================================================
// log.cpp - Boost.Log severity setup
// =============================================================================

#include "rangepool/log.hpp"
#include "rangepool/types.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace rangepool {
namespace log {

namespace logging = boost::log;
using severity = boost::log::trivial::severity_level;

severity parse_level(const std::string& level) {
    if (level == "trace") return severity::trace;
    if (level == "debug") return severity::debug;
    if (level == "info") return severity::info;
    if (level == "warning") return severity::warning;
    if (level == "error") return severity::error;
    if (level == "fatal") return severity::fatal;
    throw PoolError(ErrorCode::INVALID_CONFIG, "log: unknown level '" + level + "'");
}

void init(const std::string& level) {
    if (level == "off") {
        logging::core::get()->set_logging_enabled(false);
        return;
    }

    severity min_level = parse_level(level);
    logging::core::get()->set_logging_enabled(true);
    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

} // namespace log
} // namespace rangepool
