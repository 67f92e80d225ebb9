#ifndef PWV_LOGGER_HPP
#define PWV_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace pwv::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a file sink. The file is truncated on start.
void init_logging(const std::string& log_file = "pwvault.log",
                  severity_level min_level = boost::log::trivial::info);

// Sets the minimum severity that reaches the sinks
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

} // namespace pwv::logging

#endif // PWV_LOGGER_HPP
