#ifndef CHUNKSTREAM_LOGGER_HPP
#define CHUNKSTREAM_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws core::ValidationError on anything else.
severity_level parse_severity(const std::string& name);

// Installs a console sink and, when log_file is non-empty, an auto-flushed
// text file sink. Removes previously installed sinks.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::info);

} // namespace logger
} // namespace chunkstream

#endif // CHUNKSTREAM_LOGGER_HPP
