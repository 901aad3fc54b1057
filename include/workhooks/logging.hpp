#ifndef WORKHOOKS_LOGGING_HPP
#define WORKHOOKS_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace workhooks
{
namespace log
{

constexpr const char* LOGGER_NAME = "workhooks";

// Library-wide logger. Created on first use with a colored stderr sink.
std::shared_ptr<spdlog::logger> logger();

// Replace the library logger (tests install a ring-buffer sink here)
void set_logger(std::shared_ptr<spdlog::logger> logger);

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
// Throws ConfigurationError for anything else.
void set_level(const std::string& level);

} // namespace log
} // namespace workhooks

#endif // WORKHOOKS_LOGGING_HPP
