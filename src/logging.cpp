#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <workhooks/errors.hpp>
#include <workhooks/logging.hpp>

namespace workhooks
{
namespace log
{

namespace
{
std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;
} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current_logger)
    {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        current_logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
        current_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
        current_logger->set_level(spdlog::level::info);
    }
    return current_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger)
{
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger = std::move(logger);
}

void set_level(const std::string& level)
{
    // from_str maps unknown names to "off"
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off")
        throw ConfigurationError("Unknown log level '" + level + "'");
    logger()->set_level(parsed);
}

} // namespace log
} // namespace workhooks
