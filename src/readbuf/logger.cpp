#include "readbuf/logger.hpp"

#include <exception>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "readbuf/check.hpp"

namespace readbuf::log
{

namespace
{

std::shared_ptr<spdlog::logger> MakeLogger(const Config& config)
{
    spdlog::sink_ptr sink;
    if (config.colors)
    {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else
    {
        sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    }

    auto logger = std::make_shared<spdlog::logger>(std::string(kLoggerName), std::move(sink));
    logger->set_pattern(std::string(kDefaultPattern));
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::err);
    return logger;
}

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

}  // namespace

std::shared_ptr<spdlog::logger> Get()
{
    std::lock_guard lock(g_mutex);
    if (!g_logger)
    {
        g_logger = MakeLogger(Config{});
    }
    return g_logger;
}

void Configure(const Config& config)
{
    auto logger = MakeLogger(config);
    std::lock_guard lock(g_mutex);
    g_logger = std::move(logger);
}

void SetLevel(spdlog::level::level_enum level)
{
    Get()->set_level(level);
}

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name)
{
    // spdlog maps unknown names to "off", so only trust "off" when it was asked for.
    const auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off")
    {
        return std::nullopt;
    }
    return level;
}

}  // namespace readbuf::log

namespace readbuf::detail
{

void ContractViolation(const char* what, std::source_location loc)
{
    const auto logger = log::Get();
    logger->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
               spdlog::level::critical, "FATAL: contract violation: {}", what);
    logger->flush();
    std::terminate();
}

}  // namespace readbuf::detail
