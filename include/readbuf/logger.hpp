#pragma once
////////////////////////////////////////////////////////////////////////////////
// Library logger
//
// Thin layer over spdlog: one named logger ("readbuf") writing to stderr,
// created on first use. Use the READBUF_LOG_* macros so the call site is
// captured.
////////////////////////////////////////////////////////////////////////////////

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace readbuf::log
{

constexpr std::string_view kLoggerName = "readbuf";
constexpr std::string_view kDefaultPattern = "[%L] [%T.%e] [%t] %s:%# | %v";

struct Config
{
    spdlog::level::level_enum level = spdlog::level::info;
    bool colors = true;
};

/// @brief Returns the library logger, creating it with defaults on first use.
/// The caller shares ownership, so a concurrent Configure() cannot destroy it mid-call.
std::shared_ptr<spdlog::logger> Get();

/// @brief Replaces the library logger. Later Get() calls see the new one.
void Configure(const Config& config);

void SetLevel(spdlog::level::level_enum level);

/// @brief Parses "debug", "info", "warn", "error", "critical" or "off".
/// @return std::nullopt for anything spdlog does not recognise.
std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

}  // namespace readbuf::log

#define READBUF_LOG_CALL(level, ...) SPDLOG_LOGGER_CALL(::readbuf::log::Get(), level, __VA_ARGS__)

#define READBUF_LOG_DEBUG(...)    READBUF_LOG_CALL(spdlog::level::debug, __VA_ARGS__)
#define READBUF_LOG_INFO(...)     READBUF_LOG_CALL(spdlog::level::info, __VA_ARGS__)
#define READBUF_LOG_WARN(...)     READBUF_LOG_CALL(spdlog::level::warn, __VA_ARGS__)
#define READBUF_LOG_ERROR(...)    READBUF_LOG_CALL(spdlog::level::err, __VA_ARGS__)
#define READBUF_LOG_CRITICAL(...) READBUF_LOG_CALL(spdlog::level::critical, __VA_ARGS__)
