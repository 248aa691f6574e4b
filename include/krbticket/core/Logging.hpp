#ifndef INCLUDE_KRBTICKET_CORE_LOGGING_HPP
#define INCLUDE_KRBTICKET_CORE_LOGGING_HPP

#include <memory>
#include <spdlog/logger.h>
#include <string_view>

namespace krbticket::core
{

inline constexpr std::string_view g_kLoggerName{ "krbticket" };
inline constexpr std::string_view g_kLogLevelEnv{ "KTC_LOG_LEVEL" };

// Shared "krbticket" logger; created with a stderr sink on first use unless the
// application registered one under the same name beforehand.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names ("debug", "info", "warn", ...). Returns false for unknown names.
bool setLogLevel(std::string_view level);

void configureLoggingFromEnv();

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_LOGGING_HPP
