#include "krbticket/core/Logging.hpp"

#include "krbticket/core/EnvConfig.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace krbticket::core
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::mutex mutex{};
    const std::lock_guard<std::mutex> lock{ mutex };

    const std::string name{ g_kLoggerName };
    if (auto existing{ spdlog::get(name) })
    {
        return existing;
    }
    return spdlog::stderr_color_mt(name);
}

bool setLogLevel(std::string_view level)
{
    const std::string name{ level };
    const auto parsed{ spdlog::level::from_str(name) };
    if (parsed == spdlog::level::off && name != "off")
    {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

void configureLoggingFromEnv()
{
    const auto level{ getEnv(g_kLogLevelEnv) };
    if (!level.has_value() || level->empty())
    {
        return;
    }
    if (!setLogLevel(*level))
    {
        logger()->warn("ignoring unknown {} value '{}'", g_kLogLevelEnv, *level);
    }
}

} // namespace krbticket::core
