#include "krbticket/core/EnvConfig.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace krbticket::core
{

std::optional<std::string> getEnv(std::string_view name)
{
    if (name.empty())
    {
        return std::nullopt;
    }

    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
}

namespace
{

[[nodiscard]] std::optional<std::string> pick(const std::optional<std::string>& flag, std::string_view env)
{
    return flag.has_value() ? flag : getEnv(env);
}

} // namespace

SessionConfig loadSessionConfigFromEnv(const krbticket::gss::IGssApi& gss, const ConfigOverrides& overrides)
{
    const auto principal{ pick(overrides.principal, g_kPrincipalEnv) };
    if (!principal.has_value() || principal->empty())
    {
        throw std::invalid_argument(std::string{ "no principal: " } + std::string{ g_kPrincipalEnv } + " is not set");
    }

    std::optional<std::string> ccache{ pick(overrides.ccache, g_kCcacheEnv) };
    if (ccache.has_value() && ccache->empty())
    {
        ccache.reset();
    }

    SessionConfig config{ Principal::parse(gss, *principal), std::move(ccache) };

    if (const auto keytab{ pick(overrides.keytab, g_kKeytabEnv) }; keytab.has_value() && !keytab->empty())
    {
        config = config.withKeytab(*keytab);
    }
    return config;
}

} // namespace krbticket::core
