#ifndef INCLUDE_KRBTICKET_CORE_ENVCONFIG_HPP
#define INCLUDE_KRBTICKET_CORE_ENVCONFIG_HPP

#include "krbticket/core/SessionConfig.hpp"
#include "krbticket/gss/IGssApi.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace krbticket::core
{

inline constexpr std::string_view g_kPrincipalEnv{ "KTC_PRINCIPAL" };
inline constexpr std::string_view g_kCcacheEnv{ "KTC_CCACHE" };
inline constexpr std::string_view g_kKeytabEnv{ "KTC_KEYTAB" };

[[nodiscard]] std::optional<std::string> getEnv(std::string_view name);

// Values supplied by the caller (e.g. command-line flags). A set field wins over its variable.
struct ConfigOverrides final
{
    std::optional<std::string> principal;
    std::optional<std::string> ccache;
    std::optional<std::string> keytab;
};

// Builds a config from KTC_PRINCIPAL (required), KTC_CCACHE and KTC_KEYTAB, each replaced by
// the matching field of `overrides` when that is set. Throws std::invalid_argument when no
// principal is given; principal and keytab validation errors propagate unchanged.
[[nodiscard]] SessionConfig loadSessionConfigFromEnv(const krbticket::gss::IGssApi& gss,
                                                     const ConfigOverrides& overrides = {});

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_ENVCONFIG_HPP
