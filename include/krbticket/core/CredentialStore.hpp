#ifndef INCLUDE_KRBTICKET_CORE_CREDENTIALSTORE_HPP
#define INCLUDE_KRBTICKET_CORE_CREDENTIALSTORE_HPP

#include "krbticket/core/SessionConfig.hpp"
#include "krbticket/gss/IGssApi.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace krbticket::core
{

inline constexpr std::string_view g_kStoreKeyClientKeytab{ "client_keytab" };
inline constexpr std::string_view g_kStoreKeyCcache{ "ccache" };

// {client_keytab?, ccache?} derived from `config`; empty when neither is set.
[[nodiscard]] krbticket::gss::CredentialStore buildStore(const SessionConfig& config);

// Cache-only descriptor, the target for credentials promoted out of a scratch cache.
[[nodiscard]] krbticket::gss::CredentialStore buildCacheStore(const std::optional<std::string>& ccache);

[[nodiscard]] krbticket::gss::CredentialStore withCacheOverride(krbticket::gss::CredentialStore store,
                                                                std::string ccache);

// "client_keytab=/etc/krb5.keytab, ccache=FILE:/tmp/cc" or "<default>"; used in log lines.
[[nodiscard]] std::string describeStore(const krbticket::gss::CredentialStore& store);

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_CREDENTIALSTORE_HPP
