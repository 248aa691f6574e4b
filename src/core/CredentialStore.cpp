#include "krbticket/core/CredentialStore.hpp"

namespace krbticket::core
{

krbticket::gss::CredentialStore buildStore(const SessionConfig& config)
{
    krbticket::gss::CredentialStore store{ buildCacheStore(config.ccache()) };
    if (config.keytab().has_value())
    {
        store.insert_or_assign(std::string{ g_kStoreKeyClientKeytab }, config.keytab()->string());
    }
    return store;
}

krbticket::gss::CredentialStore buildCacheStore(const std::optional<std::string>& ccache)
{
    krbticket::gss::CredentialStore store{};
    if (ccache.has_value() && !ccache->empty())
    {
        store.insert_or_assign(std::string{ g_kStoreKeyCcache }, *ccache);
    }
    return store;
}

krbticket::gss::CredentialStore withCacheOverride(krbticket::gss::CredentialStore store, std::string ccache)
{
    store.insert_or_assign(std::string{ g_kStoreKeyCcache }, std::move(ccache));
    return store;
}

std::string describeStore(const krbticket::gss::CredentialStore& store)
{
    if (store.empty())
    {
        return "<default>";
    }

    std::string out{};
    for (const auto& [key, value] : store)
    {
        if (!out.empty())
        {
            out.append(", ");
        }
        out.append(key);
        out.push_back('=');
        out.append(value);
    }
    return out;
}

} // namespace krbticket::core
