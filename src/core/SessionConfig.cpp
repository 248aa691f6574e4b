#include "krbticket/core/SessionConfig.hpp"

#include "krbticket/core/KrbErrors.hpp"
#include <system_error>

namespace krbticket::core
{

Principal Principal::parse(const krbticket::gss::IGssApi& gss, std::string_view raw)
{
    if (raw.empty())
    {
        throw InvalidPrincipalError("principal: empty name");
    }

    try
    {
        std::string name{ gss.canonicalizeName(raw) };
        return Principal{ std::string{ raw }, std::move(name) };
    }
    catch (const krbticket::gss::GssError& e)
    {
        throw InvalidPrincipalError(std::string{ "principal: '" } + std::string{ raw } + "' rejected: " + e.what());
    }
}

SessionConfig::SessionConfig(Principal principal, std::optional<std::string> ccache)
    : m_principal(std::move(principal)), m_keytab{}, m_ccache(std::move(ccache))
{
}

SessionConfig SessionConfig::withPrincipal(Principal principal) const
{
    SessionConfig out{ *this };
    out.m_principal = std::move(principal);
    return out;
}

SessionConfig SessionConfig::withKeytab(const std::filesystem::path& keytab) const
{
    if (keytab.empty())
    {
        throw KeytabNotFoundError("keytab: empty path");
    }

    std::error_code ec{};
    const std::filesystem::path resolved{ std::filesystem::absolute(keytab, ec) };
    if (ec)
    {
        throw KeytabNotFoundError("keytab: cannot resolve '" + keytab.string() + "'");
    }

    ec.clear();
    if (!std::filesystem::exists(resolved, ec) || ec)
    {
        throw KeytabNotFoundError("keytab: '" + resolved.string() + "' doesn't exist");
    }

    SessionConfig out{ *this };
    out.m_keytab = resolved.lexically_normal();
    return out;
}

SessionConfig SessionConfig::withCcache(std::optional<std::string> ccache) const
{
    SessionConfig out{ *this };
    out.m_ccache = std::move(ccache);
    return out;
}

} // namespace krbticket::core
