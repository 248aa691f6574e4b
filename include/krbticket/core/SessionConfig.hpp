#ifndef INCLUDE_KRBTICKET_CORE_SESSIONCONFIG_HPP
#define INCLUDE_KRBTICKET_CORE_SESSIONCONFIG_HPP

#include "krbticket/gss/IGssApi.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace krbticket::core
{

class Principal final
{
public:
    // Throws InvalidPrincipalError when the collaborator rejects the name syntax.
    [[nodiscard]] static Principal parse(const krbticket::gss::IGssApi& gss, std::string_view raw);

    [[nodiscard]] const std::string& raw() const noexcept
    {
        return m_raw;
    }

    // Display form reported by the collaborator after parsing.
    [[nodiscard]] const std::string& name() const noexcept
    {
        return m_name;
    }

    friend bool operator==(const Principal& a, const Principal& b) noexcept
    {
        return a.m_name == b.m_name;
    }

private:
    Principal(std::string raw, std::string name) noexcept : m_raw{ std::move(raw) }, m_name{ std::move(name) }
    {
    }

    std::string m_raw;
    std::string m_name;
};

// Immutable session settings. Every "with" call validates its input and returns a new value,
// so a SessionConfig that exists is always valid.
class SessionConfig final
{
public:
    explicit SessionConfig(Principal principal, std::optional<std::string> ccache = std::nullopt);

    [[nodiscard]] SessionConfig withPrincipal(Principal principal) const;

    // Resolves `keytab` to an absolute path. Throws KeytabNotFoundError when it does not exist.
    [[nodiscard]] SessionConfig withKeytab(const std::filesystem::path& keytab) const;

    // Stored verbatim; std::nullopt or "" selects the system default cache.
    [[nodiscard]] SessionConfig withCcache(std::optional<std::string> ccache) const;

    [[nodiscard]] const Principal& principal() const noexcept
    {
        return m_principal;
    }
    [[nodiscard]] const std::optional<std::filesystem::path>& keytab() const noexcept
    {
        return m_keytab;
    }
    [[nodiscard]] const std::optional<std::string>& ccache() const noexcept
    {
        return m_ccache;
    }

private:
    Principal m_principal;
    std::optional<std::filesystem::path> m_keytab;
    std::optional<std::string> m_ccache;
};

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_SESSIONCONFIG_HPP
