#ifndef INCLUDE_KRBTICKET_GSS_IGSSAPI_HPP
#define INCLUDE_KRBTICKET_GSS_IGSSAPI_HPP

#include "krbticket/security/SecureString.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace krbticket::gss
{

// Key/value credential store handed to the mechanism ("client_keytab", "ccache").
// An empty map selects the process defaults.
using CredentialStore = std::map<std::string, std::string>;

enum class CredUsage : std::uint8_t
{
    Initiate,
    Accept,
    Both,
};

enum class GssErrorKind : std::uint8_t
{
    BadName,
    Expired,
    MissingCredentials,
    InvalidCredentials,
    Unavailable,
    DuplicateElement,
    Failure,
};

class GssError final : public std::runtime_error
{
public:
    GssError(GssErrorKind kind, const std::string& what) : std::runtime_error(what), m_kind{ kind }
    {
    }

    [[nodiscard]] GssErrorKind kind() const noexcept
    {
        return m_kind;
    }

private:
    GssErrorKind m_kind;
};

// Live credentials owned by the collaborator; released on destruction.
class IGssCredential
{
public:
    IGssCredential() = default;
    IGssCredential(const IGssCredential&) = delete;
    IGssCredential& operator=(const IGssCredential&) = delete;
    IGssCredential(IGssCredential&&) = delete;
    IGssCredential& operator=(IGssCredential&&) = delete;
    virtual ~IGssCredential() = default;

    // Inquires the remaining lifetime. std::nullopt means the mechanism reports no bound.
    // Throws GssError.
    [[nodiscard]] virtual std::optional<std::uint32_t> lifetimeSeconds() const = 0;

    // Throws GssError.
    virtual void store(const CredentialStore& store, CredUsage usage, bool setDefault, bool overwrite) const = 0;
};

class IGssApi
{
public:
    IGssApi() = default;
    IGssApi(const IGssApi&) = delete;
    IGssApi& operator=(const IGssApi&) = delete;
    IGssApi(IGssApi&&) = delete;
    IGssApi& operator=(IGssApi&&) = delete;
    virtual ~IGssApi() = default;

    // Parses `principal` as a Kerberos principal name and returns its display form.
    // Throws GssError (BadName) when the syntax is rejected.
    [[nodiscard]] virtual std::string canonicalizeName(std::string_view principal) const = 0;

    [[nodiscard]] virtual std::unique_ptr<IGssCredential>
    acquireCredential(std::string_view principal, CredUsage usage, const CredentialStore& store) = 0;

    // Restricted to the Kerberos mechanism. The password is not retained past the call.
    [[nodiscard]] virtual std::unique_ptr<IGssCredential>
    acquireCredentialWithPassword(std::string_view principal, const krbticket::security::SecureString& password,
                                  CredUsage usage) = 0;
};

[[nodiscard]] std::string_view toString(CredUsage usage) noexcept;
[[nodiscard]] std::string_view toString(GssErrorKind kind) noexcept;

} // namespace krbticket::gss

#endif // INCLUDE_KRBTICKET_GSS_IGSSAPI_HPP
