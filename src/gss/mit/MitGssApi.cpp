#include "krbticket/gss/mit/MitGssApiFactory.hpp"

#include "krbticket/gss/IGssApi.hpp"
#include "krbticket/security/SecureString.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <gssapi/gssapi.h>
#include <gssapi/gssapi_ext.h>
#include <gssapi/gssapi_krb5.h>

namespace krbticket::gss::mit
{
namespace
{

struct GssNameDeleter final
{
    void operator()(gss_name_t name) const noexcept
    {
        if (name != GSS_C_NO_NAME)
        {
            OM_uint32 minor{};
            (void)gss_release_name(&minor, &name);
        }
    }
};

struct GssCredDeleter final
{
    void operator()(gss_cred_id_t cred) const noexcept
    {
        if (cred != GSS_C_NO_CREDENTIAL)
        {
            OM_uint32 minor{};
            (void)gss_release_cred(&minor, &cred);
        }
    }
};

using GssNamePtr = std::unique_ptr<std::remove_pointer_t<gss_name_t>, GssNameDeleter>;
using GssCredPtr = std::unique_ptr<std::remove_pointer_t<gss_cred_id_t>, GssCredDeleter>;

class GssBuffer final
{
public:
    GssBuffer() = default;
    GssBuffer(const GssBuffer&) = delete;
    GssBuffer& operator=(const GssBuffer&) = delete;
    GssBuffer(GssBuffer&&) = delete;
    GssBuffer& operator=(GssBuffer&&) = delete;
    ~GssBuffer() noexcept
    {
        OM_uint32 minor{};
        (void)gss_release_buffer(&minor, &m_desc);
    }

    [[nodiscard]] gss_buffer_t get() noexcept
    {
        return &m_desc;
    }

    [[nodiscard]] std::string str() const
    {
        if (m_desc.value == nullptr || m_desc.length == 0U)
        {
            return {};
        }
        return std::string{ static_cast<const char*>(m_desc.value), m_desc.length };
    }

private:
    gss_buffer_desc m_desc{ 0U, nullptr };
};

void appendStatus(std::string& out, OM_uint32 code, int type)
{
    OM_uint32 messageContext{ 0U };
    do
    {
        OM_uint32 minor{};
        GssBuffer text{};
        const OM_uint32 major{ gss_display_status(&minor, code, type, GSS_C_NO_OID, &messageContext, text.get()) };
        if (GSS_ERROR(major))
        {
            return;
        }
        if (!out.empty())
        {
            out.append("; ");
        }
        out.append(text.str());
    } while (messageContext != 0U);
}

[[nodiscard]] GssErrorKind classify(OM_uint32 major) noexcept
{
    switch (GSS_ROUTINE_ERROR(major))
    {
    case GSS_S_BAD_NAME:
    case GSS_S_BAD_NAMETYPE:
        return GssErrorKind::BadName;
    case GSS_S_CREDENTIALS_EXPIRED:
        return GssErrorKind::Expired;
    case GSS_S_NO_CRED:
        return GssErrorKind::MissingCredentials;
    case GSS_S_DEFECTIVE_CREDENTIAL:
        return GssErrorKind::InvalidCredentials;
    case GSS_S_UNAVAILABLE:
        return GssErrorKind::Unavailable;
    case GSS_S_DUPLICATE_ELEMENT:
        return GssErrorKind::DuplicateElement;
    default:
        return GssErrorKind::Failure;
    }
}

[[noreturn]] void throwGssError(std::string_view routine, OM_uint32 major, OM_uint32 minor)
{
    std::string detail{};
    appendStatus(detail, major, GSS_C_GSS_CODE);
    if (minor != 0U)
    {
        appendStatus(detail, minor, GSS_C_MECH_CODE);
    }

    std::string what{ "gssapi: " };
    what.append(routine);
    what.append(" failed");
    if (!detail.empty())
    {
        what.append(": ");
        what.append(detail);
    }
    throw GssError(classify(major), what);
}

[[nodiscard]] gss_cred_usage_t toGssUsage(CredUsage usage) noexcept
{
    switch (usage)
    {
    case CredUsage::Accept:
        return GSS_C_ACCEPT;
    case CredUsage::Both:
        return GSS_C_BOTH;
    case CredUsage::Initiate:
        break;
    }
    return GSS_C_INITIATE;
}

[[nodiscard]] GssNamePtr importPrincipal(std::string_view principal)
{
    const std::string text{ principal };
    gss_buffer_desc input{ text.size(), const_cast<char*>(text.data()) };

    OM_uint32 minor{};
    gss_name_t raw{ GSS_C_NO_NAME };
    const OM_uint32 major{ gss_import_name(&minor, &input, GSS_KRB5_NT_PRINCIPAL_NAME, &raw) };
    GssNamePtr name{ raw };
    if (GSS_ERROR(major))
    {
        throwGssError("gss_import_name", major, minor);
    }
    return name;
}

// Keeps the element array alive for the duration of one collaborator call.
class KeyValueSet final
{
public:
    explicit KeyValueSet(const CredentialStore& store)
    {
        m_elements.reserve(store.size());
        for (const auto& [key, value] : store)
        {
            m_elements.push_back(gss_key_value_element_desc{ key.c_str(), value.c_str() });
        }
        m_set.count = static_cast<OM_uint32>(m_elements.size());
        m_set.elements = m_elements.data();
    }

    KeyValueSet(const KeyValueSet&) = delete;
    KeyValueSet& operator=(const KeyValueSet&) = delete;
    KeyValueSet(KeyValueSet&&) = delete;
    KeyValueSet& operator=(KeyValueSet&&) = delete;
    ~KeyValueSet() = default;

    [[nodiscard]] gss_const_key_value_set_t get() const noexcept
    {
        return m_elements.empty() ? GSS_C_NO_CRED_STORE : &m_set;
    }

private:
    std::vector<gss_key_value_element_desc> m_elements;
    gss_key_value_set_desc m_set{ 0U, nullptr };
};

class MitGssCredential final : public krbticket::gss::IGssCredential
{
public:
    explicit MitGssCredential(GssCredPtr cred) noexcept : m_cred{ std::move(cred) }
    {
    }

    [[nodiscard]] std::optional<std::uint32_t> lifetimeSeconds() const override
    {
        OM_uint32 minor{};
        OM_uint32 lifetime{ 0U };
        const OM_uint32 major{ gss_inquire_cred(&minor, m_cred.get(), nullptr, &lifetime, nullptr, nullptr) };
        if (GSS_ERROR(major))
        {
            throwGssError("gss_inquire_cred", major, minor);
        }
        if (lifetime == GSS_C_INDEFINITE)
        {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(lifetime);
    }

    void store(const CredentialStore& store, CredUsage usage, bool setDefault, bool overwrite) const override
    {
        const KeyValueSet kv{ store };
        OM_uint32 minor{};
        const OM_uint32 major{ gss_store_cred_into(&minor, m_cred.get(), toGssUsage(usage), GSS_C_NO_OID,
                                                   overwrite ? 1U : 0U, setDefault ? 1U : 0U, kv.get(), nullptr,
                                                   nullptr) };
        if (GSS_ERROR(major))
        {
            throwGssError("gss_store_cred_into", major, minor);
        }
    }

private:
    GssCredPtr m_cred;
};

class MitGssApi final : public krbticket::gss::IGssApi
{
public:
    [[nodiscard]] std::string canonicalizeName(std::string_view principal) const override
    {
        const GssNamePtr name{ importPrincipal(principal) };

        OM_uint32 minor{};
        GssBuffer display{};
        const OM_uint32 major{ gss_display_name(&minor, name.get(), display.get(), nullptr) };
        if (GSS_ERROR(major))
        {
            throwGssError("gss_display_name", major, minor);
        }
        return display.str();
    }

    [[nodiscard]] std::unique_ptr<krbticket::gss::IGssCredential>
    acquireCredential(std::string_view principal, CredUsage usage, const CredentialStore& store) override
    {
        const GssNamePtr name{ importPrincipal(principal) };
        const KeyValueSet kv{ store };

        OM_uint32 minor{};
        gss_cred_id_t raw{ GSS_C_NO_CREDENTIAL };
        const OM_uint32 major{ gss_acquire_cred_from(&minor, name.get(), GSS_C_INDEFINITE, GSS_C_NO_OID_SET,
                                                     toGssUsage(usage), kv.get(), &raw, nullptr, nullptr) };
        GssCredPtr cred{ raw };
        if (GSS_ERROR(major))
        {
            throwGssError("gss_acquire_cred_from", major, minor);
        }
        return std::make_unique<MitGssCredential>(std::move(cred));
    }

    [[nodiscard]] std::unique_ptr<krbticket::gss::IGssCredential>
    acquireCredentialWithPassword(std::string_view principal, const krbticket::security::SecureString& password,
                                  CredUsage usage) override
    {
        const GssNamePtr name{ importPrincipal(principal) };

        // The buffer aliases the caller's SecureString; nothing is copied.
        gss_buffer_desc secret{ password.size(), const_cast<char*>(password.data()) };
        gss_OID_set_desc krb5Only{ 1U, gss_mech_krb5 };

        OM_uint32 minor{};
        gss_cred_id_t raw{ GSS_C_NO_CREDENTIAL };
        const OM_uint32 major{ gss_acquire_cred_with_password(&minor, name.get(), &secret, GSS_C_INDEFINITE,
                                                              &krb5Only, toGssUsage(usage), &raw, nullptr,
                                                              nullptr) };
        GssCredPtr cred{ raw };
        if (GSS_ERROR(major))
        {
            throwGssError("gss_acquire_cred_with_password", major, minor);
        }
        return std::make_unique<MitGssCredential>(std::move(cred));
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<krbticket::gss::IGssApi> makeMitGssApi()
{
    return std::make_unique<MitGssApi>();
}

} // namespace krbticket::gss::mit
