#include "krbticket/core/TicketSession.hpp"

#include "krbticket/core/CredentialStore.hpp"
#include "krbticket/core/Logging.hpp"
#include "krbticket/security/ScratchDirectory.hpp"
#include <exception>
#include <utility>

namespace krbticket::core
{
namespace
{

[[nodiscard]] AcquireError acquireErrorFor(krbticket::gss::GssErrorKind kind) noexcept
{
    switch (kind)
    {
    case krbticket::gss::GssErrorKind::Expired:
        return AcquireError::Expired;
    case krbticket::gss::GssErrorKind::MissingCredentials:
        return AcquireError::MissingCredentials;
    case krbticket::gss::GssErrorKind::InvalidCredentials:
        return AcquireError::InvalidCredentials;
    default:
        return AcquireError::ProtocolError;
    }
}

[[nodiscard]] AcquireError failureOf(const AttemptOutcome& outcome) noexcept
{
    if (const auto* unusable{ std::get_if<UnusableCredentials>(&outcome) })
    {
        return unusable->reason;
    }
    return AcquireError::Expired;
}

[[nodiscard]] const krbticket::gss::IGssCredential* credentialsOf(const AttemptOutcome& outcome) noexcept
{
    if (const auto* valid{ std::get_if<ValidCredentials>(&outcome) })
    {
        return valid->creds.get();
    }
    return nullptr;
}

[[nodiscard]] std::string scratchCacheRef(const std::filesystem::path& dir)
{
    return "FILE:" + (dir / std::filesystem::path{ g_kScratchCacheName }).string();
}

} // namespace

TicketSession::TicketSession(krbticket::gss::IGssApi& gss, SessionConfig config,
                             LifetimeTracker::NowProvider nowProvider)
    : m_gss(&gss), m_config(std::move(config)), m_lifetime(std::move(nowProvider))
{
}

void TicketSession::setPrincipal(std::string_view raw)
{
    m_config = m_config.withPrincipal(Principal::parse(*m_gss, raw));
}

void TicketSession::setKeytab(const std::filesystem::path& keytab)
{
    m_config = m_config.withKeytab(keytab);
}

void TicketSession::setCcache(std::optional<std::string> ccache)
{
    m_config = m_config.withCcache(std::move(ccache));
}

void TicketSession::setScratchRoot(std::filesystem::path root)
{
    m_scratchRoot = std::move(root);
}

AcquireRequest TicketSession::requestFor(krbticket::gss::CredUsage usage, krbticket::gss::CredentialStore store) const
{
    return AcquireRequest{ m_config.principal().name(), usage, std::move(store) };
}

AttemptOutcome TicketSession::inspect(std::unique_ptr<krbticket::gss::IGssCredential> creds) noexcept
{
    try
    {
        const auto lifetime{ creds->lifetimeSeconds() };
        if (lifetime.has_value() && *lifetime == 0U)
        {
            m_lifetime.clear();
            return ExpiredCredentials{};
        }

        if (lifetime.has_value())
        {
            m_lifetime.recordLifetime(static_cast<std::int64_t>(*lifetime));
        }
        else
        {
            m_lifetime.clear();
        }
        return ValidCredentials{ std::move(creds), lifetime };
    }
    catch (const krbticket::gss::GssError& e)
    {
        m_lifetime.clear();
        if (e.kind() == krbticket::gss::GssErrorKind::Expired)
        {
            return ExpiredCredentials{};
        }
        logger()->debug("krb inquire failed: {}", e.what());
        return UnusableCredentials{ acquireErrorFor(e.kind()) };
    }
    catch (const std::exception& e)
    {
        m_lifetime.clear();
        logger()->debug("krb inquire failed: {}", e.what());
        return UnusableCredentials{ AcquireError::ProtocolError };
    }
}

AttemptOutcome TicketSession::attemptAcquire(const AcquireRequest& request) noexcept
{
    std::unique_ptr<krbticket::gss::IGssCredential> creds{};
    try
    {
        creds = m_gss->acquireCredential(request.principal, request.usage, request.store);
    }
    catch (const krbticket::gss::GssError& e)
    {
        m_lifetime.clear();
        if (e.kind() == krbticket::gss::GssErrorKind::Expired)
        {
            logger()->debug("krb credentials for {} expired, store: {}", request.principal,
                            describeStore(request.store));
            return ExpiredCredentials{};
        }
        logger()->debug("krb acquire failed for {} ({}), store: {}: {}", request.principal,
                        krbticket::gss::toString(e.kind()), describeStore(request.store), e.what());
        return UnusableCredentials{ acquireErrorFor(e.kind()) };
    }
    catch (const std::exception& e)
    {
        m_lifetime.clear();
        logger()->debug("krb acquire failed for {}, store: {}: {}", request.principal, describeStore(request.store),
                        e.what());
        return UnusableCredentials{ AcquireError::ProtocolError };
    }

    if (!creds)
    {
        m_lifetime.clear();
        return UnusableCredentials{ AcquireError::MissingCredentials };
    }
    return inspect(std::move(creds));
}

AcquireResult<std::monostate> TicketSession::tryAcquireFromDefault(krbticket::gss::CredUsage usage) noexcept
{
    const AttemptOutcome outcome{ attemptAcquire(requestFor(usage, buildStore(m_config))) };
    if (std::holds_alternative<ValidCredentials>(outcome))
    {
        return std::monostate{};
    }
    return failureOf(outcome);
}

AcquireResult<std::monostate> TicketSession::tryAcquireWithKeyTab(const std::filesystem::path& keytab,
                                                                  krbticket::gss::CredUsage usage, bool setDefault,
                                                                  bool overwrite)
{
    setKeytab(keytab);

    AcquireRequest request{ requestFor(usage, buildStore(m_config)) };
    {
        const AttemptOutcome direct{ attemptAcquire(request) };
        if (std::holds_alternative<ValidCredentials>(direct))
        {
            logger()->info("acquired credentials for {} from {}", request.principal, describeStore(request.store));
            return std::monostate{};
        }
    }

    logger()->warn("key table acquisition for {} into {} failed, retrying through a scratch cache",
                   request.principal, describeStore(request.store));

    // Declared before the retry outcome so the credential handle is released before the directory goes.
    auto scratch{ krbticket::security::ScratchDirectory::create(g_kScratchSuffix, m_scratchRoot) };
    if (!scratch.has_value())
    {
        logger()->error("unable to create a private scratch directory for {}", request.principal);
        return AcquireError::ScratchUnavailable;
    }

    request.store = withCacheOverride(std::move(request.store), scratchCacheRef(scratch->path()));
    const AttemptOutcome retry{ attemptAcquire(request) };

    const auto committed{ m_committer.commit(credentialsOf(retry), buildCacheStore(m_config.ccache()), usage,
                                             setDefault, overwrite) };
    if (!std::holds_alternative<ValidCredentials>(retry))
    {
        return failureOf(retry);
    }
    if (succeeded(committed))
    {
        logger()->info("acquired credentials for {} with key table {}", request.principal, keytab.string());
    }
    return committed;
}

AcquireResult<std::monostate> TicketSession::tryAcquireWithPassword(const krbticket::security::SecureString& password,
                                                                    krbticket::gss::CredUsage usage, bool setDefault,
                                                                    bool overwrite) noexcept
{
    const std::string& principal{ m_config.principal().name() };

    std::unique_ptr<krbticket::gss::IGssCredential> creds{};
    try
    {
        creds = m_gss->acquireCredentialWithPassword(principal, password, usage);
    }
    catch (const krbticket::gss::GssError& e)
    {
        m_lifetime.clear();
        logger()->error("unable to acquire Kerberos credentials for {} to obtain a TGT: {}", principal, e.what());
        return acquireErrorFor(e.kind());
    }
    catch (const std::exception& e)
    {
        m_lifetime.clear();
        logger()->error("unable to acquire Kerberos credentials for {} to obtain a TGT: {}", principal, e.what());
        return AcquireError::ProtocolError;
    }

    if (!creds)
    {
        m_lifetime.clear();
        return m_committer.commit(nullptr, buildStore(m_config), usage, setDefault, overwrite);
    }

    const AttemptOutcome inspected{ inspect(std::move(creds)) };
    const auto committed{ m_committer.commit(credentialsOf(inspected), buildStore(m_config), usage, setDefault,
                                             overwrite) };
    if (!std::holds_alternative<ValidCredentials>(inspected))
    {
        return failureOf(inspected);
    }
    return committed;
}

bool TicketSession::acquireFromDefault(krbticket::gss::CredUsage usage) noexcept
{
    return succeeded(tryAcquireFromDefault(usage));
}

bool TicketSession::acquireWithKeyTab(const std::filesystem::path& keytab, krbticket::gss::CredUsage usage,
                                      bool setDefault, bool overwrite)
{
    return succeeded(tryAcquireWithKeyTab(keytab, usage, setDefault, overwrite));
}

bool TicketSession::acquireWithPassword(const krbticket::security::SecureString& password,
                                        krbticket::gss::CredUsage usage, bool setDefault, bool overwrite) noexcept
{
    return succeeded(tryAcquireWithPassword(password, usage, setDefault, overwrite));
}

bool TicketSession::isExpired() noexcept
{
    const AttemptOutcome outcome{ attemptAcquire(requestFor(krbticket::gss::CredUsage::Initiate,
                                                            buildStore(m_config))) };
    if (std::holds_alternative<ExpiredCredentials>(outcome))
    {
        return true;
    }
    if (const auto* unusable{ std::get_if<UnusableCredentials>(&outcome) })
    {
        return unusable->reason == AcquireError::MissingCredentials ||
               unusable->reason == AcquireError::InvalidCredentials;
    }
    return false;
}

} // namespace krbticket::core
