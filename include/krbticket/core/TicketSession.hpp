#ifndef INCLUDE_KRBTICKET_CORE_TICKETSESSION_HPP
#define INCLUDE_KRBTICKET_CORE_TICKETSESSION_HPP

#include "krbticket/core/AcquireError.hpp"
#include "krbticket/core/CredentialCommitter.hpp"
#include "krbticket/core/LifetimeTracker.hpp"
#include "krbticket/core/SessionConfig.hpp"
#include "krbticket/gss/IGssApi.hpp"
#include "krbticket/security/SecureString.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace krbticket::core
{

inline constexpr std::string_view g_kScratchSuffix{ "-krb5" };
inline constexpr std::string_view g_kScratchCacheName{ "ccache" };

struct ValidCredentials final
{
    std::unique_ptr<krbticket::gss::IGssCredential> creds;
    std::optional<std::uint32_t> lifetimeSeconds;
};

struct ExpiredCredentials final
{
};

struct UnusableCredentials final
{
    AcquireError reason{ AcquireError::ProtocolError };
};

using AttemptOutcome = std::variant<ValidCredentials, ExpiredCredentials, UnusableCredentials>;

struct AcquireRequest final
{
    std::string principal;
    krbticket::gss::CredUsage usage{ krbticket::gss::CredUsage::Initiate };
    krbticket::gss::CredentialStore store;
};

// Acquires, validates and persists the TGT of one principal. Not safe for concurrent use;
// independent sessions share no state.
class TicketSession final
{
public:
    TicketSession(krbticket::gss::IGssApi& gss, SessionConfig config,
                  LifetimeTracker::NowProvider nowProvider = LifetimeTracker::Clock::now);

    TicketSession(const TicketSession&) = delete;
    TicketSession& operator=(const TicketSession&) = delete;
    TicketSession(TicketSession&&) noexcept = default;
    TicketSession& operator=(TicketSession&&) = delete;
    ~TicketSession() = default;

    // Configuration. Each setter validates first and leaves the session untouched on error.
    void setPrincipal(std::string_view raw);
    void setKeytab(const std::filesystem::path& keytab);
    void setCcache(std::optional<std::string> ccache);

    [[nodiscard]] const SessionConfig& config() const noexcept
    {
        return m_config;
    }
    [[nodiscard]] const LifetimeTracker& lifetime() const noexcept
    {
        return m_lifetime;
    }

    // Overrides the directory the key-table fallback creates its scratch cache under
    // (default: the OS temp directory).
    void setScratchRoot(std::filesystem::path root);

    // Single acquisition attempt normalized to Valid | Expired | Unusable. Never throws.
    [[nodiscard]] AttemptOutcome attemptAcquire(const AcquireRequest& request) noexcept;

    // Checks the credentials already present in the configured store. Persists nothing.
    [[nodiscard]] AcquireResult<std::monostate>
    tryAcquireFromDefault(krbticket::gss::CredUsage usage = krbticket::gss::CredUsage::Initiate) noexcept;

    // Records `keytab` (throws KeytabNotFoundError before any acquisition when it is missing), then
    // acquires through the permanent store. When that fails the credentials are materialized in a
    // private scratch cache and promoted into the configured cache; the scratch directory is removed
    // on every exit path.
    [[nodiscard]] AcquireResult<std::monostate>
    tryAcquireWithKeyTab(const std::filesystem::path& keytab,
                         krbticket::gss::CredUsage usage = krbticket::gss::CredUsage::Initiate,
                         bool setDefault = true, bool overwrite = true);

    // SECURITY ADVISORY: takes a plaintext password. Prefer key-table acquisition in production.
    // The password is neither copied nor logged, and no fallback exists for this path.
    [[nodiscard]] AcquireResult<std::monostate>
    tryAcquireWithPassword(const krbticket::security::SecureString& password,
                           krbticket::gss::CredUsage usage = krbticket::gss::CredUsage::Initiate,
                           bool setDefault = true, bool overwrite = true) noexcept;

    [[nodiscard]] bool acquireFromDefault(krbticket::gss::CredUsage usage = krbticket::gss::CredUsage::Initiate) noexcept;

    [[nodiscard]] bool acquireWithKeyTab(const std::filesystem::path& keytab,
                                         krbticket::gss::CredUsage usage = krbticket::gss::CredUsage::Initiate,
                                         bool setDefault = true, bool overwrite = true);

    [[nodiscard]] bool acquireWithPassword(const krbticket::security::SecureString& password,
                                           krbticket::gss::CredUsage usage = krbticket::gss::CredUsage::Initiate,
                                           bool setDefault = true, bool overwrite = true) noexcept;

    // Live check against the default store: true when the credentials are expired, missing or invalid.
    // Other failures count as "not expired".
    [[nodiscard]] bool isExpired() noexcept;

private:
    // Inquires freshly acquired credentials and records their lifetime.
    [[nodiscard]] AttemptOutcome inspect(std::unique_ptr<krbticket::gss::IGssCredential> creds) noexcept;
    [[nodiscard]] AcquireRequest requestFor(krbticket::gss::CredUsage usage, krbticket::gss::CredentialStore store) const;

    krbticket::gss::IGssApi* m_gss{ nullptr };
    SessionConfig m_config;
    LifetimeTracker m_lifetime;
    CredentialCommitter m_committer{};
    std::filesystem::path m_scratchRoot{};
};

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_TICKETSESSION_HPP
