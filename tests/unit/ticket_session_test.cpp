#include "krbticket/core/AcquireError.hpp"
#include "krbticket/core/KrbErrors.hpp"
#include "krbticket/core/SessionConfig.hpp"
#include "krbticket/core/TicketSession.hpp"
#include "krbticket/security/SecureString.hpp"
#include "test_utils/FakeGssApi.hpp"
#include "test_utils/LogCapture.hpp"
#include "test_utils/TestUtils.hpp"
#include <chrono>
#include <filesystem>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <variant>

namespace
{

namespace fs = std::filesystem;

using krbticket::core::AcquireError;
using krbticket::core::SessionConfig;
using krbticket::core::TicketSession;
using krbticket::gss::CredUsage;
using krbticket::gss::GssErrorKind;
using krbticket::test_utils::FakeGssApi;

constexpr std::string_view g_kPrincipal{ "svc-batch@EXAMPLE.COM" };
constexpr std::string_view g_kCache{ "MEMORY:cc_batch" };

class TicketSessionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_keytab = m_dir.path() / "batch.keytab";
        krbticket::test_utils::writeFile(m_keytab, "keytab");
        m_scratchRoot = m_dir.path() / "scratch";
        fs::create_directory(m_scratchRoot);
    }

    [[nodiscard]] TicketSession makeSession(std::optional<std::string> ccache = std::string{ g_kCache })
    {
        SessionConfig config{ krbticket::core::Principal::parse(m_gss, g_kPrincipal), std::move(ccache) };
        TicketSession session{ m_gss, std::move(config) };
        session.setScratchRoot(m_scratchRoot);
        return session;
    }

    [[nodiscard]] bool scratchRootIsEmpty() const
    {
        return fs::is_empty(m_scratchRoot);
    }

    krbticket::security::ScratchDirectory m_dir{ krbticket::test_utils::makeTestDir() }; // NOLINT
    FakeGssApi m_gss{};                                                                 // NOLINT
    fs::path m_keytab;                                                                  // NOLINT
    fs::path m_scratchRoot;                                                             // NOLINT
};

AcquireError errorOf(const krbticket::core::AcquireResult<std::monostate>& res)
{
    EXPECT_TRUE(std::holds_alternative<AcquireError>(res));
    return std::get<AcquireError>(res);
}

} // namespace

TEST_F(TicketSessionTest, FreshSessionHasNoDefaultCredentials)
{
    auto session{ makeSession() };

    EXPECT_FALSE(session.acquireFromDefault());
    EXPECT_EQ(errorOf(session.tryAcquireFromDefault()), AcquireError::MissingCredentials);
    EXPECT_FALSE(session.lifetime().expiry().has_value());
    EXPECT_EQ(m_gss.cacheCount(), 0U);
}

TEST_F(TicketSessionTest, AcquireFromDefaultReadsConfiguredCacheAndRecordsLifetime)
{
    m_gss.putTicket(std::string{ g_kCache }, std::string{ g_kPrincipal }, 600U);
    auto session{ makeSession() };

    const auto before{ std::chrono::system_clock::now() };
    EXPECT_TRUE(session.acquireFromDefault());

    ASSERT_EQ(m_gss.acquireCalls().size(), 1U);
    EXPECT_EQ(m_gss.acquireCalls()[0].store.at("ccache"), g_kCache);
    EXPECT_FALSE(m_gss.acquireCalls()[0].store.contains("client_keytab"));
    EXPECT_TRUE(m_gss.storeCalls().empty());

    const auto expiry{ session.lifetime().expiry() };
    ASSERT_TRUE(expiry.has_value());
    EXPECT_NEAR(std::chrono::duration_cast<std::chrono::seconds>(*expiry - before).count(), 600, 3);
}

TEST_F(TicketSessionTest, AcquireFromDefaultWithoutCacheRefUsesEmptyStore)
{
    m_gss.putTicket("", std::string{ g_kPrincipal });
    auto session{ makeSession(std::nullopt) };

    EXPECT_TRUE(session.acquireFromDefault(CredUsage::Both));
    ASSERT_EQ(m_gss.acquireCalls().size(), 1U);
    EXPECT_TRUE(m_gss.acquireCalls()[0].store.empty());
    EXPECT_EQ(m_gss.acquireCalls()[0].usage, CredUsage::Both);
}

TEST_F(TicketSessionTest, KeytabDirectAcquisitionSucceedsWithoutPersisting)
{
    m_gss.addKeytab(m_keytab, std::string{ g_kPrincipal });
    auto session{ makeSession() };

    EXPECT_TRUE(session.acquireWithKeyTab(m_keytab));

    ASSERT_EQ(m_gss.acquireCalls().size(), 1U);
    EXPECT_EQ(m_gss.acquireCalls()[0].store.at("client_keytab"), m_keytab.string());
    EXPECT_EQ(m_gss.acquireCalls()[0].store.at("ccache"), g_kCache);
    EXPECT_TRUE(m_gss.storeCalls().empty());
    EXPECT_TRUE(scratchRootIsEmpty());

    // The permanent cache now answers default lookups.
    EXPECT_TRUE(session.acquireFromDefault());
    EXPECT_FALSE(session.isExpired());
}

TEST_F(TicketSessionTest, KeytabFallsBackToScratchCacheAndPromotesIntoRealCache)
{
    m_gss.addKeytab(m_keytab, std::string{ g_kPrincipal });
    m_gss.setKeytabNeedsFileCache(true);
    auto session{ makeSession(std::string{ "KEYRING:persistent:1000" }) };

    EXPECT_TRUE(session.acquireWithKeyTab(m_keytab, CredUsage::Initiate, true, true));

    ASSERT_EQ(m_gss.acquireCalls().size(), 2U);
    EXPECT_EQ(m_gss.acquireCalls()[0].store.at("ccache"), "KEYRING:persistent:1000");

    const auto& retry{ m_gss.acquireCalls()[1] };
    EXPECT_EQ(retry.store.at("client_keytab"), m_keytab.string());
    const std::string scratchRef{ retry.store.at("ccache") };
    ASSERT_TRUE(scratchRef.starts_with("FILE:"));
    const fs::path scratchFile{ scratchRef.substr(5) };
    EXPECT_EQ(scratchFile.filename(), "ccache");
    EXPECT_EQ(scratchFile.parent_path().parent_path(), m_scratchRoot);
    EXPECT_TRUE(scratchFile.parent_path().filename().string().ends_with("-krb5"));

    // Scratch directory (and the cache file written into it) is gone after the call.
    EXPECT_FALSE(fs::exists(scratchFile.parent_path()));
    EXPECT_TRUE(scratchRootIsEmpty());

    ASSERT_EQ(m_gss.storeCalls().size(), 1U);
    const auto& stored{ m_gss.storeCalls()[0] };
    EXPECT_EQ(stored.store.size(), 1U);
    EXPECT_EQ(stored.store.at("ccache"), "KEYRING:persistent:1000");
    EXPECT_TRUE(stored.setDefault);
    EXPECT_TRUE(stored.overwrite);
    EXPECT_TRUE(m_gss.ticketIn("KEYRING:persistent:1000").has_value());

    // Permanent config is not disturbed by the scratch override.
    ASSERT_TRUE(session.config().ccache().has_value());
    EXPECT_EQ(*session.config().ccache(), "KEYRING:persistent:1000");
    EXPECT_EQ(m_gss.liveCredentials(), 0);
}

TEST_F(TicketSessionTest, KeytabFallbackFailureStillRemovesScratchDirectory)
{
    // Key table is unknown to the KDC: both the direct and the scratch attempt fail.
    auto session{ makeSession() };

    const auto res{ session.tryAcquireWithKeyTab(m_keytab) };
    EXPECT_EQ(errorOf(res), AcquireError::MissingCredentials);

    ASSERT_EQ(m_gss.acquireCalls().size(), 2U);
    const fs::path scratchFile{ m_gss.acquireCalls()[1].store.at("ccache").substr(5) };
    EXPECT_FALSE(fs::exists(scratchFile.parent_path()));
    EXPECT_TRUE(scratchRootIsEmpty());

    // The committer ran without credentials, so nothing reached the store.
    EXPECT_TRUE(m_gss.storeCalls().empty());
    EXPECT_FALSE(m_gss.ticketIn(std::string{ g_kCache }).has_value());
    EXPECT_FALSE(session.lifetime().expiry().has_value());
}

TEST_F(TicketSessionTest, KeytabFallbackFailureIsStillHandedToCommitter)
{
    krbticket::test_utils::ScopedLogCapture log{};
    auto session{ makeSession() };

    EXPECT_EQ(errorOf(session.tryAcquireWithKeyTab(m_keytab)), AcquireError::MissingCredentials);

    // The commit targets the configured cache only and fails cleanly for lack of credentials.
    EXPECT_THAT(log.text(), ::testing::HasSubstr("error krb store failed, store: ccache=MEMORY:cc_batch: "
                                                 "no credentials were acquired"));
    EXPECT_TRUE(m_gss.storeCalls().empty());
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(TicketSessionTest, KeytabFallbackStoreFailureReportsStoreError)
{
    m_gss.addKeytab(m_keytab, std::string{ g_kPrincipal });
    m_gss.failNextAcquire(GssErrorKind::Failure);
    m_gss.failStore(GssErrorKind::Unavailable);
    auto session{ makeSession() };

    EXPECT_EQ(errorOf(session.tryAcquireWithKeyTab(m_keytab)), AcquireError::StoreUnavailable);
    EXPECT_EQ(m_gss.storeCalls().size(), 1U);
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(TicketSessionTest, ExpiredCacheTriggersKeytabFallback)
{
    m_gss.addKeytab(m_keytab, std::string{ g_kPrincipal });
    m_gss.putTicket(std::string{ g_kCache }, std::string{ g_kPrincipal }, 0U);
    auto session{ makeSession() };

    EXPECT_TRUE(session.isExpired());
    EXPECT_TRUE(session.acquireWithKeyTab(m_keytab));

    EXPECT_EQ(m_gss.acquireCalls().size(), 3U);
    ASSERT_TRUE(m_gss.ticketIn(std::string{ g_kCache }).has_value());
    EXPECT_EQ(m_gss.ticketIn(std::string{ g_kCache })->lifetime, FakeGssApi::kTicketLifetime);
    EXPECT_FALSE(session.isExpired());
}

TEST_F(TicketSessionTest, MissingKeytabFailsBeforeAnyAcquisition)
{
    auto session{ makeSession() };
    session.setKeytab(m_keytab);

    EXPECT_THROW((void)session.acquireWithKeyTab(m_dir.path() / "missing.keytab"),
                 krbticket::core::KeytabNotFoundError);

    EXPECT_TRUE(m_gss.acquireCalls().empty());
    ASSERT_TRUE(session.config().keytab().has_value());
    EXPECT_EQ(*session.config().keytab(), m_keytab);
}

TEST_F(TicketSessionTest, KeytabAcquisitionIsIdempotent)
{
    m_gss.addKeytab(m_keytab, std::string{ g_kPrincipal });
    m_gss.setKeytabNeedsFileCache(true);
    auto session{ makeSession(std::string{ "KCM:1000" }) };

    EXPECT_TRUE(session.acquireWithKeyTab(m_keytab));
    EXPECT_TRUE(session.acquireWithKeyTab(m_keytab));

    // Second call finds the promoted ticket directly and stores nothing new.
    EXPECT_EQ(m_gss.acquireCalls().size(), 3U);
    EXPECT_EQ(m_gss.storeCalls().size(), 1U);
    EXPECT_TRUE(m_gss.ticketIn("KCM:1000").has_value());
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(TicketSessionTest, PasswordAcquisitionStoresIntoConfiguredCache)
{
    m_gss.addPassword(std::string{ g_kPrincipal }, "correct horse");
    auto session{ makeSession() };

    const auto password{ krbticket::security::secureStringFrom("correct horse") };
    EXPECT_TRUE(session.acquireWithPassword(password, CredUsage::Initiate, false, true));

    ASSERT_EQ(m_gss.storeCalls().size(), 1U);
    EXPECT_EQ(m_gss.storeCalls()[0].store.at("ccache"), g_kCache);
    EXPECT_FALSE(m_gss.storeCalls()[0].setDefault);
    EXPECT_TRUE(m_gss.ticketIn(std::string{ g_kCache }).has_value());
    EXPECT_TRUE(session.lifetime().expiry().has_value());
    EXPECT_EQ(m_gss.liveCredentials(), 0);
}

TEST_F(TicketSessionTest, WrongPasswordReturnsFalseAndWritesNothing)
{
    m_gss.addPassword(std::string{ g_kPrincipal }, "correct horse");
    auto session{ makeSession() };

    const auto password{ krbticket::security::secureStringFrom("battery staple") };
    EXPECT_FALSE(session.acquireWithPassword(password));
    EXPECT_EQ(errorOf(session.tryAcquireWithPassword(password)), AcquireError::ProtocolError);

    EXPECT_EQ(m_gss.passwordCalls(), 2U);
    EXPECT_TRUE(m_gss.storeCalls().empty());
    EXPECT_EQ(m_gss.cacheCount(), 0U);
    EXPECT_TRUE(m_gss.acquireCalls().empty());
}

TEST_F(TicketSessionTest, PasswordCredentialsFailingInquiryAreNotStored)
{
    m_gss.addPassword(std::string{ g_kPrincipal }, "pw");
    m_gss.failInquire(GssErrorKind::InvalidCredentials);
    auto session{ makeSession() };

    EXPECT_EQ(errorOf(session.tryAcquireWithPassword(krbticket::security::secureStringFrom("pw"))),
              AcquireError::InvalidCredentials);
    EXPECT_TRUE(m_gss.storeCalls().empty());
}

TEST_F(TicketSessionTest, AttemptAcquireClassifiesCollaboratorErrors)
{
    auto session{ makeSession() };
    const krbticket::core::AcquireRequest request{ std::string{ g_kPrincipal }, CredUsage::Initiate, {} };

    m_gss.failNextAcquire(GssErrorKind::Expired);
    EXPECT_TRUE(std::holds_alternative<krbticket::core::ExpiredCredentials>(session.attemptAcquire(request)));

    m_gss.failNextAcquire(GssErrorKind::InvalidCredentials);
    auto invalid{ session.attemptAcquire(request) };
    ASSERT_TRUE(std::holds_alternative<krbticket::core::UnusableCredentials>(invalid));
    EXPECT_EQ(std::get<krbticket::core::UnusableCredentials>(invalid).reason, AcquireError::InvalidCredentials);

    m_gss.failNextAcquire(GssErrorKind::Unavailable);
    auto unavailable{ session.attemptAcquire(request) };
    ASSERT_TRUE(std::holds_alternative<krbticket::core::UnusableCredentials>(unavailable));
    EXPECT_EQ(std::get<krbticket::core::UnusableCredentials>(unavailable).reason, AcquireError::ProtocolError);
}

TEST_F(TicketSessionTest, AttemptAcquireClearsLifetimeOnFailure)
{
    m_gss.putTicket(std::string{ g_kCache }, std::string{ g_kPrincipal });
    auto session{ makeSession() };
    ASSERT_TRUE(session.acquireFromDefault());
    ASSERT_TRUE(session.lifetime().expiry().has_value());

    m_gss.failNextAcquire(GssErrorKind::Expired);
    EXPECT_FALSE(session.acquireFromDefault());
    EXPECT_FALSE(session.lifetime().expiry().has_value());
}

TEST_F(TicketSessionTest, IsExpiredTreatsOnlyExpiredMissingInvalidAsExpired)
{
    auto session{ makeSession() };

    EXPECT_TRUE(session.isExpired());

    m_gss.failNextAcquire(GssErrorKind::InvalidCredentials);
    EXPECT_TRUE(session.isExpired());

    m_gss.failNextAcquire(GssErrorKind::Failure);
    EXPECT_FALSE(session.isExpired());

    m_gss.failNextAcquire(GssErrorKind::Unavailable);
    EXPECT_FALSE(session.isExpired());

    m_gss.putTicket(std::string{ g_kCache }, std::string{ g_kPrincipal });
    EXPECT_FALSE(session.isExpired());
}

TEST_F(TicketSessionTest, SettersValidateAndKeepPreviousValueOnError)
{
    auto session{ makeSession() };

    EXPECT_THROW(session.setPrincipal("bad@REALM@AGAIN"), krbticket::core::InvalidPrincipalError);
    EXPECT_EQ(session.config().principal().name(), g_kPrincipal);

    session.setPrincipal("alice");
    EXPECT_EQ(session.config().principal().name(), "alice@EXAMPLE.COM");

    session.setCcache(std::nullopt);
    EXPECT_FALSE(session.config().ccache().has_value());
}

TEST_F(TicketSessionTest, DefaultLookupUsesCanonicalPrincipalAndCurrentKeytab)
{
    auto session{ makeSession() };
    session.setPrincipal("alice");
    session.setKeytab(m_keytab);

    EXPECT_FALSE(session.acquireFromDefault());
    ASSERT_EQ(m_gss.acquireCalls().size(), 1U);
    EXPECT_EQ(m_gss.acquireCalls()[0].principal, "alice@EXAMPLE.COM");
    EXPECT_THAT(m_gss.acquireCalls()[0].store,
                ::testing::ElementsAre(::testing::Pair("ccache", std::string{ g_kCache }),
                                       ::testing::Pair("client_keytab", m_keytab.string())));
}
