#include "krbticket/core/CredentialCommitter.hpp"

#include "krbticket/core/CredentialStore.hpp"
#include "krbticket/core/Logging.hpp"
#include <exception>

namespace krbticket::core
{
namespace
{

[[nodiscard]] AcquireError storeErrorFor(krbticket::gss::GssErrorKind kind) noexcept
{
    switch (kind)
    {
    case krbticket::gss::GssErrorKind::Expired:
        return AcquireError::Expired;
    case krbticket::gss::GssErrorKind::Unavailable:
        return AcquireError::StoreUnavailable;
    case krbticket::gss::GssErrorKind::DuplicateElement:
        return AcquireError::DuplicateElement;
    default:
        return AcquireError::StoreFailed;
    }
}

} // namespace

AcquireResult<std::monostate> CredentialCommitter::commit(const krbticket::gss::IGssCredential* creds,
                                                          const krbticket::gss::CredentialStore& store,
                                                          krbticket::gss::CredUsage usage, bool setDefault,
                                                          bool overwrite) const noexcept
{
    if (creds == nullptr)
    {
        logger()->error("krb store failed, store: {}: no credentials were acquired", describeStore(store));
        return AcquireError::NoCredentials;
    }

    try
    {
        creds->store(store, usage, setDefault, overwrite);
    }
    catch (const krbticket::gss::GssError& e)
    {
        const AcquireError error{ storeErrorFor(e.kind()) };
        logger()->error("krb store failed, store: {}: {} ({})", describeStore(store), toString(error), e.what());
        return error;
    }
    catch (const std::exception& e)
    {
        logger()->error("krb store failed, store: {}: {}", describeStore(store), e.what());
        return AcquireError::StoreFailed;
    }

    logger()->info("stored credentials, store: {}, usage: {}, default: {}, overwrite: {}", describeStore(store),
                   krbticket::gss::toString(usage), setDefault, overwrite);
    return std::monostate{};
}

} // namespace krbticket::core
