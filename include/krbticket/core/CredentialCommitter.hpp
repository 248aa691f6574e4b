#ifndef INCLUDE_KRBTICKET_CORE_CREDENTIALCOMMITTER_HPP
#define INCLUDE_KRBTICKET_CORE_CREDENTIALCOMMITTER_HPP

#include "krbticket/core/AcquireError.hpp"
#include "krbticket/gss/IGssApi.hpp"
#include <variant>

namespace krbticket::core
{

class CredentialCommitter final
{
public:
    // Persists `creds` into `store` (empty store = system default). A null `creds` fails with
    // NoCredentials without touching the store. Never throws past this boundary.
    [[nodiscard]] AcquireResult<std::monostate> commit(const krbticket::gss::IGssCredential* creds,
                                                       const krbticket::gss::CredentialStore& store,
                                                       krbticket::gss::CredUsage usage, bool setDefault,
                                                       bool overwrite) const noexcept;
};

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_CREDENTIALCOMMITTER_HPP
