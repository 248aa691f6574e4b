#ifndef INCLUDE_KRBTICKET_SECURITY_SECURESTRING_HPP
#define INCLUDE_KRBTICKET_SECURITY_SECURESTRING_HPP

#include "krbticket/security/ZeroAllocator.hpp"
#include <string_view>
#include <vector>

namespace krbticket::security
{
// Holds passwords handed to the GSS-API collaborator. Storage is wiped on every release.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

} // namespace krbticket::security

#endif // INCLUDE_KRBTICKET_SECURITY_SECURESTRING_HPP
