#include "krbticket/security/MemoryWiper.hpp"

#if defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace krbticket::security
{
void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
    ::explicit_bzero(bytes.data(), bytes.size());
}
} // namespace krbticket::security
