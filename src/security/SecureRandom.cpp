#include "krbticket/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <vector>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace krbticket::security
{
bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::size_t filled{ 0U };
    while (filled < out.size())
    {
        const ssize_t got{ ::getrandom(out.data() + filled, out.size() - filled, 0) };
        if (got < 0 && errno == EINTR)
        {
            continue;
        }
        if (got <= 0)
        {
            return false;
        }
        filled += static_cast<std::size_t>(got);
    }
    return true;
}

std::string secureRandomHexToken(std::size_t bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::vector<std::uint8_t> rnd(bytes);
    if (!secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        return {};
    }

    std::string out{};
    out.reserve(bytes * 2U);
    for (const std::uint8_t b : rnd)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

} // namespace krbticket::security
