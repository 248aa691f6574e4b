#ifndef INCLUDE_KRBTICKET_SECURITY_SECURERANDOM_HPP
#define INCLUDE_KRBTICKET_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace krbticket::security
{

[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Lowercase hex token of `bytes` CSPRNG bytes; empty on RNG failure.
[[nodiscard]] std::string secureRandomHexToken(std::size_t bytes);

} // namespace krbticket::security

#endif // INCLUDE_KRBTICKET_SECURITY_SECURERANDOM_HPP
