#ifndef INCLUDE_KRBTICKET_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_KRBTICKET_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>

namespace krbticket::security
{

// Zeroes `bytes` in a way the optimizer cannot elide. Used by ZeroAllocator on every release.
void secureWipe(std::span<std::byte> bytes) noexcept;

} // namespace krbticket::security

#endif // INCLUDE_KRBTICKET_SECURITY_MEMORYWIPER_HPP
