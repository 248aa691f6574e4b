#ifndef INCLUDE_KRBTICKET_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_KRBTICKET_SECURITY_ZEROALLOCATOR_HPP

#include "krbticket/security/MemoryWiper.hpp"
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace krbticket::security
{
// Allocator for buffers holding secrets (passwords handed to the GSS-API collaborator).
// Every block is wiped before it returns to the heap, including the ones a growing
// container abandons on reallocation.
template <class T> class ZeroAllocator
{
public:
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

    // Throws std::bad_array_new_length when n * sizeof(T) overflows.
    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        return std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        std::allocator<T>{}.deallocate(p, n);
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& a, [[maybe_unused]] const ZeroAllocator<U>& b) noexcept
{
    return true;
}

} // namespace krbticket::security

#endif // INCLUDE_KRBTICKET_SECURITY_ZEROALLOCATOR_HPP
