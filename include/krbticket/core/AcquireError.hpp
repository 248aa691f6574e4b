#ifndef INCLUDE_KRBTICKET_CORE_ACQUIREERROR_HPP
#define INCLUDE_KRBTICKET_CORE_ACQUIREERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace krbticket::core
{

enum class AcquireError : std::uint8_t
{
    Expired,
    MissingCredentials,
    InvalidCredentials,
    ProtocolError,
    NoCredentials,
    StoreFailed,
    StoreUnavailable,
    DuplicateElement,
    ScratchUnavailable,
};

template <class T> using AcquireResult = std::variant<T, AcquireError>;

[[nodiscard]] std::string_view toString(AcquireError error) noexcept;

template <class T> [[nodiscard]] bool succeeded(const AcquireResult<T>& result) noexcept
{
    return std::holds_alternative<T>(result);
}

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_ACQUIREERROR_HPP
