#ifndef INCLUDE_KRBTICKET_CORE_KRBERRORS_HPP
#define INCLUDE_KRBTICKET_CORE_KRBERRORS_HPP

#include <stdexcept>

namespace krbticket::core
{

class InvalidPrincipalError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class KeytabNotFoundError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_KRBERRORS_HPP
