#include "krbticket/core/AcquireError.hpp"

namespace krbticket::core
{

std::string_view toString(AcquireError error) noexcept
{
    switch (error)
    {
    case AcquireError::Expired:
        return "credentials expired";
    case AcquireError::MissingCredentials:
        return "credentials missing";
    case AcquireError::InvalidCredentials:
        return "credentials invalid";
    case AcquireError::ProtocolError:
        return "protocol error";
    case AcquireError::NoCredentials:
        return "no credentials to store";
    case AcquireError::StoreFailed:
        return "store failed";
    case AcquireError::StoreUnavailable:
        return "store unavailable";
    case AcquireError::DuplicateElement:
        return "duplicate credential element";
    case AcquireError::ScratchUnavailable:
        return "scratch cache unavailable";
    }
    return "unknown";
}

} // namespace krbticket::core
