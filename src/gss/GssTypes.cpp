#include "krbticket/gss/IGssApi.hpp"

namespace krbticket::gss
{

std::string_view toString(CredUsage usage) noexcept
{
    switch (usage)
    {
    case CredUsage::Initiate:
        return "initiate";
    case CredUsage::Accept:
        return "accept";
    case CredUsage::Both:
        return "both";
    }
    return "unknown";
}

std::string_view toString(GssErrorKind kind) noexcept
{
    switch (kind)
    {
    case GssErrorKind::BadName:
        return "bad-name";
    case GssErrorKind::Expired:
        return "expired";
    case GssErrorKind::MissingCredentials:
        return "missing-credentials";
    case GssErrorKind::InvalidCredentials:
        return "invalid-credentials";
    case GssErrorKind::Unavailable:
        return "unavailable";
    case GssErrorKind::DuplicateElement:
        return "duplicate-element";
    case GssErrorKind::Failure:
        return "failure";
    }
    return "unknown";
}

} // namespace krbticket::gss
