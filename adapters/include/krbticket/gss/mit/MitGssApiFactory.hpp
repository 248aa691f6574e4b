#ifndef INCLUDE_KRBTICKET_GSS_MIT_MITGSSAPIFACTORY_HPP
#define INCLUDE_KRBTICKET_GSS_MIT_MITGSSAPIFACTORY_HPP

#include "krbticket/gss/IGssApi.hpp"
#include <memory>

namespace krbticket::gss::mit
{

[[nodiscard]] std::unique_ptr<krbticket::gss::IGssApi> makeMitGssApi();

} // namespace krbticket::gss::mit

#endif // INCLUDE_KRBTICKET_GSS_MIT_MITGSSAPIFACTORY_HPP
