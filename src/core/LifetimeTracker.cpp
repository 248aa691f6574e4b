#include "krbticket/core/LifetimeTracker.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <utility>

namespace krbticket::core
{

LifetimeTracker::LifetimeTracker(NowProvider nowProvider) : m_now(std::move(nowProvider)), m_expiry{}
{
}

void LifetimeTracker::recordLifetime(std::optional<std::int64_t> seconds)
{
    if (!seconds.has_value() || *seconds < 0)
    {
        m_expiry.reset();
        return;
    }

    const auto now{ std::chrono::time_point_cast<std::chrono::seconds>(m_now()) };
    m_expiry = now + std::chrono::seconds{ *seconds };
}

void LifetimeTracker::clear() noexcept
{
    m_expiry.reset();
}

std::optional<LifetimeTracker::TimePoint> LifetimeTracker::expiry() const noexcept
{
    return m_expiry;
}

std::optional<std::string> LifetimeTracker::expiryString() const
{
    if (!m_expiry.has_value())
    {
        return std::nullopt;
    }
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(Clock::to_time_t(*m_expiry)));
}

} // namespace krbticket::core
