#ifndef INCLUDE_KRBTICKET_CORE_LIFETIMETRACKER_HPP
#define INCLUDE_KRBTICKET_CORE_LIFETIMETRACKER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace krbticket::core
{

class LifetimeTracker final
{
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using NowProvider = std::function<TimePoint()>;

    explicit LifetimeTracker(NowProvider nowProvider = Clock::now);

    // Non-negative seconds set the expiry to now + seconds; anything else clears it.
    void recordLifetime(std::optional<std::int64_t> seconds);
    void clear() noexcept;

    [[nodiscard]] std::optional<TimePoint> expiry() const noexcept;

    // Local time, "%Y-%m-%d %H:%M:%S".
    [[nodiscard]] std::optional<std::string> expiryString() const;

private:
    NowProvider m_now;
    std::optional<TimePoint> m_expiry;
};

} // namespace krbticket::core

#endif // INCLUDE_KRBTICKET_CORE_LIFETIMETRACKER_HPP
