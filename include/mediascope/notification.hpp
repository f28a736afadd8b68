// ==============================================================================
// mediascope/notification.hpp - Временное уведомление в строке статуса
// ==============================================================================

#ifndef MEDIASCOPE_NOTIFICATION_HPP
#define MEDIASCOPE_NOTIFICATION_HPP

#include <chrono>
#include <string>

namespace mediascope {

/// Время жизни уведомления по умолчанию
constexpr std::chrono::milliseconds DEFAULT_NOTIFICATION_LIFETIME{3000};

/// Сообщение + момент создания; истекает через фиксированное время
class Notification {
public:
    using Clock = std::chrono::steady_clock;

    Notification(std::string message, Clock::time_point created,
                 std::chrono::milliseconds lifetime = DEFAULT_NOTIFICATION_LIFETIME);

    const std::string& message() const { return message_; }
    Clock::time_point created() const { return created_; }
    std::chrono::milliseconds lifetime() const { return lifetime_; }

    /// Истекло, если с момента создания прошло не меньше lifetime
    bool is_expired(Clock::time_point now) const;

private:
    std::string message_;
    Clock::time_point created_;
    std::chrono::milliseconds lifetime_;
};

}  // namespace mediascope

#endif  // MEDIASCOPE_NOTIFICATION_HPP
