// ==============================================================================
// notification.cpp - Временное уведомление
// ==============================================================================

#include <mediascope/notification.hpp>
#include <utility>

namespace mediascope {

Notification::Notification(std::string message, Clock::time_point created,
                           std::chrono::milliseconds lifetime)
    : message_(std::move(message)), created_(created), lifetime_(lifetime) {}

bool Notification::is_expired(Clock::time_point now) const {
    return now - created_ >= lifetime_;
}

}  // namespace mediascope
