#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <functional>
#include <cstdint>

namespace coursedao {
namespace core {

enum class NotificationType : uint8_t {
    PROPOSAL_CREATED,
    PROPOSAL_VOTED,
    PROPOSAL_EXECUTED,
    ROLE_GRANTED,
    COURSE_CREATED,
    COURSE_REMOVED,
    APPLICATION_SUBMITTED,
    TEACHER_VOTE_RECORDED,
    ENROLLMENT_DECIDED,
    ENROLLMENT_CONFIRMED,
    COURSE_COMPLETED,
    RATING_GIVEN,
    BONUS_DISTRIBUTED,
    TREASURY_PAYOUT,
    PROPOSAL_DURATION_CHANGED,
    FUNDS_RESCUED
};

const char* notificationTypeToString(NotificationType type);

struct Notification {
    NotificationType type;
    uint64_t sequence = 0;
    uint64_t timestamp = 0;
    std::map<std::string, std::string> fields;

    std::string field(const std::string& key) const;
    std::string toString() const;
};

using NotificationHandler = std::function<void(const Notification&)>;

// Synchronous fan-out to observers, in publish order. The engine keeps no
// history of its own; indexers rebuild it from these.
class NotificationBus {
public:
    uint64_t subscribe(NotificationType type, NotificationHandler handler);
    uint64_t subscribeAll(NotificationHandler handler);
    void unsubscribe(uint64_t id);

    void publish(NotificationType type, uint64_t timestamp, std::map<std::string, std::string> fields);

    uint64_t publishedCount() const;
    size_t subscriptionCount() const;

private:
    struct Subscription {
        uint64_t id;
        bool all;
        NotificationType type;
        NotificationHandler handler;
    };

    std::vector<Subscription> subscriptions_;
    uint64_t nextSubscriptionId_ = 1;
    uint64_t sequence_ = 0;
    mutable std::mutex mtx_;
};

}
}
