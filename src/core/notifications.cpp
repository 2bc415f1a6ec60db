#include "core/notifications.h"
#include "utils/logger.h"
#include <algorithm>
#include <sstream>
#include <exception>

namespace coursedao {
namespace core {

const char* notificationTypeToString(NotificationType type) {
    switch (type) {
        case NotificationType::PROPOSAL_CREATED: return "ProposalCreated";
        case NotificationType::PROPOSAL_VOTED: return "ProposalVoted";
        case NotificationType::PROPOSAL_EXECUTED: return "ProposalExecuted";
        case NotificationType::ROLE_GRANTED: return "RoleGranted";
        case NotificationType::COURSE_CREATED: return "CourseCreated";
        case NotificationType::COURSE_REMOVED: return "CourseRemoved";
        case NotificationType::APPLICATION_SUBMITTED: return "ApplicationSubmitted";
        case NotificationType::TEACHER_VOTE_RECORDED: return "TeacherVoteRecorded";
        case NotificationType::ENROLLMENT_DECIDED: return "EnrollmentDecided";
        case NotificationType::ENROLLMENT_CONFIRMED: return "EnrollmentConfirmed";
        case NotificationType::COURSE_COMPLETED: return "CourseCompleted";
        case NotificationType::RATING_GIVEN: return "RatingGiven";
        case NotificationType::BONUS_DISTRIBUTED: return "BonusDistributed";
        case NotificationType::TREASURY_PAYOUT: return "TreasuryPayout";
        case NotificationType::PROPOSAL_DURATION_CHANGED: return "ProposalDurationChanged";
        case NotificationType::FUNDS_RESCUED: return "FundsRescued";
        default: return "Unknown";
    }
}

std::string Notification::field(const std::string& key) const {
    auto it = fields.find(key);
    return it != fields.end() ? it->second : std::string();
}

std::string Notification::toString() const {
    std::ostringstream oss;
    oss << "#" << sequence << " " << notificationTypeToString(type);
    for (const auto& [key, value] : fields) {
        oss << " " << key << "=" << value;
    }
    return oss.str();
}

uint64_t NotificationBus::subscribe(NotificationType type, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mtx_);
    Subscription sub{nextSubscriptionId_++, false, type, std::move(handler)};
    subscriptions_.push_back(std::move(sub));
    return subscriptions_.back().id;
}

uint64_t NotificationBus::subscribeAll(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mtx_);
    Subscription sub{nextSubscriptionId_++, true, NotificationType::PROPOSAL_CREATED, std::move(handler)};
    subscriptions_.push_back(std::move(sub));
    return subscriptions_.back().id;
}

void NotificationBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    subscriptions_.erase(
        std::remove_if(subscriptions_.begin(), subscriptions_.end(),
            [id](const Subscription& s) { return s.id == id; }),
        subscriptions_.end());
}

void NotificationBus::publish(NotificationType type, uint64_t timestamp,
                              std::map<std::string, std::string> fields) {
    Notification n;
    std::vector<NotificationHandler> targets;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        n.type = type;
        n.sequence = ++sequence_;
        n.timestamp = timestamp;
        n.fields = std::move(fields);
        for (const auto& sub : subscriptions_) {
            if (sub.all || sub.type == type) targets.push_back(sub.handler);
        }
    }

    LOG_DEBUG("notify " + n.toString());

    // State is already committed; a failing observer cannot undo it.
    for (const auto& handler : targets) {
        try {
            handler(n);
        } catch (const std::exception& e) {
            LOG_CAT(WARN, "notify", std::string("observer failed on ") +
                    notificationTypeToString(type) + ": " + e.what());
        } catch (...) {
            LOG_CAT(WARN, "notify", std::string("observer failed on ") +
                    notificationTypeToString(type) + ": unknown exception");
        }
    }
}

uint64_t NotificationBus::publishedCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sequence_;
}

size_t NotificationBus::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return subscriptions_.size();
}

}
}
