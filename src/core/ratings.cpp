#include "core/ratings.h"
#include "utils/logger.h"

namespace coursedao {
namespace core {

RatingLedger::RatingLedger(EngineContext ctx, const CourseCatalog& catalog, const EnrollmentWorkflow& enrollment,
                           Treasury& treasury, uint64_t defaultWeight)
    : ctx_(ctx), catalog_(catalog), enrollment_(enrollment), treasury_(treasury),
      defaultWeight_(defaultWeight) {}

Result<void> RatingLedger::rate(const Account& student, uint64_t courseId, const Account& teacher, uint8_t value) {
    if (!ctx_.roles.hasRole(student, Role::STUDENT)) {
        return makeError(ErrorCode::NOT_STUDENT, "only students rate teachers");
    }
    if (value < MIN_RATING || value > MAX_RATING) {
        return makeError(ErrorCode::INVALID_RATING_VALUE, "rating must be 1..5, got " + std::to_string(value));
    }
    const Course* course = catalog_.findActive(courseId);
    if (!course) {
        return makeError(ErrorCode::NO_SUCH_COURSE, "course " + std::to_string(courseId) + " is not active");
    }
    if (!enrollment_.isEnrolled(courseId, student)) {
        return makeError(ErrorCode::STUDENT_NOT_ENROLLED, "student is not enrolled in course " + std::to_string(courseId));
    }
    if (!course->hasTeacher(teacher)) {
        return makeError(ErrorCode::TEACHER_NOT_IN_COURSE, "teacher is not listed on the course", teacher);
    }

    Key key(courseId, student, teacher);
    TeacherRatingStats& stats = stats_[teacher];
    auto it = ratings_.find(key);
    uint8_t previous = 0;
    if (it == ratings_.end()) {
        ratings_[key] = value;
        stats.sum += value;
        stats.count++;
    } else {
        previous = it->second;
        stats.sum = stats.sum - previous + value;
        it->second = value;
    }

    LOG_CAT(DEBUG, "ratings", utils::Logger::redactAddress(teacher) + " rated " + std::to_string(value) +
            " in course " + std::to_string(courseId) + " (sum " + std::to_string(stats.sum) +
            ", count " + std::to_string(stats.count) + ")");
    ctx_.bus.publish(NotificationType::RATING_GIVEN, ctx_.clock.now(), {
        {"course", std::to_string(courseId)},
        {"student", student},
        {"teacher", teacher},
        {"value", std::to_string(value)},
        {"previous", std::to_string(previous)}
    });
    return {};
}

uint64_t RatingLedger::weightOf(const Account& teacher) const {
    auto it = stats_.find(teacher);
    if (it == stats_.end() || it->second.count == 0) return defaultWeight_;
    return it->second.scaledAverage();
}

Result<BonusResult> RatingLedger::distributeBonus(const Account& caller, uint64_t courseId, Amount amount) {
    if (!ctx_.roles.hasRole(caller, Role::BOARD)) {
        return makeError(ErrorCode::NOT_BOARD, "only board members distribute bonuses");
    }
    const Course* course = catalog_.findActive(courseId);
    if (!course) {
        return makeError(ErrorCode::NO_SUCH_COURSE, "course " + std::to_string(courseId) + " is not active");
    }
    if (amount == 0) {
        return makeError(ErrorCode::ZERO_AMOUNT, "bonus amount is zero");
    }
    if (treasury_.balance() < amount) {
        return makeError(ErrorCode::INSUFFICIENT_TREASURY, "treasury holds " + std::to_string(treasury_.balance()) +
                         ", bonus is " + std::to_string(amount));
    }

    BonusResult result;
    std::vector<uint64_t> weights;
    for (const auto& t : course->teachers) {
        uint64_t w = weightOf(t);
        weights.push_back(w);
        result.totalWeight += w;
    }
    if (result.totalWeight == 0) {
        return makeError(ErrorCode::NO_WEIGHT, "no teacher of course " + std::to_string(courseId) + " carries weight");
    }

    for (size_t i = 0; i < course->teachers.size(); i++) {
        Amount share = mulDivFloor(amount, weights[i], result.totalWeight);
        result.payouts.push_back(Payout{course->teachers[i], share});
        result.distributed += share;
    }
    result.residue = amount - result.distributed;

    auto paid = treasury_.payMany(result.payouts);
    if (paid.failed()) return paid.error();

    LOG_CAT(INFO, "ratings", "bonus of " + std::to_string(amount) + " for course " + std::to_string(courseId) +
            ", distributed " + std::to_string(result.distributed));
    ctx_.bus.publish(NotificationType::BONUS_DISTRIBUTED, ctx_.clock.now(), {
        {"course", std::to_string(courseId)},
        {"by", caller},
        {"amount", std::to_string(amount)},
        {"distributed", std::to_string(result.distributed)},
        {"residue", std::to_string(result.residue)}
    });
    return result;
}

uint8_t RatingLedger::ratingOf(uint64_t courseId, const Account& student, const Account& teacher) const {
    auto it = ratings_.find(Key(courseId, student, teacher));
    return it == ratings_.end() ? 0 : it->second;
}

TeacherRatingStats RatingLedger::statsOf(const Account& teacher) const {
    auto it = stats_.find(teacher);
    return it == stats_.end() ? TeacherRatingStats() : it->second;
}

std::vector<RatingEntry> RatingLedger::entries() const {
    std::vector<RatingEntry> out;
    out.reserve(ratings_.size());
    for (const auto& [key, value] : ratings_) {
        RatingEntry e;
        e.courseId = std::get<0>(key);
        e.student = std::get<1>(key);
        e.teacher = std::get<2>(key);
        e.value = value;
        out.push_back(e);
    }
    return out;
}

Result<void> RatingLedger::restore(const std::vector<RatingEntry>& entries) {
    std::map<Key, uint8_t> ratings;
    std::map<Account, TeacherRatingStats> stats;
    for (const auto& e : entries) {
        if (e.value < MIN_RATING || e.value > MAX_RATING) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, "stored rating out of range", e.teacher);
        }
        Key key(e.courseId, e.student, e.teacher);
        if (!ratings.emplace(key, e.value).second) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, "duplicate stored rating", e.teacher);
        }
        stats[e.teacher].sum += e.value;
        stats[e.teacher].count++;
    }
    ratings_ = std::move(ratings);
    stats_ = std::move(stats);
    return {};
}

}
}
