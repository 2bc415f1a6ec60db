#include "core/enrollment.h"
#include "utils/logger.h"

namespace coursedao {
namespace core {

const char* enrollmentStageToString(EnrollmentStage stage) {
    switch (stage) {
        case EnrollmentStage::NONE: return "NONE";
        case EnrollmentStage::APPLIED: return "APPLIED";
        case EnrollmentStage::ACCEPTED: return "ACCEPTED";
        case EnrollmentStage::REJECTED: return "REJECTED";
        case EnrollmentStage::ENROLLED: return "ENROLLED";
        case EnrollmentStage::COMPLETED: return "COMPLETED";
        default: return "UNKNOWN";
    }
}

EnrollmentStage EnrollmentRequest::stage() const {
    if (!exists) return EnrollmentStage::NONE;
    if (completed) return EnrollmentStage::COMPLETED;
    if (enrolled) return EnrollmentStage::ENROLLED;
    if (!decided) return EnrollmentStage::APPLIED;
    return acceptedByTeachers ? EnrollmentStage::ACCEPTED : EnrollmentStage::REJECTED;
}

EnrollmentWorkflow::EnrollmentWorkflow(EngineContext ctx, const CourseCatalog& catalog, Treasury& treasury)
    : ctx_(ctx), catalog_(catalog), treasury_(treasury) {}

EnrollmentRequest* EnrollmentWorkflow::findRequest(uint64_t courseId, const Account& student) {
    auto it = requests_.find(Key(courseId, student));
    return it == requests_.end() ? nullptr : &it->second;
}

Result<void> EnrollmentWorkflow::apply(const Account& student, uint64_t courseId) {
    if (!ctx_.roles.hasRole(student, Role::STUDENT)) {
        return makeError(ErrorCode::NOT_STUDENT, "only students apply to courses");
    }
    if (!catalog_.findActive(courseId)) {
        return makeError(ErrorCode::NO_SUCH_COURSE, "course " + std::to_string(courseId) + " is not active");
    }

    EnrollmentRequest* existing = findRequest(courseId, student);
    if (existing && existing->exists && !existing->canReapply()) {
        return makeError(ErrorCode::ALREADY_ACTIVE, std::string("request is ") +
                         enrollmentStageToString(existing->stage()));
    }

    EnrollmentRequest& req = requests_[Key(courseId, student)];
    uint32_t attempts = req.attempts;
    req = EnrollmentRequest();
    req.courseId = courseId;
    req.student = student;
    req.exists = true;
    req.attempts = attempts + 1;
    req.appliedAt = ctx_.clock.now();

    LOG_CAT(INFO, "enrollment", utils::Logger::redactAddress(student) + " applied to course " +
            std::to_string(courseId) + " (attempt " + std::to_string(req.attempts) + ")");
    ctx_.bus.publish(NotificationType::APPLICATION_SUBMITTED, req.appliedAt, {
        {"course", std::to_string(courseId)},
        {"student", student},
        {"attempt", std::to_string(req.attempts)}
    });
    return {};
}

Result<void> EnrollmentWorkflow::teacherVote(const Account& teacher, uint64_t courseId,
                                             const Account& student, bool accept) {
    const Course* course = catalog_.findActive(courseId);
    if (!course) {
        return makeError(ErrorCode::NO_SUCH_COURSE, "course " + std::to_string(courseId) + " is not active");
    }
    if (!ctx_.roles.hasRole(teacher, Role::TEACHER) || !course->hasTeacher(teacher)) {
        return makeError(ErrorCode::NOT_COURSE_TEACHER, "caller does not teach course " + std::to_string(courseId));
    }

    EnrollmentRequest* req = findRequest(courseId, student);
    if (!req || !req->exists) {
        return makeError(ErrorCode::NO_APPLICATION, "no application from student", student);
    }
    if (req->enrolled) {
        return makeError(ErrorCode::ALREADY_ENROLLED, "student is already enrolled", student);
    }
    if (req->teacherVoted.count(teacher)) {
        return makeError(ErrorCode::DUPLICATE_VOTE, "teacher already voted on this application");
    }

    req->teacherVoted.insert(teacher);
    if (accept) {
        req->votesFor++;
    } else {
        req->votesAgainst++;
    }

    uint64_t now = ctx_.clock.now();
    ctx_.bus.publish(NotificationType::TEACHER_VOTE_RECORDED, now, {
        {"course", std::to_string(courseId)},
        {"student", student},
        {"teacher", teacher},
        {"accept", accept ? "true" : "false"}
    });

    // Decided once every listed teacher has voted; strict majority accepts.
    if (req->teacherVoted.size() == course->teachers.size()) {
        req->decided = true;
        req->acceptedByTeachers = req->votesFor > req->votesAgainst;

        LOG_CAT(INFO, "enrollment", "application of " + utils::Logger::redactAddress(student) +
                " to course " + std::to_string(courseId) +
                (req->acceptedByTeachers ? " accepted" : " rejected"));
        ctx_.bus.publish(NotificationType::ENROLLMENT_DECIDED, now, {
            {"course", std::to_string(courseId)},
            {"student", student},
            {"accepted", req->acceptedByTeachers ? "true" : "false"},
            {"votesFor", std::to_string(req->votesFor)},
            {"votesAgainst", std::to_string(req->votesAgainst)}
        });
    }
    return {};
}

Result<void> EnrollmentWorkflow::confirm(const Account& student, uint64_t courseId) {
    if (!ctx_.roles.hasRole(student, Role::STUDENT)) {
        return makeError(ErrorCode::NOT_STUDENT, "only students confirm enrollment");
    }
    const Course* course = catalog_.findActive(courseId);
    if (!course) {
        return makeError(ErrorCode::NO_SUCH_COURSE, "course " + std::to_string(courseId) + " is not active");
    }

    EnrollmentRequest* req = findRequest(courseId, student);
    if (!req || !req->exists || req->enrolled || !req->acceptedByTeachers) {
        return makeError(ErrorCode::NOT_PENDING_OR_NOT_ACCEPTED,
                         std::string("request is ") + enrollmentStageToString(req ? req->stage() : EnrollmentStage::NONE));
    }
    if (course->price == 0) {
        return makeError(ErrorCode::ZERO_PRICE_COURSE, "course " + std::to_string(courseId) + " has no price");
    }

    auto paid = treasury_.pullPayment(student, course->price);
    if (paid.failed()) return paid.error();

    req->enrolled = true;

    LOG_CAT(INFO, "enrollment", utils::Logger::redactAddress(student) + " enrolled in course " +
            std::to_string(courseId) + " for " + std::to_string(course->price));
    ctx_.bus.publish(NotificationType::ENROLLMENT_CONFIRMED, ctx_.clock.now(), {
        {"course", std::to_string(courseId)},
        {"student", student},
        {"price", std::to_string(course->price)}
    });
    return {};
}

Result<CompletionResult> EnrollmentWorkflow::complete(const Account& caller, uint64_t courseId,
                                                      const Account& student) {
    // Completion stays possible after removal so enrolled students get settled.
    const Course* course = catalog_.find(courseId);
    if (!course) {
        return makeError(ErrorCode::NO_SUCH_COURSE, "course " + std::to_string(courseId) + " does not exist");
    }
    bool authorized = caller == ctx_.owner ||
                      ctx_.roles.hasRole(caller, Role::BOARD) ||
                      (ctx_.roles.hasRole(caller, Role::TEACHER) && course->hasTeacher(caller));
    if (!authorized) {
        return makeError(ErrorCode::NOT_AUTHORIZED, "caller may not complete course " + std::to_string(courseId));
    }

    EnrollmentRequest* req = findRequest(courseId, student);
    if (!req || !req->enrolled) {
        return makeError(ErrorCode::STUDENT_NOT_ENROLLED, "student is not enrolled", student);
    }
    if (req->completed) {
        return makeError(ErrorCode::ALREADY_COMPLETED, "completion was already paid out", student);
    }
    if (treasury_.balance() < course->price) {
        return makeError(ErrorCode::INSUFFICIENT_TREASURY, "treasury holds " + std::to_string(treasury_.balance()) +
                         ", course price is " + std::to_string(course->price));
    }

    CompletionResult result;
    for (const auto& t : course->teachers) {
        Amount amount = mulDivFloor(course->price, course->shareOf(t), BASIS_POINTS);
        result.payouts.push_back(Payout{t, amount});
        result.distributed += amount;
    }
    result.residue = course->price - result.distributed;

    auto paid = treasury_.payMany(result.payouts);
    if (paid.failed()) return paid.error();

    req->completed = true;

    LOG_CAT(INFO, "enrollment", "course " + std::to_string(courseId) + " completed by " +
            utils::Logger::redactAddress(student) + ", paid " + std::to_string(result.distributed) +
            " (residue " + std::to_string(result.residue) + ")");
    ctx_.bus.publish(NotificationType::COURSE_COMPLETED, ctx_.clock.now(), {
        {"course", std::to_string(courseId)},
        {"student", student},
        {"by", caller},
        {"distributed", std::to_string(result.distributed)},
        {"residue", std::to_string(result.residue)}
    });
    return result;
}

bool EnrollmentWorkflow::isEnrolled(uint64_t courseId, const Account& student) const {
    auto it = requests_.find(Key(courseId, student));
    return it != requests_.end() && it->second.enrolled;
}

std::optional<EnrollmentRequest> EnrollmentWorkflow::get(uint64_t courseId, const Account& student) const {
    auto it = requests_.find(Key(courseId, student));
    if (it == requests_.end()) return std::nullopt;
    return it->second;
}

std::vector<EnrollmentRequest> EnrollmentWorkflow::list(uint64_t courseId) const {
    std::vector<EnrollmentRequest> out;
    auto it = requests_.lower_bound(Key(courseId, Account()));
    for (; it != requests_.end() && it->first.first == courseId; ++it) {
        out.push_back(it->second);
    }
    return out;
}

std::vector<EnrollmentRequest> EnrollmentWorkflow::all() const {
    std::vector<EnrollmentRequest> out;
    out.reserve(requests_.size());
    for (const auto& [key, req] : requests_) out.push_back(req);
    return out;
}

Result<void> EnrollmentWorkflow::restore(const std::vector<EnrollmentRequest>& requests) {
    std::map<Key, EnrollmentRequest> restored;
    for (const auto& req : requests) {
        if (!catalog_.find(req.courseId)) {
            return makeError(ErrorCode::SERIALIZATION_ERROR,
                             "enrollment references unknown course " + std::to_string(req.courseId));
        }
        if ((req.completed && !req.enrolled) || (req.enrolled && !req.acceptedByTeachers)) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, "inconsistent enrollment flags", req.student);
        }
        restored[Key(req.courseId, req.student)] = req;
    }
    requests_ = std::move(restored);
    return {};
}

}
}
