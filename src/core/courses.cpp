#include "core/courses.h"
#include "utils/logger.h"
#include <set>

namespace coursedao {
namespace core {

uint32_t Course::shareOf(const Account& account) const {
    auto it = shares.find(account);
    return it == shares.end() ? 0 : it->second;
}

CourseCatalog::CourseCatalog(EngineContext ctx) : ctx_(ctx) {}

Result<uint64_t> CourseCatalog::create(const Account& caller, const std::string& title, Amount price,
                                       const std::vector<Account>& teachers,
                                       const std::vector<uint32_t>& shares) {
    if (!ctx_.roles.hasRole(caller, Role::TEACHER)) {
        return makeError(ErrorCode::NOT_TEACHER, "only teachers create courses");
    }
    if (title.empty()) {
        return makeError(ErrorCode::EMPTY_TITLE, "course title is empty");
    }
    if (teachers.empty()) {
        return makeError(ErrorCode::EMPTY_TEACHER_LIST, "a course needs at least one teacher");
    }
    if (teachers.size() != shares.size()) {
        return makeError(ErrorCode::LENGTH_MISMATCH, std::to_string(teachers.size()) + " teachers but " +
                         std::to_string(shares.size()) + " shares");
    }

    std::set<Account> seen;
    for (const auto& t : teachers) {
        if (!seen.insert(t).second) {
            return makeError(ErrorCode::DUPLICATE_TEACHER, "teacher listed twice", t);
        }
    }

    uint64_t total = 0;
    for (uint32_t s : shares) total += s;
    if (total != BASIS_POINTS) {
        return makeError(ErrorCode::SHARES_MUST_SUM_TO_10000, "shares sum to " + std::to_string(total));
    }

    for (const auto& t : teachers) {
        if (!ctx_.roles.hasRole(t, Role::TEACHER)) {
            return makeError(ErrorCode::UNREGISTERED_TEACHER, "listed account is not a teacher", t);
        }
    }

    Course c;
    c.id = nextId_++;
    c.title = title;
    c.price = price;
    c.teachers = teachers;
    for (size_t i = 0; i < teachers.size(); i++) {
        c.shares[teachers[i]] = shares[i];
    }
    c.creator = caller;
    c.createdAt = ctx_.clock.now();
    c.exists = true;
    courses_[c.id] = c;

    LOG_CAT(INFO, "courses", "course " + std::to_string(c.id) + " \"" + title + "\" created with " +
            std::to_string(teachers.size()) + " teacher(s), price " + std::to_string(price));

    std::string teacherList;
    for (size_t i = 0; i < teachers.size(); i++) {
        if (i > 0) teacherList += ",";
        teacherList += teachers[i];
    }
    ctx_.bus.publish(NotificationType::COURSE_CREATED, c.createdAt, {
        {"id", std::to_string(c.id)},
        {"title", title},
        {"price", std::to_string(price)},
        {"teachers", teacherList},
        {"creator", caller}
    });
    return c.id;
}

Result<void> CourseCatalog::remove(const Account& caller, uint64_t id) {
    auto it = courses_.find(id);
    if (it == courses_.end() || !it->second.exists) {
        return makeError(ErrorCode::NO_SUCH_COURSE, "course " + std::to_string(id) + " is not active");
    }
    if (!ctx_.roles.hasRole(caller, Role::BOARD) && !it->second.hasTeacher(caller)) {
        return makeError(ErrorCode::NOT_AUTHORIZED, "only board members or course teachers remove courses");
    }
    it->second.exists = false;

    LOG_CAT(INFO, "courses", "course " + std::to_string(id) + " removed");
    ctx_.bus.publish(NotificationType::COURSE_REMOVED, ctx_.clock.now(), {
        {"id", std::to_string(id)},
        {"by", caller}
    });
    return {};
}

const Course* CourseCatalog::find(uint64_t id) const {
    auto it = courses_.find(id);
    return it == courses_.end() ? nullptr : &it->second;
}

const Course* CourseCatalog::findActive(uint64_t id) const {
    const Course* c = find(id);
    return (c && c->exists) ? c : nullptr;
}

std::optional<Course> CourseCatalog::get(uint64_t id) const {
    const Course* c = find(id);
    if (!c) return std::nullopt;
    return *c;
}

std::vector<Course> CourseCatalog::list(bool includeRemoved) const {
    std::vector<Course> out;
    for (const auto& [id, c] : courses_) {
        if (c.exists || includeRemoved) out.push_back(c);
    }
    return out;
}

size_t CourseCatalog::activeCount() const {
    size_t n = 0;
    for (const auto& [id, c] : courses_) {
        if (c.exists) n++;
    }
    return n;
}

CourseBook CourseCatalog::exportState() const {
    CourseBook book;
    book.courses = list(true);
    book.nextId = nextId_;
    return book;
}

Result<void> CourseCatalog::restore(const CourseBook& book) {
    std::map<uint64_t, Course> courses;
    for (const auto& c : book.courses) {
        if (c.id == 0 || c.id >= book.nextId || courses.count(c.id)) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, "bad course id " + std::to_string(c.id));
        }
        if (c.teachers.size() != c.shares.size()) {
            return makeError(ErrorCode::SERIALIZATION_ERROR,
                             "course " + std::to_string(c.id) + " has inconsistent teacher shares");
        }
        courses[c.id] = c;
    }
    courses_ = std::move(courses);
    nextId_ = book.nextId;
    return {};
}

}
}
