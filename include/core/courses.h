#pragma once

#include "core/context.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <vector>
#include <optional>

namespace coursedao {
namespace core {

struct Course {
    uint64_t id = 0;
    std::string title;
    Amount price = 0;
    std::vector<Account> teachers;
    std::map<Account, uint32_t> shares;
    Account creator;
    uint64_t createdAt = 0;
    // Cleared by removal. The record itself is never dropped.
    bool exists = false;

    bool hasTeacher(const Account& account) const { return shares.count(account) > 0; }
    uint32_t shareOf(const Account& account) const;
};

struct CourseBook {
    std::vector<Course> courses;
    uint64_t nextId = 1;
};

class CourseCatalog {
public:
    explicit CourseCatalog(EngineContext ctx);

    Result<uint64_t> create(const Account& caller, const std::string& title, Amount price,
                            const std::vector<Account>& teachers,
                            const std::vector<uint32_t>& shares);
    Result<void> remove(const Account& caller, uint64_t id);

    // Null for ids that were never assigned. Removed courses are returned
    // with exists == false.
    const Course* find(uint64_t id) const;
    // Null unless the course is live.
    const Course* findActive(uint64_t id) const;

    std::optional<Course> get(uint64_t id) const;
    std::vector<Course> list(bool includeRemoved = false) const;
    size_t activeCount() const;

    CourseBook exportState() const;
    Result<void> restore(const CourseBook& book);

private:
    EngineContext ctx_;
    std::map<uint64_t, Course> courses_;
    uint64_t nextId_ = 1;
};

}
}
