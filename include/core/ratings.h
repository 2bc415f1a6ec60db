#pragma once

#include "core/context.h"
#include "core/courses.h"
#include "core/enrollment.h"
#include "core/treasury.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <tuple>
#include <vector>

namespace coursedao {
namespace core {

// Aggregated across every course the teacher is rated in.
struct TeacherRatingStats {
    uint64_t sum = 0;
    uint64_t count = 0;

    // Average scaled by 100; zero when unrated.
    uint64_t scaledAverage() const { return count == 0 ? 0 : (sum * 100) / count; }
};

struct RatingEntry {
    uint64_t courseId = 0;
    Account student;
    Account teacher;
    uint8_t value = 0;
};

struct BonusResult {
    std::vector<Payout> payouts;
    Amount distributed = 0;
    Amount residue = 0;
    uint64_t totalWeight = 0;
};

class RatingLedger {
public:
    RatingLedger(EngineContext ctx, const CourseCatalog& catalog, const EnrollmentWorkflow& enrollment,
                 Treasury& treasury, uint64_t defaultWeight = DEFAULT_RATING_WEIGHT);

    Result<void> rate(const Account& student, uint64_t courseId, const Account& teacher, uint8_t value);
    Result<BonusResult> distributeBonus(const Account& caller, uint64_t courseId, Amount amount);

    // 0 when the student has not rated that teacher in that course.
    uint8_t ratingOf(uint64_t courseId, const Account& student, const Account& teacher) const;
    TeacherRatingStats statsOf(const Account& teacher) const;
    uint64_t weightOf(const Account& teacher) const;
    uint64_t defaultWeight() const { return defaultWeight_; }

    std::vector<RatingEntry> entries() const;
    // Stats are rebuilt from the individual ratings.
    Result<void> restore(const std::vector<RatingEntry>& entries);

private:
    using Key = std::tuple<uint64_t, Account, Account>;

    EngineContext ctx_;
    const CourseCatalog& catalog_;
    const EnrollmentWorkflow& enrollment_;
    Treasury& treasury_;
    uint64_t defaultWeight_;
    std::map<Key, uint8_t> ratings_;
    std::map<Account, TeacherRatingStats> stats_;
};

}
}
