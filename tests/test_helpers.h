#pragma once

#include <gtest/gtest.h>
#include "core/organization.h"
#include "core/token_ledger.h"
#include "core/clock.h"
#include "database/database.h"
#include <memory>
#include <string>
#include <vector>

namespace coursedao {
namespace test {

using core::Account;
using core::Amount;
using core::Role;

// Delegates to a real ledger but can be told to refuse pulls or payouts.
class FlakyLedger : public core::TokenLedger {
public:
    explicit FlakyLedger(core::TokenLedger& inner) : inner_(inner) {}

    bool failPulls = false;
    bool failPayouts = false;

    std::string symbol() const override { return inner_.symbol(); }
    Amount balanceOf(const Account& account) const override { return inner_.balanceOf(account); }
    Amount allowance(const Account& owner, const Account& spender) const override {
        return inner_.allowance(owner, spender);
    }
    bool approve(const Account& owner, const Account& spender, Amount amount) override {
        return inner_.approve(owner, spender, amount);
    }
    bool transfer(const Account& from, const Account& to, Amount amount) override {
        if (failPayouts) return false;
        return inner_.transfer(from, to, amount);
    }
    bool transferFrom(const Account& spender, const Account& payer,
                      const Account& recipient, Amount amount) override {
        if (failPulls) return false;
        return inner_.transferFrom(spender, payer, recipient, amount);
    }
    bool transferBatch(const Account& from, const std::vector<core::Payout>& payouts) override {
        if (failPayouts) return false;
        return inner_.transferBatch(from, payouts);
    }
    bool mint(const Account& to, Amount amount) override { return inner_.mint(to, amount); }

private:
    core::TokenLedger& inner_;
};

class OrganizationTest : public ::testing::Test {
protected:
    static constexpr uint64_t START = 1700000000;
    static constexpr uint64_t DURATION = core::DEFAULT_PROPOSAL_DURATION;

    void SetUp() override {
        ASSERT_TRUE(db.open(":memory:"));
        ledger = std::make_unique<core::SqliteTokenLedger>(db, "EDU");
        flaky = std::make_unique<FlakyLedger>(*ledger);
        org = std::make_unique<core::Organization>(OWNER, std::vector<Account>{"board1", "board2", "board3"},
                                                   *flaky, clock);
        org->notifications().subscribeAll([this](const core::Notification& n) { events.push_back(n); });
    }

    // Runs a full admission: propose, every electorate member votes yes,
    // wait out the window and execute.
    void admit(const Account& candidate, Role role) {
        auto id = org->createAdmissionProposal(OWNER, candidate, role);
        ASSERT_TRUE(id.ok()) << id.error().message;
        for (const auto& voter : org->members(core::electorateFor(role))) {
            ASSERT_TRUE(org->castVote(voter, id.value(), true).ok());
        }
        clock.advance(org->proposalDuration() + 1);
        auto granted = org->executeProposal(OWNER, id.value());
        ASSERT_TRUE(granted.ok()) << granted.error().message;
        ASSERT_TRUE(granted.value());
        ASSERT_EQ(org->roleOf(candidate), role);
    }

    void admitTeachers(const std::vector<Account>& teachers) {
        for (const auto& t : teachers) admit(t, Role::TEACHER);
    }

    void admitStudents(const std::vector<Account>& students) {
        for (const auto& s : students) admit(s, Role::STUDENT);
    }

    uint64_t createCourse(const Account& creator, Amount price,
                          const std::vector<Account>& teachers, const std::vector<uint32_t>& shares) {
        auto id = org->createCourse(creator, "Course " + std::to_string(price), price, teachers, shares);
        EXPECT_TRUE(id.ok()) << id.error().message;
        return id.valueOr(0);
    }

    void fund(const Account& student, Amount amount) {
        ASSERT_TRUE(ledger->mint(student, amount));
        ASSERT_TRUE(ledger->approve(student, org->treasuryAccount(), amount));
    }

    // Applies, collects a yes from every teacher, pays and confirms.
    void enroll(uint64_t courseId, const Account& student) {
        ASSERT_TRUE(org->applyToCourse(student, courseId).ok());
        auto course = org->getCourse(courseId);
        ASSERT_TRUE(course.has_value());
        for (const auto& t : course->teachers) {
            ASSERT_TRUE(org->teacherVoteOnEnrollment(t, courseId, student, true).ok());
        }
        fund(student, course->price);
        auto confirmed = org->confirmEnrollment(student, courseId);
        ASSERT_TRUE(confirmed.ok()) << confirmed.error().message;
    }

    size_t countEvents(core::NotificationType type) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) n++;
        }
        return n;
    }

    const core::Notification* lastEvent(core::NotificationType type) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type) return &*it;
        }
        return nullptr;
    }

    const Account OWNER = "owner";
    core::ManualClock clock{START};
    database::Database db;
    std::unique_ptr<core::SqliteTokenLedger> ledger;
    std::unique_ptr<FlakyLedger> flaky;
    std::unique_ptr<core::Organization> org;
    std::vector<core::Notification> events;
};

}
}
