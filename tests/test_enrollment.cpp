#include "test_helpers.h"

using namespace coursedao;
using namespace coursedao::core;
using coursedao::test::OrganizationTest;

class EnrollmentTest : public OrganizationTest {
protected:
    void SetUp() override {
        OrganizationTest::SetUp();
        admitTeachers({"t1", "t2", "t3"});
        admitStudents({"s1", "s2"});
        trio = createCourse("t1", 300, {"t1", "t2", "t3"}, {4000, 3000, 3000});
    }

    uint64_t trio = 0;
};

TEST_F(EnrollmentTest, MajorityOfTeachersAccepts) {
    ASSERT_TRUE(org->applyToCourse("s1", trio).ok());
    EXPECT_EQ(org->getEnrollment(trio, "s1")->stage(), EnrollmentStage::APPLIED);

    ASSERT_TRUE(org->teacherVoteOnEnrollment("t1", trio, "s1", true).ok());
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t2", trio, "s1", false).ok());
    EXPECT_FALSE(org->getEnrollment(trio, "s1")->decided);
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t3", trio, "s1", true).ok());

    auto req = org->getEnrollment(trio, "s1");
    ASSERT_TRUE(req.has_value());
    EXPECT_TRUE(req->decided);
    EXPECT_TRUE(req->acceptedByTeachers);
    EXPECT_FALSE(req->enrolled);
    EXPECT_EQ(req->votesFor, 2u);
    EXPECT_EQ(req->votesAgainst, 1u);
    EXPECT_EQ(lastEvent(NotificationType::ENROLLMENT_DECIDED)->field("accepted"), "true");
}

TEST_F(EnrollmentTest, RejectionAllowsReapplication) {
    ASSERT_TRUE(org->applyToCourse("s1", trio).ok());
    EXPECT_EQ(org->applyToCourse("s1", trio).code(), ErrorCode::ALREADY_ACTIVE);

    ASSERT_TRUE(org->teacherVoteOnEnrollment("t1", trio, "s1", false).ok());
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t2", trio, "s1", true).ok());
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t3", trio, "s1", false).ok());

    auto rejected = org->getEnrollment(trio, "s1");
    EXPECT_TRUE(rejected->decided);
    EXPECT_FALSE(rejected->acceptedByTeachers);
    EXPECT_EQ(rejected->stage(), EnrollmentStage::REJECTED);
    EXPECT_EQ(org->confirmEnrollment("s1", trio).code(), ErrorCode::NOT_PENDING_OR_NOT_ACCEPTED);

    ASSERT_TRUE(org->applyToCourse("s1", trio).ok());
    auto reopened = org->getEnrollment(trio, "s1");
    EXPECT_EQ(reopened->votesFor, 0u);
    EXPECT_EQ(reopened->votesAgainst, 0u);
    EXPECT_TRUE(reopened->teacherVoted.empty());
    EXPECT_FALSE(reopened->decided);
    EXPECT_EQ(reopened->attempts, 2u);

    // Teachers may vote again on the fresh request.
    EXPECT_TRUE(org->teacherVoteOnEnrollment("t1", trio, "s1", true).ok());
}

TEST_F(EnrollmentTest, TieRejects) {
    admitTeachers({"t4"});
    uint64_t pair = createCourse("t4", 10, {"t1", "t4"}, {5000, 5000});
    ASSERT_TRUE(org->applyToCourse("s1", pair).ok());
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t1", pair, "s1", true).ok());
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t4", pair, "s1", false).ok());
    EXPECT_FALSE(org->getEnrollment(pair, "s1")->acceptedByTeachers);
    EXPECT_TRUE(org->applyToCourse("s1", pair).ok());
}

TEST_F(EnrollmentTest, ApplyChecks) {
    EXPECT_EQ(org->applyToCourse("t1", trio).code(), ErrorCode::NOT_STUDENT);
    EXPECT_EQ(org->applyToCourse("s1", 99).code(), ErrorCode::NO_SUCH_COURSE);
    ASSERT_TRUE(org->removeCourse("board1", trio).ok());
    EXPECT_EQ(org->applyToCourse("s1", trio).code(), ErrorCode::NO_SUCH_COURSE);
}

TEST_F(EnrollmentTest, TeacherVoteChecks) {
    admitTeachers({"t4"});
    EXPECT_EQ(org->teacherVoteOnEnrollment("t1", trio, "s1", true).code(), ErrorCode::NO_APPLICATION);
    ASSERT_TRUE(org->applyToCourse("s1", trio).ok());

    EXPECT_EQ(org->teacherVoteOnEnrollment("t4", trio, "s1", true).code(), ErrorCode::NOT_COURSE_TEACHER);
    EXPECT_EQ(org->teacherVoteOnEnrollment("board1", trio, "s1", true).code(), ErrorCode::NOT_COURSE_TEACHER);
    EXPECT_EQ(org->teacherVoteOnEnrollment("t1", 99, "s1", true).code(), ErrorCode::NO_SUCH_COURSE);

    ASSERT_TRUE(org->teacherVoteOnEnrollment("t1", trio, "s1", true).ok());
    EXPECT_EQ(org->teacherVoteOnEnrollment("t1", trio, "s1", false).code(), ErrorCode::DUPLICATE_VOTE);
    EXPECT_EQ(org->getEnrollment(trio, "s1")->votesFor, 1u);
    EXPECT_EQ(org->getEnrollment(trio, "s1")->votesAgainst, 0u);
}

TEST_F(EnrollmentTest, ConfirmPaysExactlyThePrice) {
    ASSERT_TRUE(org->applyToCourse("s1", trio).ok());
    EXPECT_EQ(org->confirmEnrollment("s1", trio).code(), ErrorCode::NOT_PENDING_OR_NOT_ACCEPTED);
    for (const auto& t : {"t1", "t2", "t3"}) {
        ASSERT_TRUE(org->teacherVoteOnEnrollment(t, trio, "s1", true).ok());
    }

    ASSERT_TRUE(ledger->mint("s1", 1000));
    ASSERT_TRUE(ledger->approve("s1", org->treasuryAccount(), 1000));
    EXPECT_EQ(org->confirmEnrollment("t1", trio).code(), ErrorCode::NOT_STUDENT);
    ASSERT_TRUE(org->confirmEnrollment("s1", trio).ok());

    EXPECT_EQ(ledger->balanceOf("s1"), 700u);
    EXPECT_EQ(org->treasuryBalance(), 300u);
    EXPECT_EQ(ledger->allowance("s1", org->treasuryAccount()), 700u);
    EXPECT_TRUE(org->getEnrollment(trio, "s1")->enrolled);
    EXPECT_EQ(org->getEnrollment(trio, "s1")->stage(), EnrollmentStage::ENROLLED);

    EXPECT_EQ(org->confirmEnrollment("s1", trio).code(), ErrorCode::NOT_PENDING_OR_NOT_ACCEPTED);
    EXPECT_EQ(org->applyToCourse("s1", trio).code(), ErrorCode::ALREADY_ACTIVE);
    EXPECT_EQ(org->teacherVoteOnEnrollment("t1", trio, "s1", true).code(), ErrorCode::ALREADY_ENROLLED);
}

TEST_F(EnrollmentTest, FailedPaymentLeavesRequestRetryable) {
    ASSERT_TRUE(org->applyToCourse("s1", trio).ok());
    for (const auto& t : {"t1", "t2", "t3"}) {
        ASSERT_TRUE(org->teacherVoteOnEnrollment(t, trio, "s1", true).ok());
    }
    ASSERT_TRUE(ledger->mint("s1", 300));

    // No allowance yet.
    EXPECT_EQ(org->confirmEnrollment("s1", trio).code(), ErrorCode::PAYMENT_FAILED);
    EXPECT_FALSE(org->getEnrollment(trio, "s1")->enrolled);

    ASSERT_TRUE(ledger->approve("s1", org->treasuryAccount(), 300));
    flaky->failPulls = true;
    EXPECT_EQ(org->confirmEnrollment("s1", trio).code(), ErrorCode::PAYMENT_FAILED);
    EXPECT_FALSE(org->getEnrollment(trio, "s1")->enrolled);
    EXPECT_EQ(ledger->balanceOf("s1"), 300u);
    EXPECT_EQ(countEvents(NotificationType::ENROLLMENT_CONFIRMED), 0u);

    flaky->failPulls = false;
    ASSERT_TRUE(org->confirmEnrollment("s1", trio).ok());
    EXPECT_TRUE(org->getEnrollment(trio, "s1")->enrolled);
}

TEST_F(EnrollmentTest, ZeroPriceCourseCannotBeConfirmed) {
    uint64_t freeCourse = createCourse("t1", 0, {"t1"}, {10000});
    ASSERT_TRUE(org->applyToCourse("s1", freeCourse).ok());
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t1", freeCourse, "s1", true).ok());
    EXPECT_EQ(org->confirmEnrollment("s1", freeCourse).code(), ErrorCode::ZERO_PRICE_COURSE);
}

TEST_F(EnrollmentTest, CompletionSplitsByShares) {
    uint64_t id = createCourse("t1", 100, {"t1", "t2"}, {6000, 4000});
    enroll(id, "s1");

    auto done = org->completeCourseAndDistribute("t2", id, "s1");
    ASSERT_TRUE(done.ok()) << done.error().message;
    EXPECT_EQ(done.value().distributed, 100u);
    EXPECT_EQ(done.value().residue, 0u);
    EXPECT_EQ(ledger->balanceOf("t1"), 60u);
    EXPECT_EQ(ledger->balanceOf("t2"), 40u);
    EXPECT_EQ(org->treasuryBalance(), 0u);
    EXPECT_TRUE(org->getEnrollment(id, "s1")->completed);
}

TEST_F(EnrollmentTest, CompletionLeavesRoundingResidueInTreasury) {
    uint64_t id = createCourse("t1", 101, {"t1", "t2"}, {5000, 5000});
    enroll(id, "s1");
    Amount supply = ledger->totalSupply();

    auto done = org->completeCourseAndDistribute(OWNER, id, "s1");
    ASSERT_TRUE(done.ok());
    EXPECT_EQ(ledger->balanceOf("t1"), 50u);
    EXPECT_EQ(ledger->balanceOf("t2"), 50u);
    EXPECT_EQ(done.value().residue, 1u);
    EXPECT_EQ(org->treasuryBalance(), 1u);
    EXPECT_EQ(ledger->totalSupply(), supply);
    EXPECT_EQ(lastEvent(NotificationType::COURSE_COMPLETED)->field("residue"), "1");
}

TEST_F(EnrollmentTest, CompletionIsPaidOnce) {
    uint64_t id = createCourse("t1", 100, {"t1", "t2"}, {6000, 4000});
    enroll(id, "s1");
    enroll(id, "s2");

    ASSERT_TRUE(org->completeCourseAndDistribute("board1", id, "s1").ok());
    EXPECT_EQ(org->completeCourseAndDistribute("board1", id, "s1").code(), ErrorCode::ALREADY_COMPLETED);
    EXPECT_EQ(org->treasuryBalance(), 100u);
    EXPECT_EQ(org->applyToCourse("s1", id).code(), ErrorCode::ALREADY_ACTIVE);
}

TEST_F(EnrollmentTest, CompletionChecks) {
    uint64_t id = createCourse("t1", 100, {"t1", "t2"}, {6000, 4000});
    EXPECT_EQ(org->completeCourseAndDistribute("t1", 99, "s1").code(), ErrorCode::NO_SUCH_COURSE);
    EXPECT_EQ(org->completeCourseAndDistribute("t3", id, "s1").code(), ErrorCode::NOT_AUTHORIZED);
    EXPECT_EQ(org->completeCourseAndDistribute("s2", id, "s1").code(), ErrorCode::NOT_AUTHORIZED);
    EXPECT_EQ(org->completeCourseAndDistribute("t1", id, "s1").code(), ErrorCode::STUDENT_NOT_ENROLLED);

    enroll(id, "s1");
    ASSERT_TRUE(org->boardPayout("board1", "vendor", 30).ok());
    EXPECT_EQ(org->completeCourseAndDistribute("t1", id, "s1").code(), ErrorCode::INSUFFICIENT_TREASURY);
    EXPECT_EQ(ledger->balanceOf("t1"), 0u);
    EXPECT_FALSE(org->getEnrollment(id, "s1")->completed);
}

TEST_F(EnrollmentTest, FailedPayoutKeepsEnrollmentOpen) {
    uint64_t id = createCourse("t1", 100, {"t1", "t2"}, {6000, 4000});
    enroll(id, "s1");
    flaky->failPayouts = true;
    EXPECT_EQ(org->completeCourseAndDistribute("t1", id, "s1").code(), ErrorCode::TRANSFER_FAILED);
    EXPECT_FALSE(org->getEnrollment(id, "s1")->completed);
    EXPECT_EQ(org->treasuryBalance(), 100u);

    flaky->failPayouts = false;
    EXPECT_TRUE(org->completeCourseAndDistribute("t1", id, "s1").ok());
}

TEST_F(EnrollmentTest, RemovedCourseStillSettlesEnrolledStudents) {
    uint64_t id = createCourse("t1", 100, {"t1", "t2"}, {6000, 4000});
    enroll(id, "s1");
    ASSERT_TRUE(org->removeCourse("board1", id).ok());

    EXPECT_EQ(org->confirmEnrollment("s2", id).code(), ErrorCode::NO_SUCH_COURSE);
    EXPECT_TRUE(org->completeCourseAndDistribute("t1", id, "s1").ok());
    EXPECT_EQ(ledger->balanceOf("t1"), 60u);
}

TEST_F(EnrollmentTest, ListsRequestsPerCourse) {
    ASSERT_TRUE(org->applyToCourse("s1", trio).ok());
    ASSERT_TRUE(org->applyToCourse("s2", trio).ok());
    uint64_t other = createCourse("t2", 5, {"t2"}, {10000});
    ASSERT_TRUE(org->applyToCourse("s1", other).ok());

    auto requests = org->listEnrollments(trio);
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].student, "s1");
    EXPECT_EQ(requests[1].student, "s2");
    EXPECT_EQ(org->listEnrollments(other).size(), 1u);
    EXPECT_FALSE(org->getEnrollment(other, "s2").has_value());
}
