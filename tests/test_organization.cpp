#include "test_helpers.h"
#include "utils/config.h"

using namespace coursedao;
using namespace coursedao::core;
using coursedao::test::OrganizationTest;

class OrganizationFlowTest : public OrganizationTest {};

TEST_F(OrganizationFlowTest, FullCourseLifecycle) {
    admitTeachers({"t1", "t2"});
    admitStudents({"s1"});
    admit("s-board", Role::STUDENT);

    uint64_t id = createCourse("t1", 100, {"t1", "t2"}, {6000, 4000});
    enroll(id, "s1");
    ASSERT_TRUE(org->giveRating("s1", id, "t1", 5).ok());
    ASSERT_TRUE(org->completeCourseAndDistribute("t1", id, "s1").ok());
    EXPECT_EQ(org->getEnrollment(id, "s1")->stage(), EnrollmentStage::COMPLETED);

    // Students elect a new board member.
    auto p = org->createAdmissionProposal("s1", "b4", Role::BOARD);
    ASSERT_TRUE(p.ok());
    ASSERT_TRUE(org->castVote("s1", p.value(), true).ok());
    ASSERT_TRUE(org->castVote("s-board", p.value(), true).ok());
    clock.advance(DURATION + 1);
    ASSERT_TRUE(org->executeProposal("b4", p.value()).value());
    EXPECT_EQ(org->boards().size(), 4u);

    ASSERT_TRUE(ledger->mint(org->treasuryAccount(), 60));
    ASSERT_TRUE(org->distributeBonusByRating("b4", id, 60).ok());
    EXPECT_EQ(ledger->balanceOf("t1"), 60u + 50u);
    EXPECT_EQ(ledger->balanceOf("t2"), 40u + 10u);
}

TEST_F(OrganizationFlowTest, NotificationsArriveInOrder) {
    admitTeachers({"t1"});
    uint64_t last = 0;
    for (const auto& e : events) {
        EXPECT_GT(e.sequence, last);
        last = e.sequence;
    }
    ASSERT_GE(events.size(), 4u);
    EXPECT_EQ(events[0].type, NotificationType::PROPOSAL_CREATED);
    EXPECT_EQ(events[1].type, NotificationType::PROPOSAL_VOTED);
    EXPECT_EQ(events[events.size() - 2].type, NotificationType::PROPOSAL_EXECUTED);
    EXPECT_EQ(events.back().type, NotificationType::ROLE_GRANTED);
    EXPECT_EQ(events.back().timestamp, clock.now());
}

TEST_F(OrganizationFlowTest, RejectionsPublishNothing) {
    size_t before = events.size();
    EXPECT_TRUE(org->castVote("board1", 5, true).failed());
    EXPECT_TRUE(org->createCourse("board1", "X", 1, {"board1"}, {10000}).failed());
    EXPECT_TRUE(org->boardPayout("board1", "x", 1).failed());
    EXPECT_EQ(events.size(), before);
}

TEST_F(OrganizationFlowTest, SnapshotRestoresIntoFreshOrganization) {
    admitTeachers({"t1", "t2"});
    admitStudents({"s1", "s2"});
    uint64_t id = createCourse("t1", 100, {"t1", "t2"}, {6000, 4000});
    enroll(id, "s1");
    ASSERT_TRUE(org->giveRating("s1", id, "t2", 3).ok());
    ASSERT_TRUE(org->applyToCourse("s2", id).ok());
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t1", id, "s2", false).ok());
    auto open = org->createAdmissionProposal(OWNER, "t3", Role::TEACHER);
    ASSERT_TRUE(open.ok());
    ASSERT_TRUE(org->setProposalDuration(OWNER, 600).ok());

    OrganizationState state = org->snapshot();

    OrganizationConfig cfg;
    cfg.proposalDuration = state.proposals.duration;
    Organization copy(OWNER, {}, *ledger, clock, cfg);
    ASSERT_TRUE(copy.restore(state).ok());

    EXPECT_EQ(copy.boards(), org->boards());
    EXPECT_EQ(copy.teachers(), org->teachers());
    EXPECT_EQ(copy.students(), org->students());
    EXPECT_EQ(copy.listProposals().size(), org->listProposals().size());
    EXPECT_EQ(copy.activeProposalOf("t3"), std::optional<uint64_t>(open.value()));
    EXPECT_EQ(copy.proposalDuration(), 600u);
    EXPECT_EQ(copy.getCourse(id)->shareOf("t1"), 6000u);
    EXPECT_TRUE(copy.getEnrollment(id, "s1")->enrolled);
    EXPECT_EQ(copy.getEnrollment(id, "s2")->teacherVoted.count("t1"), 1u);
    EXPECT_EQ(copy.teacherStats("t2").sum, 3u);
    EXPECT_EQ(copy.teacherStats("t2").count, 1u);

    // Restored state keeps enforcing the same rules.
    EXPECT_EQ(copy.teacherVoteOnEnrollment("t1", id, "s2", true).code(), ErrorCode::DUPLICATE_VOTE);
    EXPECT_EQ(copy.createAdmissionProposal(OWNER, "t3", Role::TEACHER).code(),
              ErrorCode::DUPLICATE_ACTIVE_PROPOSAL);
    auto next = copy.createCourse("t2", "Next", 5, {"t2"}, {10000});
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(next.value(), id + 1);
}

TEST_F(OrganizationFlowTest, RestoreRejectsForeignOrInconsistentState) {
    admitTeachers({"t1"});
    OrganizationState state = org->snapshot();

    Organization other("someone-else", {"x"}, *ledger, clock);
    EXPECT_EQ(other.restore(state).code(), ErrorCode::SERIALIZATION_ERROR);
    EXPECT_EQ(other.boards(), (std::vector<Account>{"x"}));

    OrganizationState broken = state;
    Course ghost;
    ghost.id = 500;
    ghost.exists = true;
    broken.courses.courses.push_back(ghost);
    EXPECT_EQ(org->restore(broken).code(), ErrorCode::SERIALIZATION_ERROR);
    EXPECT_EQ(org->teachers(), (std::vector<Account>{"t1"}));
    EXPECT_TRUE(org->listCourses(true).empty());
}

TEST(OrganizationConfigTest, FromSettings) {
    utils::OrganizationSettings settings;
    settings.treasuryAccount = "vault";
    settings.proposalDuration = 42;
    settings.defaultRatingWeight = 7;
    auto cfg = OrganizationConfig::fromSettings(settings);
    EXPECT_EQ(cfg.treasuryAccount, "vault");
    EXPECT_EQ(cfg.proposalDuration, 42u);
    EXPECT_EQ(cfg.defaultRatingWeight, 7u);
}
