#include "test_helpers.h"
#include "database/state_store.h"
#include "utils/serialize.h"

using namespace coursedao;
using namespace coursedao::core;
using coursedao::database::StateStore;
using coursedao::test::OrganizationTest;

class StateStoreTest : public OrganizationTest {};

TEST_F(StateStoreTest, EmptyDatabaseHasNoState) {
    StateStore store(db);
    EXPECT_FALSE(store.hasState());
    EXPECT_EQ(store.load().code(), ErrorCode::DATABASE_ERROR);
}

TEST_F(StateStoreTest, SaveAndLoad) {
    admitTeachers({"t1", "t2"});
    admitStudents({"s1"});
    uint64_t id = createCourse("t1", 100, {"t1", "t2"}, {6000, 4000});
    enroll(id, "s1");
    ASSERT_TRUE(org->giveRating("s1", id, "t1", 4).ok());
    ASSERT_TRUE(org->removeCourse("t2", id).ok());

    StateStore store(db);
    ASSERT_TRUE(store.save(org->snapshot()).ok());
    EXPECT_TRUE(store.hasState());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.ok()) << loaded.error().message;
    const OrganizationState& state = loaded.value();
    EXPECT_EQ(state.owner, OWNER);
    EXPECT_EQ(state.treasuryAccount, "dao:treasury");
    EXPECT_EQ(state.roles, org->snapshot().roles);
    EXPECT_EQ(state.proposals.proposals.size(), 3u);
    EXPECT_EQ(state.proposals.nextId, 4u);
    ASSERT_EQ(state.courses.courses.size(), 1u);
    EXPECT_FALSE(state.courses.courses[0].exists);
    EXPECT_EQ(state.courses.courses[0].teachers, (std::vector<Account>{"t1", "t2"}));
    ASSERT_EQ(state.enrollments.size(), 1u);
    EXPECT_TRUE(state.enrollments[0].enrolled);
    ASSERT_EQ(state.ratings.size(), 1u);
    EXPECT_EQ(state.ratings[0].value, 4);

    Organization reloaded(OWNER, {}, *ledger, clock);
    ASSERT_TRUE(reloaded.restore(state).ok());
    EXPECT_EQ(reloaded.teacherStats("t1").sum, 4u);
    EXPECT_FALSE(reloaded.getCourse(id)->exists);
}

TEST_F(StateStoreTest, SaveReplacesPreviousState) {
    admitTeachers({"t1"});
    uint64_t a = createCourse("t1", 1, {"t1"}, {10000});
    StateStore store(db);
    ASSERT_TRUE(store.save(org->snapshot()).ok());
    size_t keysBefore = db.count("org:");

    OrganizationState trimmed = org->snapshot();
    trimmed.courses.courses.clear();
    ASSERT_TRUE(store.save(trimmed).ok());
    EXPECT_EQ(db.count("org:"), keysBefore - 1);
    EXPECT_TRUE(store.load().value().courses.courses.empty());
    EXPECT_EQ(store.load().value().courses.nextId, a + 1);

    ASSERT_TRUE(store.erase().ok());
    EXPECT_FALSE(store.hasState());
    EXPECT_EQ(db.count("org:"), 0u);
}

TEST_F(StateStoreTest, RolledBackConfirmLeavesNoPayment) {
    admitTeachers({"t1"});
    admitStudents({"s1"});
    uint64_t id = createCourse("t1", 100, {"t1"}, {10000});
    ASSERT_TRUE(org->applyToCourse("s1", id).ok());
    ASSERT_TRUE(org->teacherVoteOnEnrollment("t1", id, "s1", true).ok());
    fund("s1", 100);

    StateStore store(db);
    ASSERT_TRUE(store.save(org->snapshot()).ok());
    const Account treasury = org->treasuryAccount();

    {
        database::Transaction tx(db);
        ASSERT_TRUE(tx.active());
        ASSERT_TRUE(org->confirmEnrollment("s1", id).ok());
        EXPECT_EQ(ledger->balanceOf(treasury), 100u);
    }
    EXPECT_EQ(ledger->balanceOf("s1"), 100u);
    EXPECT_EQ(ledger->balanceOf(treasury), 0u);

    auto state = store.load();
    ASSERT_TRUE(state.ok()) << state.error().message;
    Organization retry(OWNER, {}, *ledger, clock);
    ASSERT_TRUE(retry.restore(state.value()).ok());
    {
        database::Transaction tx(db);
        ASSERT_TRUE(tx.active());
        ASSERT_TRUE(retry.confirmEnrollment("s1", id).ok());
        ASSERT_TRUE(store.save(retry.snapshot()).ok());
        ASSERT_TRUE(tx.commit());
    }

    state = store.load();
    ASSERT_TRUE(state.ok()) << state.error().message;
    Organization reloaded(OWNER, {}, *ledger, clock);
    ASSERT_TRUE(reloaded.restore(state.value()).ok());
    EXPECT_EQ(reloaded.confirmEnrollment("s1", id).code(), ErrorCode::NOT_PENDING_OR_NOT_ACCEPTED);
    EXPECT_EQ(ledger->balanceOf("s1"), 0u);
    EXPECT_EQ(ledger->balanceOf(treasury), 100u);
}

TEST_F(StateStoreTest, LedgerKeysAreUntouched) {
    ASSERT_TRUE(ledger->mint("alice", 9));
    StateStore store(db);
    ASSERT_TRUE(store.save(org->snapshot()).ok());
    ASSERT_TRUE(store.erase().ok());
    EXPECT_EQ(ledger->balanceOf("alice"), 9u);
}

TEST_F(StateStoreTest, CorruptStateIsReported) {
    StateStore store(db);
    ASSERT_TRUE(store.save(org->snapshot()).ok());

    ASSERT_TRUE(db.put("org:proposal:00000000000000000001", std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(store.load().code(), ErrorCode::SERIALIZATION_ERROR);
}

TEST_F(StateStoreTest, UnknownFormatVersionIsRejected) {
    StateStore store(db);
    ASSERT_TRUE(store.save(org->snapshot()).ok());

    utils::ByteBuffer bumped;
    bumped.writeUint32(StateStore::FORMAT_VERSION + 1);
    auto rest = db.get("org:meta");
    std::vector<uint8_t> data = bumped.data();
    data.insert(data.end(), rest.begin() + 4, rest.end());
    ASSERT_TRUE(db.put("org:meta", data));
    EXPECT_EQ(store.load().code(), ErrorCode::SERIALIZATION_ERROR);
}

TEST(StateStoreCodecTest, CourseEncodingKeepsTeacherOrder) {
    Course c;
    c.id = 3;
    c.title = "Rust for C++ people";
    c.price = 250;
    c.teachers = {"zed", "amy"};
    c.shares = {{"zed", 7000}, {"amy", 3000}};
    c.creator = "zed";
    c.exists = true;

    Course back = StateStore::decodeCourse(StateStore::encodeCourse(c));
    EXPECT_EQ(back.teachers, c.teachers);
    EXPECT_EQ(back.shareOf("zed"), 7000u);
    EXPECT_EQ(back.title, c.title);
    EXPECT_TRUE(back.exists);

    auto bytes = StateStore::encodeCourse(c);
    bytes.push_back(0);
    EXPECT_THROW(StateStore::decodeCourse(bytes), std::runtime_error);
}
