#include "database/state_store.h"
#include "database/database.h"
#include "utils/serialize.h"
#include "utils/logger.h"
#include <cstdio>
#include <set>
#include <stdexcept>

namespace coursedao {
namespace database {

namespace {

const std::string PREFIX = "org:";
const std::string META_KEY = "org:meta";
const std::string ROLES_KEY = "org:roles";
const std::string PROPOSAL_PREFIX = "org:proposal:";
const std::string COURSE_PREFIX = "org:course:";
const std::string ENROLLMENT_PREFIX = "org:enrollment:";
const std::string RATINGS_KEY = "org:ratings";

// Zero padded so the database's key order matches numeric order.
std::string indexKey(const std::string& prefix, uint64_t n) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(n));
    return prefix + buf;
}

void writeAccountSet(utils::ByteBuffer& buf, const std::set<core::Account>& accounts) {
    buf.writeStringList(std::vector<std::string>(accounts.begin(), accounts.end()));
}

std::set<core::Account> readAccountSet(utils::ByteBuffer& buf) {
    auto list = buf.readStringList();
    return std::set<core::Account>(list.begin(), list.end());
}

core::Role readRole(utils::ByteBuffer& buf) {
    uint8_t raw = buf.readUint8();
    if (raw > static_cast<uint8_t>(core::Role::STUDENT)) {
        throw std::runtime_error("role value out of range");
    }
    return static_cast<core::Role>(raw);
}

void expectEnd(const utils::ByteBuffer& buf, const char* what) {
    if (!buf.atEnd()) throw std::runtime_error(std::string("trailing bytes in ") + what);
}

}

StateStore::StateStore(Database& db) : db_(db) {}

bool StateStore::hasState() const {
    return db_.exists(META_KEY);
}

std::vector<uint8_t> StateStore::encodeProposal(const core::Proposal& p) {
    utils::ByteBuffer buf;
    buf.writeUint64(p.id);
    buf.writeString(p.candidate);
    buf.writeUint8(static_cast<uint8_t>(p.roleToAdd));
    buf.writeString(p.proposer);
    buf.writeUint32(p.votesFor);
    buf.writeUint32(p.votesAgainst);
    writeAccountSet(buf, p.voted);
    buf.writeUint64(p.start);
    buf.writeUint64(p.end);
    buf.writeBool(p.executed);
    buf.writeBool(p.granted);
    return buf.data();
}

core::Proposal StateStore::decodeProposal(const std::vector<uint8_t>& data) {
    utils::ByteBuffer buf(data);
    core::Proposal p;
    p.id = buf.readUint64();
    p.candidate = buf.readString();
    p.roleToAdd = readRole(buf);
    p.proposer = buf.readString();
    p.votesFor = buf.readUint32();
    p.votesAgainst = buf.readUint32();
    p.voted = readAccountSet(buf);
    p.start = buf.readUint64();
    p.end = buf.readUint64();
    p.executed = buf.readBool();
    p.granted = buf.readBool();
    expectEnd(buf, "proposal");
    return p;
}

std::vector<uint8_t> StateStore::encodeCourse(const core::Course& c) {
    utils::ByteBuffer buf;
    buf.writeUint64(c.id);
    buf.writeString(c.title);
    buf.writeUint64(c.price);
    buf.writeVarInt(c.teachers.size());
    for (const auto& t : c.teachers) {
        buf.writeString(t);
        buf.writeUint32(c.shareOf(t));
    }
    buf.writeString(c.creator);
    buf.writeUint64(c.createdAt);
    buf.writeBool(c.exists);
    return buf.data();
}

core::Course StateStore::decodeCourse(const std::vector<uint8_t>& data) {
    utils::ByteBuffer buf(data);
    core::Course c;
    c.id = buf.readUint64();
    c.title = buf.readString();
    c.price = buf.readUint64();
    uint64_t n = buf.readVarInt();
    for (uint64_t i = 0; i < n; i++) {
        std::string teacher = buf.readString();
        c.shares[teacher] = buf.readUint32();
        c.teachers.push_back(teacher);
    }
    c.creator = buf.readString();
    c.createdAt = buf.readUint64();
    c.exists = buf.readBool();
    expectEnd(buf, "course");
    return c;
}

std::vector<uint8_t> StateStore::encodeEnrollment(const core::EnrollmentRequest& e) {
    utils::ByteBuffer buf;
    buf.writeUint64(e.courseId);
    buf.writeString(e.student);
    buf.writeBool(e.exists);
    buf.writeUint32(e.votesFor);
    buf.writeUint32(e.votesAgainst);
    writeAccountSet(buf, e.teacherVoted);
    buf.writeBool(e.decided);
    buf.writeBool(e.acceptedByTeachers);
    buf.writeBool(e.enrolled);
    buf.writeBool(e.completed);
    buf.writeUint32(e.attempts);
    buf.writeUint64(e.appliedAt);
    return buf.data();
}

core::EnrollmentRequest StateStore::decodeEnrollment(const std::vector<uint8_t>& data) {
    utils::ByteBuffer buf(data);
    core::EnrollmentRequest e;
    e.courseId = buf.readUint64();
    e.student = buf.readString();
    e.exists = buf.readBool();
    e.votesFor = buf.readUint32();
    e.votesAgainst = buf.readUint32();
    e.teacherVoted = readAccountSet(buf);
    e.decided = buf.readBool();
    e.acceptedByTeachers = buf.readBool();
    e.enrolled = buf.readBool();
    e.completed = buf.readBool();
    e.attempts = buf.readUint32();
    e.appliedAt = buf.readUint64();
    expectEnd(buf, "enrollment");
    return e;
}

Result<void> StateStore::save(const core::OrganizationState& state) {
    WriteBatch batch;
    std::set<std::string> written;
    auto put = [&](const std::string& key, const std::vector<uint8_t>& value) {
        batch.put(key, value);
        written.insert(key);
    };

    utils::ByteBuffer meta;
    meta.writeUint32(FORMAT_VERSION);
    meta.writeString(state.owner);
    meta.writeString(state.treasuryAccount);
    meta.writeUint64(state.proposals.nextId);
    meta.writeUint64(state.proposals.duration);
    meta.writeUint64(state.courses.nextId);
    put(META_KEY, meta.data());

    utils::ByteBuffer roles;
    roles.writeVarInt(state.roles.size());
    for (const auto& [account, role] : state.roles) {
        roles.writeString(account);
        roles.writeUint8(static_cast<uint8_t>(role));
    }
    put(ROLES_KEY, roles.data());

    for (const auto& p : state.proposals.proposals) {
        put(indexKey(PROPOSAL_PREFIX, p.id), encodeProposal(p));
    }
    for (const auto& c : state.courses.courses) {
        put(indexKey(COURSE_PREFIX, c.id), encodeCourse(c));
    }
    for (size_t i = 0; i < state.enrollments.size(); i++) {
        put(indexKey(ENROLLMENT_PREFIX, i), encodeEnrollment(state.enrollments[i]));
    }

    utils::ByteBuffer ratings;
    ratings.writeVarInt(state.ratings.size());
    for (const auto& r : state.ratings) {
        ratings.writeUint64(r.courseId);
        ratings.writeString(r.student);
        ratings.writeString(r.teacher);
        ratings.writeUint8(r.value);
    }
    put(RATINGS_KEY, ratings.data());

    for (const auto& key : db_.keys(PREFIX)) {
        if (!written.count(key)) batch.del(key);
    }

    size_t ops = batch.size();
    if (!db_.write(batch)) {
        return makeError(ErrorCode::DATABASE_ERROR, "failed to write organization state", db_.getPath());
    }
    LOG_CAT(DEBUG, "state", "saved organization state (" + std::to_string(ops) + " writes)");
    return {};
}

std::vector<std::vector<uint8_t>> StateStore::rawValues(const std::string& prefix) const {
    std::vector<std::vector<uint8_t>> values;
    db_.forEach(prefix, [&](const std::string&, const std::vector<uint8_t>& value) {
        values.push_back(value);
        return true;
    });
    return values;
}

Result<core::OrganizationState> StateStore::load() const {
    std::vector<uint8_t> metaData;
    if (!db_.get(META_KEY, metaData)) {
        return makeError(ErrorCode::DATABASE_ERROR, "no organization state stored", db_.getPath());
    }

    core::OrganizationState state;
    try {
        utils::ByteBuffer meta(metaData);
        uint32_t version = meta.readUint32();
        if (version != FORMAT_VERSION) {
            return makeError(ErrorCode::SERIALIZATION_ERROR,
                             "unsupported state format version " + std::to_string(version));
        }
        state.owner = meta.readString();
        state.treasuryAccount = meta.readString();
        state.proposals.nextId = meta.readUint64();
        state.proposals.duration = meta.readUint64();
        state.courses.nextId = meta.readUint64();
        expectEnd(meta, "meta");

        utils::ByteBuffer roles(db_.get(ROLES_KEY));
        uint64_t roleCount = roles.readVarInt();
        for (uint64_t i = 0; i < roleCount; i++) {
            std::string account = roles.readString();
            state.roles.emplace_back(account, readRole(roles));
        }
        expectEnd(roles, "roles");

        for (const auto& value : rawValues(PROPOSAL_PREFIX)) {
            state.proposals.proposals.push_back(decodeProposal(value));
        }
        for (const auto& value : rawValues(COURSE_PREFIX)) {
            state.courses.courses.push_back(decodeCourse(value));
        }
        for (const auto& value : rawValues(ENROLLMENT_PREFIX)) {
            state.enrollments.push_back(decodeEnrollment(value));
        }

        utils::ByteBuffer ratings(db_.get(RATINGS_KEY));
        uint64_t ratingCount = ratings.readVarInt();
        for (uint64_t i = 0; i < ratingCount; i++) {
            core::RatingEntry r;
            r.courseId = ratings.readUint64();
            r.student = ratings.readString();
            r.teacher = ratings.readString();
            r.value = ratings.readUint8();
            state.ratings.push_back(r);
        }
        expectEnd(ratings, "ratings");
    } catch (const std::exception& e) {
        LOG_CAT(ERROR, "state", std::string("corrupt organization state: ") + e.what());
        return makeError(ErrorCode::SERIALIZATION_ERROR, e.what(), db_.getPath());
    }
    return state;
}

Result<void> StateStore::erase() {
    WriteBatch batch;
    for (const auto& key : db_.keys(PREFIX)) batch.del(key);
    if (!db_.write(batch)) {
        return makeError(ErrorCode::DATABASE_ERROR, "failed to erase organization state", db_.getPath());
    }
    return {};
}

}
}
