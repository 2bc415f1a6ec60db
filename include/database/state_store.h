#pragma once

#include "core/organization.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>

namespace coursedao {
namespace database {

class Database;

// Persists OrganizationState under the "org:" prefix of a key/value
// database. A save replaces the previous state in one batch.
class StateStore {
public:
    static constexpr uint32_t FORMAT_VERSION = 1;

    explicit StateStore(Database& db);

    bool hasState() const;
    Result<void> save(const core::OrganizationState& state);
    Result<core::OrganizationState> load() const;
    Result<void> erase();

    static std::vector<uint8_t> encodeProposal(const core::Proposal& p);
    static core::Proposal decodeProposal(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> encodeCourse(const core::Course& c);
    static core::Course decodeCourse(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> encodeEnrollment(const core::EnrollmentRequest& e);
    static core::EnrollmentRequest decodeEnrollment(const std::vector<uint8_t>& data);

private:
    Database& db_;

    std::vector<std::vector<uint8_t>> rawValues(const std::string& prefix) const;
};

}
}
