#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace coursedao {
namespace core {

using Account = std::string;
using Amount = uint64_t;

constexpr uint32_t BASIS_POINTS = 10000;
constexpr uint64_t DEFAULT_PROPOSAL_DURATION = 180;
constexpr uint64_t DEFAULT_RATING_WEIGHT = 100;
constexpr uint8_t MIN_RATING = 1;
constexpr uint8_t MAX_RATING = 5;

inline bool isZeroAccount(const Account& account) { return account.empty(); }

enum class Role : uint8_t {
    NONE = 0,
    BOARD = 1,
    TEACHER = 2,
    STUDENT = 3
};

const char* roleToString(Role role);
bool roleFromString(const std::string& name, Role& out);
inline bool isMemberRole(Role role) {
    return role == Role::BOARD || role == Role::TEACHER || role == Role::STUDENT;
}

// floor(a * b / d) without intermediate overflow. d must be non-zero.
Amount mulDivFloor(Amount a, uint64_t b, uint64_t d);

struct Payout {
    Account to;
    Amount amount;
};

}
}
