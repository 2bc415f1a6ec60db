#include "core/roles.h"
#include "utils/logger.h"
#include <algorithm>

namespace coursedao {
namespace core {

Role RoleRegistry::roleOf(const Account& account) const {
    auto it = roles_.find(account);
    return it != roles_.end() ? it->second : Role::NONE;
}

bool RoleRegistry::hasRole(const Account& account, Role role) const {
    return role != Role::NONE && roleOf(account) == role;
}

void RoleRegistry::insert(const Account& account, Role role) {
    roles_[account] = role;
    listFor(role).push_back(account);
}

std::vector<Account>& RoleRegistry::listFor(Role role) {
    switch (role) {
        case Role::BOARD: return boards_;
        case Role::TEACHER: return teachers_;
        default: return students_;
    }
}

const std::vector<Account>* RoleRegistry::listFor(Role role) const {
    switch (role) {
        case Role::BOARD: return &boards_;
        case Role::TEACHER: return &teachers_;
        case Role::STUDENT: return &students_;
        default: return nullptr;
    }
}

std::vector<Account> RoleRegistry::members(Role role) const {
    const auto* list = listFor(role);
    return list ? *list : std::vector<Account>{};
}

size_t RoleRegistry::memberCount(Role role) const {
    const auto* list = listFor(role);
    return list ? list->size() : 0;
}

Result<void> RoleRegistry::grant(const Account& account, Role role) {
    if (isZeroAccount(account)) {
        return makeError(ErrorCode::INVALID_ACCOUNT, "cannot grant a role to the zero account");
    }
    if (!isMemberRole(role)) {
        return makeError(ErrorCode::INVALID_ROLE, "cannot grant role NONE");
    }
    Role current = roleOf(account);
    if (current != Role::NONE) {
        return makeError(ErrorCode::ALREADY_IN_ROLE,
                         std::string("account already holds ") + roleToString(current));
    }
    insert(account, role);
    LOG_CAT(INFO, "roles", utils::Logger::redactAddress(account) + " is now " + roleToString(role));
    return {};
}

Result<void> RoleRegistry::seed(const std::vector<Account>& board) {
    for (size_t i = 0; i < board.size(); i++) {
        if (isZeroAccount(board[i])) {
            return makeError(ErrorCode::INVALID_ACCOUNT, "initial board contains the zero account");
        }
        if (roleOf(board[i]) != Role::NONE ||
            std::find(board.begin(), board.begin() + i, board[i]) != board.begin() + i) {
            return makeError(ErrorCode::ALREADY_IN_ROLE, "initial board lists " + board[i] + " twice");
        }
    }
    for (const auto& account : board) {
        insert(account, Role::BOARD);
    }
    return {};
}

std::vector<std::pair<Account, Role>> RoleRegistry::entries() const {
    std::vector<std::pair<Account, Role>> out;
    for (Role role : {Role::BOARD, Role::TEACHER, Role::STUDENT}) {
        for (const auto& account : *listFor(role)) out.emplace_back(account, role);
    }
    return out;
}

Result<void> RoleRegistry::restore(const std::vector<std::pair<Account, Role>>& entries) {
    RoleRegistry fresh;
    for (const auto& [account, role] : entries) {
        if (isZeroAccount(account) || !isMemberRole(role) || fresh.roleOf(account) != Role::NONE) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, "inconsistent role entry for " + account);
        }
        fresh.insert(account, role);
    }
    *this = std::move(fresh);
    return {};
}

void RoleRegistry::clear() {
    roles_.clear();
    boards_.clear();
    teachers_.clear();
    students_.clear();
}

}
}
