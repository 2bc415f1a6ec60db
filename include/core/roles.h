#pragma once

#include "core/types.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <vector>

namespace coursedao {
namespace core {

// Which account holds which role. One role per account, no removal path.
class RoleRegistry {
public:
    Role roleOf(const Account& account) const;
    bool hasRole(const Account& account, Role role) const;

    // Members in admission order.
    std::vector<Account> members(Role role) const;
    size_t memberCount(Role role) const;

    Result<void> grant(const Account& account, Role role);

    // Construction-time board seeding; skips the proposal path but keeps
    // role exclusivity.
    Result<void> seed(const std::vector<Account>& board);

    std::vector<std::pair<Account, Role>> entries() const;
    Result<void> restore(const std::vector<std::pair<Account, Role>>& entries);
    void clear();

private:
    std::map<Account, Role> roles_;
    std::vector<Account> boards_;
    std::vector<Account> teachers_;
    std::vector<Account> students_;

    void insert(const Account& account, Role role);
    std::vector<Account>& listFor(Role role);
    const std::vector<Account>* listFor(Role role) const;
};

}
}
