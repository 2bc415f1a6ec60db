#pragma once

#include "core/types.h"
#include <string>
#include <vector>
#include <memory>

namespace coursedao {
namespace database { class Database; }

namespace core {

// Settlement substrate holding fungible balances for one token.
// Every mutating call is all-or-nothing and returns false on refusal.
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    virtual std::string symbol() const = 0;
    virtual Amount balanceOf(const Account& account) const = 0;
    virtual Amount allowance(const Account& owner, const Account& spender) const = 0;

    virtual bool approve(const Account& owner, const Account& spender, Amount amount) = 0;
    virtual bool transfer(const Account& from, const Account& to, Amount amount) = 0;
    // Moves payer funds on behalf of spender, consuming the allowance.
    virtual bool transferFrom(const Account& spender, const Account& payer,
                              const Account& recipient, Amount amount) = 0;
    virtual bool transferBatch(const Account& from, const std::vector<Payout>& payouts) = 0;
    virtual bool mint(const Account& to, Amount amount) = 0;
};

class SqliteTokenLedger : public TokenLedger {
public:
    // db must outlive the ledger.
    SqliteTokenLedger(database::Database& db, const std::string& symbol);
    ~SqliteTokenLedger() override;

    std::string symbol() const override;
    Amount balanceOf(const Account& account) const override;
    Amount allowance(const Account& owner, const Account& spender) const override;

    bool approve(const Account& owner, const Account& spender, Amount amount) override;
    bool transfer(const Account& from, const Account& to, Amount amount) override;
    bool transferFrom(const Account& spender, const Account& payer,
                      const Account& recipient, Amount amount) override;
    bool transferBatch(const Account& from, const std::vector<Payout>& payouts) override;
    bool mint(const Account& to, Amount amount) override;

    Amount totalSupply() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
