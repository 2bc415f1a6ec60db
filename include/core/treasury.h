#pragma once

#include "core/types.h"
#include "core/token_ledger.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <string>
#include <vector>

namespace coursedao {
namespace core {

// The organization's pooled funds, held on the ledger under one account.
class Treasury {
public:
    Treasury(TokenLedger& paymentToken, const Account& account);

    const Account& account() const { return account_; }
    std::string paymentSymbol() const;
    Amount balance() const;
    Amount balanceOf(const std::string& symbol) const;

    void attachToken(TokenLedger& token);
    bool hasToken(const std::string& symbol) const;

    // Pulls an approved payment from payer into the treasury.
    Result<void> pullPayment(const Account& payer, Amount amount);
    Result<void> pay(const Account& to, Amount amount);
    // Skips zero entries; either every payout lands or none does.
    Result<Amount> payMany(const std::vector<Payout>& payouts);
    Result<void> payToken(const std::string& symbol, const Account& to, Amount amount);

private:
    TokenLedger& payment_;
    Account account_;
    std::map<std::string, TokenLedger*> tokens_;
};

}
}
