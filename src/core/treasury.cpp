#include "core/treasury.h"
#include "utils/logger.h"

namespace coursedao {
namespace core {

Treasury::Treasury(TokenLedger& paymentToken, const Account& account)
    : payment_(paymentToken), account_(account) {
    tokens_[payment_.symbol()] = &payment_;
}

std::string Treasury::paymentSymbol() const {
    return payment_.symbol();
}

Amount Treasury::balance() const {
    return payment_.balanceOf(account_);
}

Amount Treasury::balanceOf(const std::string& symbol) const {
    auto it = tokens_.find(symbol);
    return it != tokens_.end() ? it->second->balanceOf(account_) : 0;
}

void Treasury::attachToken(TokenLedger& token) {
    tokens_[token.symbol()] = &token;
}

bool Treasury::hasToken(const std::string& symbol) const {
    return tokens_.count(symbol) > 0;
}

Result<void> Treasury::pullPayment(const Account& payer, Amount amount) {
    if (!payment_.transferFrom(account_, payer, account_, amount)) {
        return makeError(ErrorCode::PAYMENT_FAILED,
                         "ledger refused to move " + std::to_string(amount) + " from payer");
    }
    LOG_CAT(INFO, "treasury", "received " + std::to_string(amount) + " " + payment_.symbol() +
            " from " + utils::Logger::redactAddress(payer));
    return {};
}

Result<void> Treasury::pay(const Account& to, Amount amount) {
    if (balance() < amount) {
        return makeError(ErrorCode::INSUFFICIENT_TREASURY, "treasury holds less than " + std::to_string(amount));
    }
    if (!payment_.transfer(account_, to, amount)) {
        return makeError(ErrorCode::TRANSFER_FAILED, "ledger refused treasury transfer");
    }
    LOG_CAT(INFO, "treasury", "paid " + std::to_string(amount) + " " + payment_.symbol() +
            " to " + utils::Logger::redactAddress(to));
    return {};
}

Result<Amount> Treasury::payMany(const std::vector<Payout>& payouts) {
    std::vector<Payout> nonZero;
    Amount total = 0;
    for (const auto& p : payouts) {
        if (p.amount == 0) continue;
        nonZero.push_back(p);
        total += p.amount;
    }
    if (balance() < total) {
        return makeError(ErrorCode::INSUFFICIENT_TREASURY, "treasury holds less than " + std::to_string(total));
    }
    if (nonZero.empty()) return Amount{0};
    if (!payment_.transferBatch(account_, nonZero)) {
        return makeError(ErrorCode::TRANSFER_FAILED, "ledger refused batch payout");
    }
    LOG_CAT(INFO, "treasury", "paid " + std::to_string(total) + " " + payment_.symbol() +
            " to " + std::to_string(nonZero.size()) + " recipients");
    return total;
}

Result<void> Treasury::payToken(const std::string& symbol, const Account& to, Amount amount) {
    auto it = tokens_.find(symbol);
    if (it == tokens_.end()) {
        return makeError(ErrorCode::UNKNOWN_TOKEN, "no ledger attached for " + symbol);
    }
    if (it->second->balanceOf(account_) < amount) {
        return makeError(ErrorCode::INSUFFICIENT_TREASURY, "treasury holds less than " + std::to_string(amount) + " " + symbol);
    }
    if (!it->second->transfer(account_, to, amount)) {
        return makeError(ErrorCode::TRANSFER_FAILED, "ledger refused " + symbol + " transfer");
    }
    return {};
}

}
}
