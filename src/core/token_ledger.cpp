#include "core/token_ledger.h"
#include "database/database.h"
#include "utils/logger.h"
#include <map>
#include <mutex>
#include <limits>

namespace coursedao {
namespace core {

static void writeU64(std::vector<uint8_t>& out, uint64_t val) {
    for (int i = 0; i < 8; i++) out.push_back((val >> (i * 8)) & 0xff);
}

static uint64_t readU64(const std::vector<uint8_t>& in) {
    if (in.size() < 8) return 0;
    uint64_t val = 0;
    for (int i = 0; i < 8; i++) val |= static_cast<uint64_t>(in[i]) << (i * 8);
    return val;
}

static std::vector<uint8_t> encode(uint64_t val) {
    std::vector<uint8_t> out;
    writeU64(out, val);
    return out;
}

struct SqliteTokenLedger::Impl {
    database::Database& db;
    std::string symbol;
    mutable std::mutex mtx;

    Impl(database::Database& d, const std::string& s) : db(d), symbol(s) {}

    std::string balanceKey(const Account& account) const {
        return "ledger:" + symbol + ":bal:" + account;
    }

    std::string allowanceKey(const Account& owner, const Account& spender) const {
        return "ledger:" + symbol + ":allow:" + owner + ":" + spender;
    }

    std::string supplyKey() const {
        return "ledger:" + symbol + ":supply";
    }

    uint64_t read(const std::string& key) const {
        return readU64(db.get(key));
    }

    // Applies balance deltas: debits first, then credits, all in one batch.
    bool apply(const std::map<Account, Amount>& debits,
               const std::map<Account, Amount>& credits,
               database::WriteBatch& batch) {
        std::map<Account, Amount> balances;
        for (const auto& [account, amount] : debits) {
            Amount bal = read(balanceKey(account));
            if (bal < amount) return false;
            balances[account] = bal - amount;
        }
        for (const auto& [account, amount] : credits) {
            auto it = balances.find(account);
            Amount bal = it != balances.end() ? it->second : read(balanceKey(account));
            if (bal > std::numeric_limits<Amount>::max() - amount) return false;
            balances[account] = bal + amount;
        }
        for (const auto& [account, bal] : balances) {
            batch.put(balanceKey(account), encode(bal));
        }
        return db.write(batch);
    }
};

SqliteTokenLedger::SqliteTokenLedger(database::Database& db, const std::string& symbol)
    : impl_(std::make_unique<Impl>(db, symbol)) {}

SqliteTokenLedger::~SqliteTokenLedger() = default;

std::string SqliteTokenLedger::symbol() const {
    return impl_->symbol;
}

Amount SqliteTokenLedger::balanceOf(const Account& account) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->read(impl_->balanceKey(account));
}

Amount SqliteTokenLedger::allowance(const Account& owner, const Account& spender) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->read(impl_->allowanceKey(owner, spender));
}

Amount SqliteTokenLedger::totalSupply() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->read(impl_->supplyKey());
}

bool SqliteTokenLedger::approve(const Account& owner, const Account& spender, Amount amount) {
    if (isZeroAccount(owner) || isZeroAccount(spender)) return false;
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db.put(impl_->allowanceKey(owner, spender), encode(amount));
}

bool SqliteTokenLedger::transfer(const Account& from, const Account& to, Amount amount) {
    if (isZeroAccount(from) || isZeroAccount(to)) return false;
    std::lock_guard<std::mutex> lock(impl_->mtx);
    database::WriteBatch batch;
    bool ok = impl_->apply({{from, amount}}, {{to, amount}}, batch);
    if (ok) {
        LOG_TRACE("ledger " + impl_->symbol + " transfer " + std::to_string(amount));
    }
    return ok;
}

bool SqliteTokenLedger::transferFrom(const Account& spender, const Account& payer,
                                     const Account& recipient, Amount amount) {
    if (isZeroAccount(spender) || isZeroAccount(payer) || isZeroAccount(recipient)) return false;
    std::lock_guard<std::mutex> lock(impl_->mtx);

    std::string allowKey = impl_->allowanceKey(payer, spender);
    Amount allowed = impl_->read(allowKey);
    if (allowed < amount) return false;

    database::WriteBatch batch;
    batch.put(allowKey, encode(allowed - amount));
    return impl_->apply({{payer, amount}}, {{recipient, amount}}, batch);
}

bool SqliteTokenLedger::transferBatch(const Account& from, const std::vector<Payout>& payouts) {
    if (isZeroAccount(from)) return false;
    std::lock_guard<std::mutex> lock(impl_->mtx);

    Amount total = 0;
    std::map<Account, Amount> credits;
    for (const auto& p : payouts) {
        if (isZeroAccount(p.to)) return false;
        if (total > std::numeric_limits<Amount>::max() - p.amount) return false;
        total += p.amount;
        Amount& slot = credits[p.to];
        if (slot > std::numeric_limits<Amount>::max() - p.amount) return false;
        slot += p.amount;
    }
    if (total == 0) return true;

    // Self-payments net out against the debit.
    auto self = credits.find(from);
    Amount selfCredit = 0;
    if (self != credits.end()) {
        selfCredit = self->second;
        credits.erase(self);
    }
    if (impl_->read(impl_->balanceKey(from)) < total) return false;

    database::WriteBatch batch;
    return impl_->apply({{from, total - selfCredit}}, credits, batch);
}

bool SqliteTokenLedger::mint(const Account& to, Amount amount) {
    if (isZeroAccount(to)) return false;
    std::lock_guard<std::mutex> lock(impl_->mtx);

    Amount supply = impl_->read(impl_->supplyKey());
    if (supply > std::numeric_limits<Amount>::max() - amount) return false;

    database::WriteBatch batch;
    batch.put(impl_->supplyKey(), encode(supply + amount));
    return impl_->apply({}, {{to, amount}}, batch);
}

}
}
