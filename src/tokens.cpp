// =============================================================================
// tokens.cpp - In-memory token ledger and callback payer
// =============================================================================

#include "rangepool/tokens.hpp"

namespace rangepool {

// =============================================================================
// TokenLedger
// =============================================================================

void TokenLedger::credit(const Currency& token, const Address& account, const U256& amount) {
    balances_[{token.addr, account}] += amount;
}

U256 TokenLedger::balance_of(const Currency& token, const Address& account) const {
    auto it = balances_.find({token.addr, account});
    return it != balances_.end() ? it->second : U256(0);
}

void TokenLedger::transfer(const Currency& token, const Address& from,
                           const Address& to, const U256& amount) {
    if (amount == 0) return;

    U256 available = balance_of(token, from);
    if (available < amount) {
        throw PoolError(ErrorCode::INSUFFICIENT_BALANCE,
                        "TokenLedger: " + to_hex(from) + " holds " + available.str() +
                        " of " + to_hex(token.addr) + ", needs " + amount.str());
    }

    balances_[{token.addr, from}] = available - amount;
    balances_[{token.addr, to}] += amount;
}

// =============================================================================
// LedgerPayer
// =============================================================================

void LedgerPayer::pay(const Currency& token, const U256& amount) {
    U256 due = amount > shortfall_ ? amount - shortfall_ : U256(0);
    tokens_.transfer(token, payer_, pool_, due);
}

void LedgerPayer::on_mint(const U256& amount0, const U256& amount1,
                          const std::vector<uint8_t>& /*data*/) {
    ++calls_;
    if (amount0 > 0) pay(token0_, amount0);
    if (amount1 > 0) pay(token1_, amount1);
}

void LedgerPayer::on_swap(const I256& amount0, const I256& amount1,
                          const std::vector<uint8_t>& /*data*/) {
    ++calls_;
    // Only the positive side is owed; the negative side was already sent
    if (amount0 > 0) pay(token0_, U256(amount0));
    if (amount1 > 0) pay(token1_, U256(amount1));
}

} // namespace rangepool
