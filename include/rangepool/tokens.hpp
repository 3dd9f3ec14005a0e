#ifndef RANGEPOOL_TOKENS_HPP
#define RANGEPOOL_TOKENS_HPP

#include <map>
#include <utility>

#include "types.hpp"
#include "callbacks.hpp"

namespace rangepool {

// =============================================================================
// Token Capability
// =============================================================================

// Balance query and transfer for any token. transfer() moves the full amount
// or throws; there is no partial transfer.
class ITokens {
public:
    virtual ~ITokens() = default;

    virtual U256 balance_of(const Currency& token, const Address& account) const = 0;
    virtual void transfer(const Currency& token, const Address& from,
                          const Address& to, const U256& amount) = 0;
};

// =============================================================================
// TokenLedger - in-memory balances
// =============================================================================

class TokenLedger : public ITokens {
public:
    using Balances = std::map<std::pair<Address, Address>, U256>;  // (token, account)

    TokenLedger() = default;

    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // Mint `amount` of `token` to `account` out of thin air
    void credit(const Currency& token, const Address& account, const U256& amount);

    U256 balance_of(const Currency& token, const Address& account) const override;

    // Throws PoolError(INSUFFICIENT_BALANCE) on overdraft
    void transfer(const Currency& token, const Address& from,
                  const Address& to, const U256& amount) override;

    // Run `fn`; if it throws, every balance is restored before rethrowing
    template <typename Fn>
    auto transact(Fn&& fn) -> decltype(fn()) {
        Balances snapshot = balances_;
        try {
            return fn();
        } catch (...) {
            balances_ = std::move(snapshot);
            throw;
        }
    }

    size_t accounts() const { return balances_.size(); }

private:
    Balances balances_;
};

// =============================================================================
// LedgerPayer - pays pool callbacks from a funded account
// =============================================================================

class LedgerPayer : public IMintCallback, public ISwapCallback {
public:
    LedgerPayer(ITokens& tokens, const Address& payer, const Address& pool,
                const Currency& token0, const Currency& token1)
        : tokens_(tokens), payer_(payer), pool_(pool),
          token0_(token0), token1_(token1) {}

    // Pay this much less than owed on every callback (tests)
    void set_shortfall(const U256& shortfall) { shortfall_ = shortfall; }

    void on_mint(const U256& amount0, const U256& amount1,
                 const std::vector<uint8_t>& data) override;

    void on_swap(const I256& amount0, const I256& amount1,
                 const std::vector<uint8_t>& data) override;

    uint64_t calls() const { return calls_; }

private:
    void pay(const Currency& token, const U256& amount);

    ITokens& tokens_;
    Address payer_;
    Address pool_;
    Currency token0_;
    Currency token1_;
    U256 shortfall_{0};
    uint64_t calls_{0};
};

} // namespace rangepool

#endif // RANGEPOOL_TOKENS_HPP
