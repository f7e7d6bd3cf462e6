// VELOCK - Asset Interface
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// The staking ledger never holds balances itself. It moves the locked asset
// through IAsset, which any fungible token implementation can provide.
// TokenLedger is a minimal in-memory token used by the simulator and tests.

#ifndef VELOCK_STAKING_ASSET_H
#define VELOCK_STAKING_ASSET_H

#include <velock/core/types.h>

#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace velock {
namespace staking {

// ============================================================================
// Asset Interface
// ============================================================================

/**
 * Fungible asset as seen by the staking ledger.
 *
 * Implementations must conserve total supply and must report failure
 * (rather than silently doing nothing) on insufficient balance or
 * allowance. Both calls act on behalf of the ledger's custody account.
 */
class IAsset {
public:
    virtual ~IAsset() = default;

    /// Move amount from the custody account to `to`
    virtual bool Transfer(const AccountId& to, Amount amount) = 0;

    /// Move amount from `from` to `to`, spending the custody account's
    /// allowance granted by `from`
    virtual bool TransferFrom(const AccountId& from, const AccountId& to, Amount amount) = 0;
};

// ============================================================================
// Token Ledger
// ============================================================================

/// In-memory balances and allowances
class TokenLedger {
public:
    TokenLedger() = default;

    /// Create new supply; fails on overflow of the total supply
    bool Mint(const AccountId& to, Amount amount);

    /// Set (not add to) the amount spender may move out of owner's balance
    void Approve(const AccountId& owner, const AccountId& spender, Amount amount);

    Amount BalanceOf(const AccountId& account) const;
    Amount Allowance(const AccountId& owner, const AccountId& spender) const;
    Amount TotalSupply() const;

    /// Number of accounts with a non-zero balance
    size_t GetHolderCount() const;

    /// Move from -> to. Fails on insufficient balance.
    bool Transfer(const AccountId& from, const AccountId& to, Amount amount);

    /// Move from -> to on behalf of spender. Fails on insufficient
    /// balance or allowance; nothing changes on failure.
    bool TransferFrom(const AccountId& spender, const AccountId& from,
                      const AccountId& to, Amount amount);

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    /// Caller holds mutex_
    bool MoveLocked(const AccountId& from, const AccountId& to, Amount amount);

    std::map<AccountId, Amount> balances_;
    std::map<std::pair<AccountId, AccountId>, Amount> allowances_;
    Amount totalSupply_{0};
    mutable std::mutex mutex_;
};

/// IAsset view of a TokenLedger acting as one custody account
class TokenAsset : public IAsset {
public:
    TokenAsset(TokenLedger& token, const AccountId& custody)
        : token_(token), custody_(custody) {}

    bool Transfer(const AccountId& to, Amount amount) override {
        return token_.Transfer(custody_, to, amount);
    }

    bool TransferFrom(const AccountId& from, const AccountId& to, Amount amount) override {
        return token_.TransferFrom(custody_, from, to, amount);
    }

    const AccountId& GetCustody() const { return custody_; }

private:
    TokenLedger& token_;
    AccountId custody_;
};

} // namespace staking
} // namespace velock

#endif // VELOCK_STAKING_ASSET_H
