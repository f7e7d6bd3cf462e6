// VELOCK - Stake Ledger
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Vote-escrow staking: accounts lock the asset for a bounded number of
// epochs and receive voting power equal to the undecayed remainder of
// their locks. The ledger keeps one DecayLine per account and one
// aggregate DecayLine, and answers point-in-time power queries in time
// proportional to the epochs between the query and the line's anchor.
//
// Key features:
// - Lock / unlock with all-or-nothing rollback on transfer failure
// - Voting power and total voting power at any epoch
// - Aggregate line kept equal to the sum of account lines
// - Snapshot serialization

#ifndef VELOCK_STAKING_LEDGER_H
#define VELOCK_STAKING_LEDGER_H

#include <velock/core/result.h>
#include <velock/core/types.h>
#include <velock/staking/asset.h>
#include <velock/staking/decayline.h>
#include <velock/staking/epoch.h>
#include <velock/util/callguard.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace velock {

namespace util {
class ConfigManager;
}

namespace staking {

// ============================================================================
// Ledger Parameters
// ============================================================================

struct LedgerParams {
    /// Unix time at which epoch 1 begins
    Timestamp originTime{0};

    /// Seconds per epoch
    int64_t epochWidth{DEFAULT_EPOCH_WIDTH};

    /// Shortest allowed lock
    Epoch minLockEpochs{MIN_LOCK_EPOCHS};

    /// Longest allowed lock; 0 means four years of epochs
    Epoch maxLockEpochs{0};

    /// maxLockEpochs with the four-year default resolved
    Epoch GetMaxLockEpochs() const;

    bool IsValid(std::string* error = nullptr) const;

    /// Read the [ledger] section, falling back to the defaults above
    static std::optional<LedgerParams> FromConfig(const util::ConfigManager& config,
                                                  std::string* error = nullptr);
};

// ============================================================================
// Ledger Snapshot
// ============================================================================

struct LedgerSnapshot {
    std::map<AccountId, DecayLine> stakes;
    DecayLine total;
};

// ============================================================================
// Stake Ledger
// ============================================================================

class StakeLedger {
public:
    /// Serialization format version
    static constexpr uint32_t SERIALIZATION_VERSION = 1;

    /**
     * @param params  Validated parameters (IsValid() must hold)
     * @param asset   Asset moved in and out of custody; must outlive the ledger
     * @param custody Account holding locked principal
     * @throws std::invalid_argument on invalid params
     */
    StakeLedger(const LedgerParams& params, IAsset& asset, const AccountId& custody);

    StakeLedger(const StakeLedger&) = delete;
    StakeLedger& operator=(const StakeLedger&) = delete;

    // ========================================================================
    // Commands
    // ========================================================================

    /**
     * Lock amount for durationEpochs starting at the current epoch.
     *
     * Fails with InvalidDuration outside [minLockEpochs, maxLockEpochs],
     * InvalidAmount when amount / durationEpochs is zero,
     * ArithmeticOverflow when total deposits would overflow, and
     * TransferFailed when the asset refuses the transfer. No state
     * changes on failure.
     */
    OpResult Lock(const AccountId& account, Amount amount, Epoch durationEpochs);

    /**
     * Withdraw the principal no longer backing any remaining decay.
     * Withdrawing nothing is a success and makes no asset call.
     */
    OpResult Unlock(const AccountId& account, Amount* withdrawn = nullptr);

    // ========================================================================
    // Queries (empty only on ArithmeticUnderflow)
    // ========================================================================

    Epoch CurrentEpoch() const { return clock_.CurrentEpoch(); }

    std::optional<Amount> VotingPowerAt(const AccountId& account, Epoch epoch) const;
    std::optional<Amount> CurrentVotingPower(const AccountId& account) const;

    std::optional<Amount> TotalVotingPowerAt(Epoch epoch) const;
    std::optional<Amount> CurrentTotalVotingPower() const;

    /// Principal held for an account
    Amount GetDeposited(const AccountId& account) const;
    Amount GetTotalDeposited() const;

    /// What Unlock would transfer right now
    std::optional<Amount> GetWithdrawable(const AccountId& account) const;

    size_t GetAccountCount() const;
    std::vector<AccountId> GetAccounts() const;

    std::optional<DecayLine> GetStake(const AccountId& account) const;
    DecayLine GetTotalStake() const;

    /// Every account line together with the aggregate, taken under one lock
    LedgerSnapshot GetSnapshot() const;

    /**
     * Verify the aggregate line equals the sum of account lines at epoch
     * (bias and slope) and that deposited principal sums match.
     */
    bool CheckConsistency(Epoch epoch, std::string* error = nullptr) const;

    const LedgerParams& GetParams() const { return params_; }
    const EpochClock& GetClock() const { return clock_; }

    /// Replace the clock's time source (tests, simulations)
    void SetTimeSource(EpochClock::TimeSource source);

    // ========================================================================
    // Persistence
    // ========================================================================

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

    /// Replace all stakes. Rejected (state untouched) if inconsistent.
    bool RestoreState(std::map<AccountId, DecayLine> stakes, DecayLine total,
                      std::string* error = nullptr);

private:
    /// Run fn under mutex_, or without locking when the calling thread is
    /// inside this ledger's external call and therefore already holds it
    template<typename Fn>
    auto Guarded(Fn&& fn) const -> decltype(fn()) {
        if (callGuard_.IsCurrentThreadInside()) {
            return fn();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return fn();
    }

    static bool CheckConsistencyOf(const std::map<AccountId, DecayLine>& stakes,
                                   const DecayLine& total, Epoch epoch,
                                   std::string* error);

    LedgerParams params_;
    EpochClock clock_;
    IAsset& asset_;
    AccountId custody_;

    std::map<AccountId, DecayLine> stakes_;
    DecayLine total_;

    mutable std::mutex mutex_;
    util::ExternalCallGuard callGuard_;
};

} // namespace staking
} // namespace velock

#endif // VELOCK_STAKING_LEDGER_H
