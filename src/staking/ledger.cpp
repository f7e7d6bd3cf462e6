// VELOCK - Stake Ledger Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <velock/staking/ledger.h>
#include <velock/core/serialize.h>
#include <velock/util/config.h>
#include <velock/util/logging.h>

#include <stdexcept>

namespace velock {
namespace staking {

// ============================================================================
// LedgerParams
// ============================================================================

Epoch LedgerParams::GetMaxLockEpochs() const {
    if (maxLockEpochs != 0 || epochWidth <= 0) {
        return maxLockEpochs;
    }
    return static_cast<Epoch>(MAX_LOCK_SECONDS / epochWidth);
}

bool LedgerParams::IsValid(std::string* error) const {
    auto fail = [error](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };
    if (epochWidth <= 0) {
        return fail("epoch_width must be positive");
    }
    if (minLockEpochs == 0) {
        return fail("min_lock_epochs must be at least 1");
    }
    if (GetMaxLockEpochs() < minLockEpochs) {
        return fail("max_lock_epochs (" + std::to_string(GetMaxLockEpochs()) +
                    ") is below min_lock_epochs (" + std::to_string(minLockEpochs) + ")");
    }
    return true;
}

std::optional<LedgerParams> LedgerParams::FromConfig(const util::ConfigManager& config,
                                                     std::string* error) {
    namespace keys = util::ConfigKeys;
    const std::string section = keys::LEDGER_SECTION;

    auto fail = [error](const std::string& msg) -> std::optional<LedgerParams> {
        if (error) *error = msg;
        return std::nullopt;
    };

    LedgerParams params;

    if (config.HasKey(keys::EPOCH_WIDTH, section)) {
        auto width = config.TryGetInt(keys::EPOCH_WIDTH, section);
        if (!width) return fail("ledger.epoch_width is not an integer");
        params.epochWidth = *width;
    }
    if (config.HasKey(keys::ORIGIN_TIME, section)) {
        auto origin = config.TryGetInt(keys::ORIGIN_TIME, section);
        if (!origin) return fail("ledger.origin_time is not an integer");
        params.originTime = *origin;
    }
    if (config.HasKey(keys::MIN_LOCK_EPOCHS, section)) {
        auto min = config.TryGetUInt(keys::MIN_LOCK_EPOCHS, section);
        if (!min) return fail("ledger.min_lock_epochs is not a non-negative integer");
        params.minLockEpochs = *min;
    }
    if (config.HasKey(keys::MAX_LOCK_EPOCHS, section)) {
        auto max = config.TryGetUInt(keys::MAX_LOCK_EPOCHS, section);
        if (!max) return fail("ledger.max_lock_epochs is not a non-negative integer");
        params.maxLockEpochs = *max;
    }

    std::string why;
    if (!params.IsValid(&why)) {
        return fail(why);
    }
    return params;
}

// ============================================================================
// StakeLedger - Construction
// ============================================================================

StakeLedger::StakeLedger(const LedgerParams& params, IAsset& asset, const AccountId& custody)
    : params_(params)
    , clock_(params.originTime, params.epochWidth)
    , asset_(asset)
    , custody_(custody) {
    std::string error;
    if (!params_.IsValid(&error)) {
        throw std::invalid_argument("invalid ledger parameters: " + error);
    }
    params_.maxLockEpochs = params_.GetMaxLockEpochs();
}

void StakeLedger::SetTimeSource(EpochClock::TimeSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_.SetTimeSource(std::move(source));
}

// ============================================================================
// StakeLedger - Commands
// ============================================================================

OpResult StakeLedger::Lock(const AccountId& account, Amount amount, Epoch durationEpochs) {
    if (callGuard_.IsCurrentThreadInside()) {
        LOG_WARN(util::LogCategory::STAKE) << "Lock rejected: re-entrant call from "
                                           << account.ToShortString();
        return OpResult::Error(ErrorCode::Reentrancy, "lock called during an asset transfer");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    if (durationEpochs < params_.minLockEpochs || durationEpochs > params_.maxLockEpochs) {
        LogWarnF(util::LogCategory::STAKE, "Lock by %s rejected: duration %llu outside [%llu, %llu]",
                 account.ToShortString().c_str(),
                 static_cast<unsigned long long>(durationEpochs),
                 static_cast<unsigned long long>(params_.minLockEpochs),
                 static_cast<unsigned long long>(params_.maxLockEpochs));
        return OpResult::Error(ErrorCode::InvalidDuration,
                               "duration must be between " + std::to_string(params_.minLockEpochs) +
                               " and " + std::to_string(params_.maxLockEpochs) + " epochs");
    }

    Amount slope = amount / durationEpochs;
    if (slope == 0 || slope > static_cast<Amount>(MAX_SIGNED_AMOUNT)) {
        LogWarnF(util::LogCategory::STAKE, "Lock by %s rejected: amount %llu over %llu epochs",
                 account.ToShortString().c_str(), static_cast<unsigned long long>(amount),
                 static_cast<unsigned long long>(durationEpochs));
        return OpResult::Error(ErrorCode::InvalidAmount,
                               "amount / duration must be a positive slope below 2^63");
    }

    if (amount > MAX_AMOUNT - total_.GetDeposited()) {
        LOG_WARN(util::LogCategory::STAKE) << "Lock by " << account.ToShortString()
                                           << " rejected: total deposits would overflow";
        return OpResult::Error(ErrorCode::ArithmeticOverflow, "total deposits overflow");
    }

    const Epoch now = clock_.CurrentEpoch();
    const Epoch end = now + durationEpochs;
    const SignedAmount rampSlope = static_cast<SignedAmount>(slope);

    auto existing = stakes_.find(account);
    const bool created = existing == stakes_.end();
    DecayLine& stake = created ? stakes_.emplace(account, DecayLine(now)).first->second
                               : existing->second;

    const DecayLine::Checkpoint stakeSaved = stake.Save();
    const DecayLine::Checkpoint totalSaved = total_.Save();
    bool stakeScheduled = false;
    bool totalScheduled = false;

    auto rollback = [&]() {
        if (stakeScheduled) stake.CancelRamp(now, end, amount, rampSlope);
        if (totalScheduled) total_.CancelRamp(now, end, amount, rampSlope);
        stake.Restore(stakeSaved);
        total_.Restore(totalSaved);
        if (created) stakes_.erase(account);
    };

    ErrorCode error = ErrorCode::OK;
    stakeScheduled = stake.ScheduleRamp(now, end, amount, rampSlope, &error);
    if (stakeScheduled) {
        totalScheduled = total_.ScheduleRamp(now, end, amount, rampSlope, &error);
    }
    if (!stakeScheduled || !totalScheduled ||
        !stake.CommitAdvance(now, &error) || !total_.CommitAdvance(now, &error)) {
        rollback();
        LOG_WARN(util::LogCategory::STAKE) << "Lock by " << account.ToShortString()
                                           << " failed: " << ErrorCodeToString(error);
        return OpResult::Error(error, "line update failed");
    }
    stake.AddDeposited(amount);
    total_.AddDeposited(amount);

    bool transferred = false;
    try {
        util::ExternalCallGuard::Scope scope(callGuard_);
        transferred = asset_.TransferFrom(account, custody_, amount);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::STAKE) << "Asset transfer for lock by "
                                            << account.ToShortString() << " threw: " << e.what();
        transferred = false;
    } catch (...) {
        rollback();
        throw;
    }
    if (!transferred) {
        rollback();
        LOG_WARN(util::LogCategory::STAKE) << "Lock by " << account.ToShortString()
                                           << " failed: asset transfer of " << amount
                                           << " refused";
        return OpResult::Error(ErrorCode::TransferFailed, "asset transfer refused");
    }

    LogInfoF(util::LogCategory::STAKE, "Locked %llu for %s over epochs [%llu, %llu) slope %llu",
             static_cast<unsigned long long>(amount), account.ToShortString().c_str(),
             static_cast<unsigned long long>(now), static_cast<unsigned long long>(end),
             static_cast<unsigned long long>(slope));
    return OpResult::Success();
}

OpResult StakeLedger::Unlock(const AccountId& account, Amount* withdrawn) {
    if (withdrawn) *withdrawn = 0;

    if (callGuard_.IsCurrentThreadInside()) {
        LOG_WARN(util::LogCategory::STAKE) << "Unlock rejected: re-entrant call from "
                                           << account.ToShortString();
        return OpResult::Error(ErrorCode::Reentrancy, "unlock called during an asset transfer");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = stakes_.find(account);
    if (it == stakes_.end()) {
        LOG_DEBUG(util::LogCategory::STAKE) << "Unlock by " << account.ToShortString()
                                            << ": no stake";
        return OpResult::Success();
    }
    DecayLine& stake = it->second;

    const Epoch now = clock_.CurrentEpoch();
    const DecayLine::Checkpoint stakeSaved = stake.Save();
    const DecayLine::Checkpoint totalSaved = total_.Save();
    auto rollback = [&]() {
        stake.Restore(stakeSaved);
        total_.Restore(totalSaved);
    };

    ErrorCode error = ErrorCode::OK;
    if (!stake.CommitAdvance(now, &error) || !total_.CommitAdvance(now, &error)) {
        rollback();
        LOG_WARN(util::LogCategory::STAKE) << "Unlock by " << account.ToShortString()
                                           << " failed: " << ErrorCodeToString(error);
        return OpResult::Error(error, "line update failed");
    }

    const Amount bias = stake.GetLine().bias;
    if (bias > stake.GetDeposited()) {
        rollback();
        LOG_ERROR(util::LogCategory::STAKE) << "Unlock by " << account.ToShortString()
                                            << ": remaining bias " << bias
                                            << " exceeds principal " << stake.GetDeposited();
        return OpResult::Error(ErrorCode::ArithmeticUnderflow, "bias exceeds principal");
    }

    const Amount withdrawable = stake.GetDeposited() - bias;
    if (withdrawable == 0) {
        LOG_DEBUG(util::LogCategory::STAKE) << "Unlock by " << account.ToShortString()
                                            << ": nothing withdrawable";
        return OpResult::Success();
    }

    if (!total_.SubDeposited(withdrawable)) {
        rollback();
        return OpResult::Error(ErrorCode::ArithmeticUnderflow, "aggregate principal underflow");
    }
    stake.SubDeposited(withdrawable);

    bool transferred = false;
    try {
        util::ExternalCallGuard::Scope scope(callGuard_);
        transferred = asset_.Transfer(account, withdrawable);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::STAKE) << "Asset transfer for unlock by "
                                            << account.ToShortString() << " threw: " << e.what();
        transferred = false;
    } catch (...) {
        rollback();
        throw;
    }
    if (!transferred) {
        rollback();
        LOG_WARN(util::LogCategory::STAKE) << "Unlock by " << account.ToShortString()
                                           << " failed: asset transfer of " << withdrawable
                                           << " refused";
        return OpResult::Error(ErrorCode::TransferFailed, "asset transfer refused");
    }

    if (withdrawn) *withdrawn = withdrawable;
    LogInfoF(util::LogCategory::STAKE, "Unlocked %llu for %s at epoch %llu",
             static_cast<unsigned long long>(withdrawable), account.ToShortString().c_str(),
             static_cast<unsigned long long>(now));
    return OpResult::Success();
}

// ============================================================================
// StakeLedger - Queries
// ============================================================================

std::optional<Amount> StakeLedger::VotingPowerAt(const AccountId& account, Epoch epoch) const {
    return Guarded([&]() -> std::optional<Amount> {
        auto it = stakes_.find(account);
        if (it == stakes_.end()) {
            return Amount{0};
        }
        auto line = it->second.LineAt(epoch);
        if (!line) {
            LOG_WARN(util::LogCategory::STAKE) << "Voting power of " << account.ToShortString()
                                               << " at epoch " << epoch << " underflows";
            return std::nullopt;
        }
        return line->bias;
    });
}

std::optional<Amount> StakeLedger::CurrentVotingPower(const AccountId& account) const {
    return VotingPowerAt(account, CurrentEpoch());
}

std::optional<Amount> StakeLedger::TotalVotingPowerAt(Epoch epoch) const {
    return Guarded([&]() -> std::optional<Amount> {
        auto line = total_.LineAt(epoch);
        if (!line) {
            LOG_WARN(util::LogCategory::STAKE) << "Total voting power at epoch " << epoch
                                               << " underflows";
            return std::nullopt;
        }
        return line->bias;
    });
}

std::optional<Amount> StakeLedger::CurrentTotalVotingPower() const {
    return TotalVotingPowerAt(CurrentEpoch());
}

Amount StakeLedger::GetDeposited(const AccountId& account) const {
    return Guarded([&]() {
        auto it = stakes_.find(account);
        return it == stakes_.end() ? Amount{0} : it->second.GetDeposited();
    });
}

Amount StakeLedger::GetTotalDeposited() const {
    return Guarded([&]() { return total_.GetDeposited(); });
}

std::optional<Amount> StakeLedger::GetWithdrawable(const AccountId& account) const {
    const Epoch now = CurrentEpoch();
    return Guarded([&]() -> std::optional<Amount> {
        auto it = stakes_.find(account);
        if (it == stakes_.end()) {
            return Amount{0};
        }
        auto line = it->second.LineAt(now);
        if (!line || line->bias > it->second.GetDeposited()) {
            return std::nullopt;
        }
        return it->second.GetDeposited() - line->bias;
    });
}

size_t StakeLedger::GetAccountCount() const {
    return Guarded([&]() { return stakes_.size(); });
}

std::vector<AccountId> StakeLedger::GetAccounts() const {
    return Guarded([&]() {
        std::vector<AccountId> accounts;
        accounts.reserve(stakes_.size());
        for (const auto& [account, stake] : stakes_) {
            accounts.push_back(account);
        }
        return accounts;
    });
}

std::optional<DecayLine> StakeLedger::GetStake(const AccountId& account) const {
    return Guarded([&]() -> std::optional<DecayLine> {
        auto it = stakes_.find(account);
        if (it == stakes_.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

DecayLine StakeLedger::GetTotalStake() const {
    return Guarded([&]() { return total_; });
}

LedgerSnapshot StakeLedger::GetSnapshot() const {
    return Guarded([&]() { return LedgerSnapshot{stakes_, total_}; });
}

// ============================================================================
// StakeLedger - Consistency
// ============================================================================

bool StakeLedger::CheckConsistencyOf(const std::map<AccountId, DecayLine>& stakes,
                                     const DecayLine& total, Epoch epoch,
                                     std::string* error) {
    auto fail = [error](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };

    Amount biasSum = 0;
    SignedAmount slopeSum = 0;
    Amount depositedSum = 0;
    for (const auto& [account, stake] : stakes) {
        auto line = stake.LineAt(epoch);
        if (!line) {
            return fail("stake of " + account.ToHex() + " cannot be replayed to epoch " +
                        std::to_string(epoch));
        }
        if (!CheckedAdd(biasSum, line->bias, biasSum) ||
            !CheckedAdd(slopeSum, line->slope, slopeSum) ||
            !CheckedAdd(depositedSum, stake.GetDeposited(), depositedSum)) {
            return fail("account totals overflow");
        }
    }

    auto aggregate = total.LineAt(epoch);
    if (!aggregate) {
        return fail("aggregate cannot be replayed to epoch " + std::to_string(epoch));
    }
    if (aggregate->bias != biasSum || aggregate->slope != slopeSum) {
        return fail("aggregate " + aggregate->ToString() + " differs from account sum Line { bias: " +
                    std::to_string(biasSum) + ", slope: " + std::to_string(slopeSum) +
                    " } at epoch " + std::to_string(epoch));
    }
    if (total.GetDeposited() != depositedSum) {
        return fail("aggregate principal " + std::to_string(total.GetDeposited()) +
                    " differs from account sum " + std::to_string(depositedSum));
    }
    return true;
}

bool StakeLedger::CheckConsistency(Epoch epoch, std::string* error) const {
    return Guarded([&]() { return CheckConsistencyOf(stakes_, total_, epoch, error); });
}

// ============================================================================
// StakeLedger - Persistence
// ============================================================================

std::vector<Byte> StakeLedger::Serialize() const {
    return Guarded([&]() {
        DataStream ds;
        ds << SERIALIZATION_VERSION << stakes_ << total_;
        return ds.Data();
    });
}

bool StakeLedger::Deserialize(const Byte* data, size_t len) {
    uint32_t version = 0;
    std::map<AccountId, DecayLine> stakes;
    DecayLine total;
    try {
        DataStream ds(data, len);
        ds >> version;
        if (version != SERIALIZATION_VERSION) {
            LOG_WARN(util::LogCategory::STAKE) << "Unsupported ledger snapshot version " << version;
            return false;
        }
        ds >> stakes >> total;
        if (!ds.empty()) {
            LOG_WARN(util::LogCategory::STAKE) << "Trailing bytes in ledger snapshot";
            return false;
        }
    } catch (const std::ios_base::failure& e) {
        LOG_WARN(util::LogCategory::STAKE) << "Malformed ledger snapshot: " << e.what();
        return false;
    }

    std::string error;
    if (!RestoreState(std::move(stakes), std::move(total), &error)) {
        LOG_WARN(util::LogCategory::STAKE) << "Ledger snapshot rejected: " << error;
        return false;
    }
    return true;
}

bool StakeLedger::RestoreState(std::map<AccountId, DecayLine> stakes, DecayLine total,
                               std::string* error) {
    if (callGuard_.IsCurrentThreadInside()) {
        if (error) *error = "restore called during an asset transfer";
        return false;
    }
    if (!CheckConsistencyOf(stakes, total, total.GetLastUpdateEpoch(), error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stakes_ = std::move(stakes);
    total_ = std::move(total);
    LogInfoF(util::LogCategory::STAKE, "Restored %zu stakes, total deposited %llu",
             stakes_.size(), static_cast<unsigned long long>(total_.GetDeposited()));
    return true;
}

} // namespace staking
} // namespace velock
