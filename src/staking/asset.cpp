// VELOCK - In-memory Token Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <velock/staking/asset.h>
#include <velock/core/serialize.h>
#include <velock/util/logging.h>

namespace velock {
namespace staking {

bool TokenLedger::Mint(const AccountId& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount > MAX_AMOUNT - totalSupply_) {
        LogWarnF(util::LogCategory::ASSET, "Mint of %llu to %s would overflow supply",
                 static_cast<unsigned long long>(amount), to.ToShortString().c_str());
        return false;
    }
    totalSupply_ += amount;
    if (amount > 0) {
        balances_[to] += amount;
    }
    return true;
}

void TokenLedger::Approve(const AccountId& owner, const AccountId& spender, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount == 0) {
        allowances_.erase({owner, spender});
    } else {
        allowances_[{owner, spender}] = amount;
    }
}

Amount TokenLedger::BalanceOf(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount TokenLedger::Allowance(const AccountId& owner, const AccountId& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

Amount TokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

size_t TokenLedger::GetHolderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_.size();
}

bool TokenLedger::MoveLocked(const AccountId& from, const AccountId& to, Amount amount) {
    auto it = balances_.find(from);
    Amount balance = it == balances_.end() ? 0 : it->second;
    if (balance < amount) {
        return false;
    }
    if (amount == 0 || from == to) {
        return true;
    }
    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    // Cannot overflow: every balance is bounded by totalSupply_
    balances_[to] += amount;
    return true;
}

bool TokenLedger::Transfer(const AccountId& from, const AccountId& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!MoveLocked(from, to, amount)) {
        LOG_DEBUG(util::LogCategory::ASSET) << "Transfer of " << amount << " from "
            << from.ToShortString() << " failed: insufficient balance";
        return false;
    }
    return true;
}

bool TokenLedger::TransferFrom(const AccountId& spender, const AccountId& from,
                               const AccountId& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto allowance = allowances_.find({from, spender});
    Amount allowed = allowance == allowances_.end() ? 0 : allowance->second;
    if (allowed < amount) {
        LOG_DEBUG(util::LogCategory::ASSET) << "TransferFrom of " << amount << " from "
            << from.ToShortString() << " failed: allowance " << allowed;
        return false;
    }
    if (!MoveLocked(from, to, amount)) {
        LOG_DEBUG(util::LogCategory::ASSET) << "TransferFrom of " << amount << " from "
            << from.ToShortString() << " failed: insufficient balance";
        return false;
    }
    if (amount > 0) {
        allowance->second -= amount;
        if (allowance->second == 0) {
            allowances_.erase(allowance);
        }
    }
    return true;
}

std::vector<Byte> TokenLedger::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataStream ds;
    ds << totalSupply_ << balances_ << allowances_;
    return ds.Data();
}

bool TokenLedger::Deserialize(const Byte* data, size_t len) {
    Amount supply = 0;
    std::map<AccountId, Amount> balances;
    std::map<std::pair<AccountId, AccountId>, Amount> allowances;
    try {
        DataStream ds(data, len);
        ds >> supply >> balances >> allowances;
        if (!ds.empty()) {
            return false;
        }
    } catch (const std::ios_base::failure& e) {
        LogWarnF(util::LogCategory::ASSET, "Token snapshot rejected: %s", e.what());
        return false;
    }

    Amount sum = 0;
    for (const auto& [account, balance] : balances) {
        if (balance > MAX_AMOUNT - sum) return false;
        sum += balance;
    }
    if (sum != supply) {
        LogWarnF(util::LogCategory::ASSET, "Token snapshot rejected: balances do not sum to supply");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    totalSupply_ = supply;
    balances_ = std::move(balances);
    allowances_ = std::move(allowances);
    return true;
}

} // namespace staking
} // namespace velock
