// VELOCK - Ledger Snapshot Database Implementation
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <velock/db/ledgerdb.h>
#include <velock/util/logging.h>

#include <map>
#include <sstream>

namespace velock {
namespace db {

std::string SnapshotMeta::ToString() const {
    std::ostringstream ss;
    ss << "SnapshotMeta {"
       << " version: " << version
       << ", width: " << epochWidth
       << ", origin: " << originTime
       << ", anchor: " << anchorEpoch
       << ", accounts: " << accountCount
       << " }";
    return ss.str();
}

// ============================================================================
// LedgerDB
// ============================================================================

LedgerDB::LedgerDB(std::unique_ptr<Database> db) : db_(std::move(db)) {}

std::unique_ptr<LedgerDB> LedgerDB::Open(const std::filesystem::path& path,
                                         const Options& options,
                                         Status* status) {
    auto [s, db] = OpenDatabase(path, options);
    if (status) *status = s;
    if (!s.ok()) {
        return nullptr;
    }
    return std::make_unique<LedgerDB>(std::move(db));
}

std::vector<std::string> LedgerDB::StakeKeys() const {
    std::vector<std::string> keys;
    const std::string stakePrefix = MakeKey(prefix::STAKE);
    auto iter = db_->NewIterator();
    for (iter->Seek(Slice(stakePrefix)); iter->Valid(); iter->Next()) {
        Slice key = iter->key();
        if (!key.starts_with(Slice(stakePrefix))) {
            break;
        }
        keys.push_back(key.ToString());
    }
    return keys;
}

Status LedgerDB::WriteLedger(const staking::StakeLedger& ledger,
                             const staking::TokenLedger* token,
                             bool sync) {
    VELOCK_LOG_TIMER(util::LogCategory::DB, "WriteLedger");

    staking::LedgerSnapshot snapshot = ledger.GetSnapshot();
    const staking::DecayLine& total = snapshot.total;

    SnapshotMeta meta;
    meta.epochWidth = ledger.GetParams().epochWidth;
    meta.originTime = ledger.GetParams().originTime;
    meta.anchorEpoch = total.GetLastUpdateEpoch();
    meta.accountCount = snapshot.stakes.size();

    WriteBatch batch;
    for (const auto& key : StakeKeys()) {
        batch.Delete(Slice(key));
    }
    for (const auto& [account, stake] : snapshot.stakes) {
        batch.Put(MakeKey(prefix::STAKE, account), SerializeToString(stake));
    }
    batch.Put(MakeKey(prefix::TOTAL), SerializeToString(total));
    batch.Put(MakeKey(prefix::META), SerializeToString(meta));
    if (token) {
        batch.Put(MakeKey(prefix::ASSET), Slice(token->Serialize()));
    } else {
        batch.Delete(MakeKey(prefix::ASSET));
    }

    WriteOptions wo;
    wo.sync = sync;
    Status s = db_->Write(wo, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Snapshot write failed: " << s.ToString();
        return s;
    }
    nWrites_ += batch.Count();
    LogInfoF(util::LogCategory::DB, "Wrote snapshot: %zu accounts, anchor epoch %llu, %zu bytes",
             snapshot.stakes.size(), static_cast<unsigned long long>(meta.anchorEpoch),
             batch.ApproximateSize());
    return Status::Ok();
}

Status LedgerDB::ReadMeta(SnapshotMeta* meta) const {
    std::string value;
    Status s = db_->Get(MakeKey(prefix::META), &value);
    ++nReads_;
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, *meta)) {
        return Status::Corruption("malformed meta record");
    }
    if (meta->version != SnapshotMeta::FORMAT_VERSION) {
        return Status::NotSupported("snapshot format version " + std::to_string(meta->version));
    }
    return Status::Ok();
}

bool LedgerDB::HasSnapshot() const {
    return db_->Exists(MakeKey(prefix::META));
}

Status LedgerDB::ReadLedger(staking::StakeLedger& ledger,
                            staking::TokenLedger* token) const {
    SnapshotMeta meta;
    Status s = ReadMeta(&meta);
    if (!s.ok()) {
        return s;
    }

    const auto& params = ledger.GetParams();
    if (meta.epochWidth != params.epochWidth || meta.originTime != params.originTime) {
        LOG_WARN(util::LogCategory::DB) << "Snapshot clock mismatch: " << meta.ToString();
        return Status::InvalidArgument("snapshot epoch width or origin differs from configuration");
    }

    std::string value;
    s = db_->Get(MakeKey(prefix::TOTAL), &value);
    ++nReads_;
    if (!s.ok()) {
        return s.IsNotFound() ? Status::Corruption("aggregate record missing") : s;
    }
    staking::DecayLine total;
    if (!DeserializeFromString(value, total)) {
        return Status::Corruption("malformed aggregate record");
    }

    std::map<AccountId, staking::DecayLine> stakes;
    const std::string stakePrefix = MakeKey(prefix::STAKE);
    auto iter = db_->NewIterator();
    for (iter->Seek(Slice(stakePrefix)); iter->Valid(); iter->Next()) {
        Slice key = iter->key();
        if (!key.starts_with(Slice(stakePrefix))) {
            break;
        }
        ++nReads_;
        AccountId account;
        staking::DecayLine line;
        if (!DeserializeFromString(key.ToString().substr(1), account) ||
            !DeserializeFromString(iter->value().ToString(), line)) {
            return Status::Corruption("malformed stake record");
        }
        stakes.emplace(account, std::move(line));
    }
    if (!iter->status().ok()) {
        return iter->status();
    }
    if (stakes.size() != meta.accountCount) {
        return Status::Corruption("expected " + std::to_string(meta.accountCount) +
                                  " stake records, found " + std::to_string(stakes.size()));
    }

    std::string assetBlob;
    bool haveAsset = false;
    if (token) {
        s = db_->Get(MakeKey(prefix::ASSET), &assetBlob);
        ++nReads_;
        if (s.ok()) {
            staking::TokenLedger scratch;
            if (!scratch.Deserialize(reinterpret_cast<const Byte*>(assetBlob.data()),
                                     assetBlob.size())) {
                return Status::Corruption("malformed asset record");
            }
            haveAsset = true;
        } else if (!s.IsNotFound()) {
            return s;
        }
    }

    std::string error;
    if (!ledger.RestoreState(std::move(stakes), std::move(total), &error)) {
        LOG_WARN(util::LogCategory::DB) << "Snapshot rejected: " << error;
        return Status::Corruption(error);
    }
    if (haveAsset &&
        !token->Deserialize(reinterpret_cast<const Byte*>(assetBlob.data()), assetBlob.size())) {
        return Status::Corruption("malformed asset record");
    }

    LogInfoF(util::LogCategory::DB, "Loaded snapshot: %llu accounts, anchor epoch %llu%s",
             static_cast<unsigned long long>(meta.accountCount),
             static_cast<unsigned long long>(meta.anchorEpoch),
             haveAsset ? ", with asset ledger" : "");
    return Status::Ok();
}

Status LedgerDB::Wipe() {
    WriteBatch batch;
    for (const auto& key : StakeKeys()) {
        batch.Delete(Slice(key));
    }
    batch.Delete(MakeKey(prefix::TOTAL));
    batch.Delete(MakeKey(prefix::META));
    batch.Delete(MakeKey(prefix::ASSET));
    nWrites_ += batch.Count();
    return db_->Write(&batch);
}

} // namespace db
} // namespace velock
