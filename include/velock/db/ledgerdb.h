// VELOCK - Ledger Snapshot Database
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Persists StakeLedger state in a key-value database. A snapshot is one
// write batch holding a meta record, the aggregate line, one record per
// account and optionally the token ledger.

#ifndef VELOCK_DB_LEDGERDB_H
#define VELOCK_DB_LEDGERDB_H

#include <velock/db/database.h>
#include <velock/staking/asset.h>
#include <velock/staking/ledger.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace velock {
namespace db {

// ============================================================================
// Snapshot Meta Record
// ============================================================================

struct SnapshotMeta {
    static constexpr uint32_t FORMAT_VERSION = 1;

    uint32_t version{FORMAT_VERSION};
    int64_t epochWidth{0};
    Timestamp originTime{0};

    /// Anchor epoch of the aggregate line when written
    Epoch anchorEpoch{0};
    uint64_t accountCount{0};

    template<typename Stream>
    void Serialize(Stream& s) const {
        s << version << epochWidth << originTime << anchorEpoch << accountCount;
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        s >> version >> epochWidth >> originTime >> anchorEpoch >> accountCount;
    }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const SnapshotMeta& meta) { meta.Serialize(s); }

template<typename Stream>
void Unserialize(Stream& s, SnapshotMeta& meta) { meta.Unserialize(s); }

// ============================================================================
// LedgerDB
// ============================================================================

class LedgerDB {
public:
    explicit LedgerDB(std::unique_ptr<Database> db);

    /**
     * Open or create the LevelDB store under path.
     * @return null on failure, with the reason in *status
     */
    static std::unique_ptr<LedgerDB> Open(const std::filesystem::path& path,
                                          const Options& options = Options(),
                                          Status* status = nullptr);

    LedgerDB(const LedgerDB&) = delete;
    LedgerDB& operator=(const LedgerDB&) = delete;

    /**
     * Replace the stored snapshot with the ledger's current state.
     * Accounts no longer held by the ledger are removed in the same batch.
     */
    Status WriteLedger(const staking::StakeLedger& ledger,
                       const staking::TokenLedger* token = nullptr,
                       bool sync = true);

    /**
     * Load the stored snapshot into ledger (and token, when given and
     * stored). Nothing is modified unless every record parses, the meta
     * record matches the ledger's parameters, and the stakes are
     * consistent with the aggregate.
     */
    Status ReadLedger(staking::StakeLedger& ledger,
                      staking::TokenLedger* token = nullptr) const;

    Status ReadMeta(SnapshotMeta* meta) const;
    bool HasSnapshot() const;

    /// Delete every snapshot record
    Status Wipe();

    uint64_t GetReadCount() const { return nReads_; }
    uint64_t GetWriteCount() const { return nWrites_; }

    Database& GetDatabase() { return *db_; }

private:
    /// Keys of all stored stake records
    std::vector<std::string> StakeKeys() const;

    std::unique_ptr<Database> db_;

    mutable std::atomic<uint64_t> nReads_{0};
    mutable std::atomic<uint64_t> nWrites_{0};
};

} // namespace db
} // namespace velock

#endif // VELOCK_DB_LEDGERDB_H
