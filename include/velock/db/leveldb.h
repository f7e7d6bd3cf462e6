// VELOCK - LevelDB and In-Memory Backends
// Copyright (c) 2024 VELOCK Developers
// MIT License

#ifndef VELOCK_DB_LEVELDB_H
#define VELOCK_DB_LEVELDB_H

#include <velock/db/database.h>

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <map>
#include <memory>
#include <mutex>

namespace velock {
namespace db {

// ============================================================================
// LevelDB
// ============================================================================

/// Translate a LevelDB status into ours
Status FromLevelDBStatus(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db and cache (cache may be null)
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    void Compact() override;
    std::string GetStats() const override;

    const std::filesystem::path& GetPath() const { return path_; }

private:
    static leveldb::ReadOptions ToLevelDB(const ReadOptions& opts);
    static leveldb::WriteOptions ToLevelDB(const WriteOptions& opts);

    // db_ must be destroyed before cache_
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a copy taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }

    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace velock

#endif // VELOCK_DB_LEVELDB_H
