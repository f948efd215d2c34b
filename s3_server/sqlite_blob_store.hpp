#ifndef SQLITE_BLOB_STORE_HPP
#define SQLITE_BLOB_STORE_HPP

#include <string>
#include <mutex>
#include <sqlite3.h>
#include "blob_store.hpp"

// Spills payloads to a SQLite database so object bytes do not live in RAM.
// The object index is in memory only, so rows surviving a restart are
// orphans and are purged when the store is opened.
class SqliteBlobStore : public BlobStore {
public:
    // Throws std::runtime_error if the database cannot be opened or initialised.
    explicit SqliteBlobStore(const std::string& db_path);
    ~SqliteBlobStore() override;

    SqliteBlobStore(const SqliteBlobStore&) = delete;
    SqliteBlobStore& operator=(const SqliteBlobStore&) = delete;

    S3Error Store(const std::string& data, BlobInfo* info) override;
    S3Error Fetch(const BlobRef& ref, std::string* data) override;
    S3Error Release(const BlobRef& ref) override;
    size_t Count() override;

    // SQLITE_LIMIT_LENGTH of this connection (1e9 bytes unless SQLite was
    // built with a different SQLITE_MAX_LENGTH).
    size_t MaxBlobSize() override;

private:
    sqlite3* db_;
    std::mutex mutex_;

    void Init();
    void PurgeOrphans();
    void Execute(const std::string& sql);
};

#endif // SQLITE_BLOB_STORE_HPP
