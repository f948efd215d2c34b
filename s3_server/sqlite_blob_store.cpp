#include "sqlite_blob_store.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <exception>

SqliteBlobStore::SqliteBlobStore(const std::string& db_path)
    : db_(nullptr) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite database: " + error);
    }
    try {
        Init();
        PurgeOrphans();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    Logger::Info("Blob database opened at " + db_path, "BlobStore");
}

SqliteBlobStore::~SqliteBlobStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteBlobStore::Init() {
    // DATA holds the raw payload; ID is the BlobRef handed to the index.
    Execute("CREATE TABLE IF NOT EXISTS blobs (id INTEGER PRIMARY KEY AUTOINCREMENT, data BLOB NOT NULL);");
}

void SqliteBlobStore::PurgeOrphans() {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM blobs;", -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare count statement");
    }
    int64_t orphans = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        orphans = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (orphans > 0) {
        Logger::Warn("Purging " + std::to_string(orphans) + " orphaned blobs from a previous run", "BlobStore");
        Execute("DELETE FROM blobs;");
    }
}

void SqliteBlobStore::Execute(const std::string& sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = "SQL error: " + std::string(errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        throw std::runtime_error(error);
    }
}

S3Error SqliteBlobStore::Store(const std::string& data, BlobInfo* info) {
    std::string etag;
    try {
        etag = Md5Hex(data);
    } catch (const std::exception& e) {
        Logger::Error("Fingerprint failed: " + std::string(e.what()), "BlobStore");
        return S3Error::InternalStorageFailure;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt;
    const char* sql = "INSERT INTO blobs (data) VALUES (?);";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::Error("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db_)), "BlobStore");
        return S3Error::InternalStorageFailure;
    }

    // zeroblob for empty payloads so the NOT NULL column never sees NULL.
    int rc = data.empty()
        ? sqlite3_bind_zeroblob(stmt, 1, 0)
        : sqlite3_bind_blob64(stmt, 1, data.data(), data.size(), SQLITE_STATIC);
    if (rc != SQLITE_OK) {
        Logger::Error("Failed to bind blob: " + std::string(sqlite3_errmsg(db_)), "BlobStore");
        sqlite3_finalize(stmt);
        return S3Error::InternalStorageFailure;
    }

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        Logger::Error("Failed to execute insert: " + std::string(sqlite3_errmsg(db_)), "BlobStore");
        sqlite3_finalize(stmt);
        return S3Error::InternalStorageFailure;
    }
    sqlite3_finalize(stmt);

    info->ref.id = sqlite3_last_insert_rowid(db_);
    info->size = data.size();
    info->etag = etag;
    return S3Error::None;
}

S3Error SqliteBlobStore::Fetch(const BlobRef& ref, std::string* data) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt;
    const char* sql = "SELECT data FROM blobs WHERE id = ?;";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::Error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)), "BlobStore");
        return S3Error::InternalStorageFailure;
    }

    sqlite3_bind_int64(stmt, 1, ref.id);

    S3Error result = S3Error::NoSuchKey;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const void* blob = sqlite3_column_blob(stmt, 0);
        int len = sqlite3_column_bytes(stmt, 0);
        if (blob != nullptr && len > 0) {
            data->assign(static_cast<const char*>(blob), len);
        } else {
            data->clear();
        }
        result = S3Error::None;
    } else if (rc != SQLITE_DONE) {
        Logger::Error("Failed to read blob " + std::to_string(ref.id) + ": " + sqlite3_errmsg(db_), "BlobStore");
        result = S3Error::InternalStorageFailure;
    }

    sqlite3_finalize(stmt);
    return result;
}

S3Error SqliteBlobStore::Release(const BlobRef& ref) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt;
    const char* sql = "DELETE FROM blobs WHERE id = ?;";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::Error("Failed to prepare delete statement: " + std::string(sqlite3_errmsg(db_)), "BlobStore");
        return S3Error::InternalStorageFailure;
    }

    sqlite3_bind_int64(stmt, 1, ref.id);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        Logger::Error("Failed to delete blob " + std::to_string(ref.id) + ": " + sqlite3_errmsg(db_), "BlobStore");
        sqlite3_finalize(stmt);
        return S3Error::InternalStorageFailure;
    }
    sqlite3_finalize(stmt);

    return sqlite3_changes(db_) == 0 ? S3Error::NoSuchKey : S3Error::None;
}

size_t SqliteBlobStore::Count() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM blobs;", -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::Error("Failed to prepare count statement", "BlobStore");
        return 0;
    }
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

size_t SqliteBlobStore::MaxBlobSize() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(sqlite3_limit(db_, SQLITE_LIMIT_LENGTH, -1));
}
