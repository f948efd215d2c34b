#include "memory_blob_store.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include <exception>
#include <new>
#include <utility>

S3Error MemoryBlobStore::Store(const std::string& data, BlobInfo* info) {
    try {
        // Fingerprint outside the lock; it is the expensive part.
        std::string etag = Md5Hex(data);

        std::lock_guard<std::mutex> lock(mutex_);
        int64_t id = next_id_++;
        blobs_.emplace(id, data);

        info->ref.id = id;
        info->size = data.size();
        info->etag = std::move(etag);
        return S3Error::None;
    } catch (const std::bad_alloc&) {
        Logger::Error("Out of memory storing " + std::to_string(data.size()) + " bytes", "BlobStore");
        return S3Error::InternalStorageFailure;
    } catch (const std::exception& e) {
        Logger::Error("Store failed: " + std::string(e.what()), "BlobStore");
        return S3Error::InternalStorageFailure;
    }
}

S3Error MemoryBlobStore::Fetch(const BlobRef& ref, std::string* data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(ref.id);
    if (it == blobs_.end()) {
        return S3Error::NoSuchKey;
    }
    try {
        *data = it->second;
    } catch (const std::bad_alloc&) {
        Logger::Error("Out of memory fetching blob " + std::to_string(ref.id), "BlobStore");
        return S3Error::InternalStorageFailure;
    }
    return S3Error::None;
}

S3Error MemoryBlobStore::Release(const BlobRef& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blobs_.erase(ref.id) == 0) {
        return S3Error::NoSuchKey;
    }
    return S3Error::None;
}

size_t MemoryBlobStore::Count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.size();
}
