#ifndef MEMORY_BLOB_STORE_HPP
#define MEMORY_BLOB_STORE_HPP

#include <mutex>
#include <unordered_map>
#include "blob_store.hpp"

// Keeps payloads on the heap. Handles are never reused within a process.
class MemoryBlobStore : public BlobStore {
public:
    MemoryBlobStore() = default;

    S3Error Store(const std::string& data, BlobInfo* info) override;
    S3Error Fetch(const BlobRef& ref, std::string* data) override;
    S3Error Release(const BlobRef& ref) override;
    size_t Count() override;

private:
    std::mutex mutex_;
    std::unordered_map<int64_t, std::string> blobs_;
    int64_t next_id_ = 1;
};

#endif // MEMORY_BLOB_STORE_HPP
