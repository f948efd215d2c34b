#ifndef BLOB_STORE_HPP
#define BLOB_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include "s3_error.hpp"

// Opaque handle into a BlobStore. Exactly one index entry owns a given
// reference at a time.
struct BlobRef {
    int64_t id = 0;

    bool operator==(const BlobRef& other) const { return id == other.id; }
    bool operator!=(const BlobRef& other) const { return id != other.id; }
};

// What Store() learned about the payload it persisted.
struct BlobInfo {
    BlobRef ref;
    size_t size = 0;
    std::string etag; // hex MD5 of the payload
};

// Content storage for raw object bytes. Knows nothing about buckets or keys.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    // Persists data and fills info with its handle, length and fingerprint.
    // Returns InternalStorageFailure if the backend cannot write.
    virtual S3Error Store(const std::string& data, BlobInfo* info) = 0;

    // Returns the exact bytes previously stored, or NoSuchKey for an unknown ref.
    virtual S3Error Fetch(const BlobRef& ref, std::string* data) = 0;

    // Reclaims storage. Releasing an unknown ref returns NoSuchKey; the engine
    // treats that as its own bug, never as a caller-visible fault.
    virtual S3Error Release(const BlobRef& ref) = 0;

    // Number of live blobs.
    virtual size_t Count() = 0;

    // Largest payload Store() can persist.
    virtual size_t MaxBlobSize() { return std::numeric_limits<size_t>::max(); }
};

#endif // BLOB_STORE_HPP
