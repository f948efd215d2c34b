#ifndef STORAGE_ENGINE_HPP
#define STORAGE_ENGINE_HPP

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "blob_store.hpp"
#include "bucket_registry.hpp"
#include "cancellation.hpp"
#include "object_index.hpp"
#include "s3_error.hpp"

// The object storage core behind the S3 endpoint and the gRPC service.
//
// Every call is its own atomic unit: it either fully succeeds or returns a
// typed error having changed nothing visible. There is no transaction across
// calls, so "list then delete each" is not atomic against concurrent writers.
//
// Buckets are never deleted recursively; DeleteBucket fails with
// BucketNotEmpty until the caller has removed every key.
class StorageEngine {
public:
    explicit StorageEngine(std::unique_ptr<BlobStore> blobs);

    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    S3Error CreateBucket(const std::string& bucket);
    S3Error DeleteBucket(const std::string& bucket);

    // None if the bucket exists, NoSuchBucket otherwise.
    S3Error HeadBucket(const std::string& bucket);

    std::vector<BucketSummary> ListBuckets();

    // Stores data under key, replacing any previous version. If
    // declared_length is set and differs from data.size() the put is
    // rejected with InvalidArgument, and a payload larger than the blob
    // store can hold with EntityTooLarge. The new blob is stored before the old
    // one is released. If cancel fires after the bytes are stored the blob is
    // released again and OperationAborted is returned with the index untouched.
    S3Error PutObject(const std::string& bucket, const std::string& key, const std::string& data,
                      std::optional<size_t> declared_length = std::nullopt,
                      ObjectMeta* meta = nullptr,
                      const CancellationToken* cancel = nullptr);

    S3Error GetObject(const std::string& bucket, const std::string& key, std::string* data, ObjectMeta* meta);

    S3Error HeadObject(const std::string& bucket, const std::string& key, ObjectMeta* meta);

    // Snapshot of the bucket in ascending key order. An empty bucket yields an
    // empty list.
    S3Error ListObjects(const std::string& bucket, std::vector<ObjectSummary>* objects);

    // Succeeds whether or not key exists, provided the bucket does.
    S3Error DeleteObject(const std::string& bucket, const std::string& key);

    // Live blobs in the underlying store. Equals the total number of objects
    // across buckets whenever no put is in flight.
    size_t BlobCount();

    // 3-63 characters of [a-z0-9.-], starting and ending with a letter or digit.
    static bool IsValidBucketName(const std::string& name);

    // Non-empty and at most 1024 bytes.
    static bool IsValidKey(const std::string& key);

private:
    std::unique_ptr<BlobStore> blobs_;
    BucketRegistry registry_;

    // Resolves bucket and returns it with its gate held shared, or nullptr
    // if it does not exist or was deleted while we waited.
    std::shared_ptr<Bucket> AcquireBucket(const std::string& bucket, std::shared_lock<std::shared_mutex>* gate);

    void ReleaseBlob(const BlobRef& ref, const std::string& what);
};

#endif // STORAGE_ENGINE_HPP
