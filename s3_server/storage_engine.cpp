#include "storage_engine.hpp"
#include "logger.hpp"
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace {

const char* kComponent = "Engine";

std::string Path(const std::string& bucket, const std::string& key) {
    return bucket + "/" + key;
}

} // namespace

StorageEngine::StorageEngine(std::unique_ptr<BlobStore> blobs)
    : blobs_(std::move(blobs)) {
    if (!blobs_) {
        throw std::invalid_argument("StorageEngine requires a blob store");
    }
}

bool StorageEngine::IsValidBucketName(const std::string& name) {
    if (name.size() < 3 || name.size() > 63) {
        return false;
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '-';
        if (!ok) {
            return false;
        }
    }
    auto alnum = [](char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); };
    return alnum(name.front()) && alnum(name.back());
}

bool StorageEngine::IsValidKey(const std::string& key) {
    return !key.empty() && key.size() <= 1024;
}

std::shared_ptr<Bucket> StorageEngine::AcquireBucket(const std::string& bucket,
                                                     std::shared_lock<std::shared_mutex>* gate) {
    std::shared_ptr<Bucket> found = registry_.Find(bucket);
    if (!found) {
        return nullptr;
    }
    *gate = std::shared_lock<std::shared_mutex>(found->gate);
    if (found->deleted) {
        gate->unlock();
        return nullptr;
    }
    return found;
}

void StorageEngine::ReleaseBlob(const BlobRef& ref, const std::string& what) {
    S3Error err = blobs_->Release(ref);
    if (err != S3Error::None) {
        // Single ownership of refs is ours to guarantee; a failure here is a
        // leak or a double release, not something the caller can act on.
        Logger::Error("Failed to release blob " + std::to_string(ref.id) + " (" + what + "): " +
                      ErrorCode(err), kComponent);
    }
}

S3Error StorageEngine::CreateBucket(const std::string& bucket) {
    if (!IsValidBucketName(bucket)) {
        Logger::Warn("Rejected bucket name '" + bucket + "'", kComponent);
        return S3Error::InvalidBucketName;
    }
    S3Error err = registry_.Create(bucket);
    if (err == S3Error::None) {
        Logger::Info("Bucket created: " + bucket, kComponent);
    } else {
        Logger::Debug("CreateBucket " + bucket + ": " + ErrorCode(err), kComponent);
    }
    return err;
}

S3Error StorageEngine::DeleteBucket(const std::string& bucket) {
    S3Error err = registry_.Delete(bucket);
    if (err == S3Error::None) {
        Logger::Info("Bucket deleted: " + bucket, kComponent);
    } else {
        Logger::Debug("DeleteBucket " + bucket + ": " + ErrorCode(err), kComponent);
    }
    return err;
}

S3Error StorageEngine::HeadBucket(const std::string& bucket) {
    return registry_.Exists(bucket) ? S3Error::None : S3Error::NoSuchBucket;
}

std::vector<BucketSummary> StorageEngine::ListBuckets() {
    return registry_.List();
}

S3Error StorageEngine::PutObject(const std::string& bucket, const std::string& key, const std::string& data,
                                 std::optional<size_t> declared_length,
                                 ObjectMeta* meta,
                                 const CancellationToken* cancel) {
    std::shared_lock<std::shared_mutex> gate;
    std::shared_ptr<Bucket> target = AcquireBucket(bucket, &gate);
    if (!target) {
        return S3Error::NoSuchBucket;
    }

    if (!IsValidKey(key)) {
        Logger::Warn("PutObject " + bucket + ": rejected key of " + std::to_string(key.size()) + " bytes",
                     kComponent);
        return S3Error::InvalidArgument;
    }
    if (declared_length && *declared_length != data.size()) {
        Logger::Warn("PutObject " + Path(bucket, key) + ": declared length " + std::to_string(*declared_length) +
                     " but received " + std::to_string(data.size()) + " bytes", kComponent);
        return S3Error::InvalidArgument;
    }
    if (data.size() > blobs_->MaxBlobSize()) {
        Logger::Warn("PutObject " + Path(bucket, key) + ": " + std::to_string(data.size()) +
                     " bytes exceeds the blob store limit of " + std::to_string(blobs_->MaxBlobSize()), kComponent);
        return S3Error::EntityTooLarge;
    }

    std::unique_lock<std::shared_mutex> key_lock(target->index.KeyMutex(key));

    BlobInfo info;
    S3Error err = blobs_->Store(data, &info);
    if (err != S3Error::None) {
        Logger::Error("PutObject " + Path(bucket, key) + ": blob store failed, index unchanged", kComponent);
        return err;
    }

    if (cancel && cancel->IsCancelled()) {
        ReleaseBlob(info.ref, "aborted put " + Path(bucket, key));
        Logger::Warn("PutObject " + Path(bucket, key) + " aborted by caller", kComponent);
        return S3Error::OperationAborted;
    }

    ObjectMeta stored;
    stored.size = info.size;
    stored.etag = info.etag;
    stored.last_modified = std::chrono::system_clock::now();

    std::optional<BlobRef> previous = target->index.Put(key, stored, info.ref);
    if (previous) {
        ReleaseBlob(*previous, "overwrite " + Path(bucket, key));
    }

    Logger::Debug("PutObject " + Path(bucket, key) + " (" + std::to_string(info.size) + " bytes, etag " +
                  info.etag + (previous ? ", replaced)" : ")"), kComponent);

    if (meta) {
        *meta = stored;
    }
    return S3Error::None;
}

S3Error StorageEngine::GetObject(const std::string& bucket, const std::string& key, std::string* data,
                                 ObjectMeta* meta) {
    std::shared_lock<std::shared_mutex> gate;
    std::shared_ptr<Bucket> target = AcquireBucket(bucket, &gate);
    if (!target) {
        return S3Error::NoSuchBucket;
    }

    std::shared_lock<std::shared_mutex> key_lock(target->index.KeyMutex(key));

    IndexEntry entry;
    if (!target->index.Get(key, &entry)) {
        return S3Error::NoSuchKey;
    }

    S3Error err = blobs_->Fetch(entry.blob, data);
    if (err == S3Error::NoSuchKey) {
        Logger::Error("GetObject " + Path(bucket, key) + ": index references missing blob " +
                      std::to_string(entry.blob.id), kComponent);
        return S3Error::InternalStorageFailure;
    }
    if (err != S3Error::None) {
        return err;
    }

    if (meta) {
        *meta = entry.meta;
    }
    return S3Error::None;
}

S3Error StorageEngine::HeadObject(const std::string& bucket, const std::string& key, ObjectMeta* meta) {
    std::shared_lock<std::shared_mutex> gate;
    std::shared_ptr<Bucket> target = AcquireBucket(bucket, &gate);
    if (!target) {
        return S3Error::NoSuchBucket;
    }

    IndexEntry entry;
    if (!target->index.Get(key, &entry)) {
        return S3Error::NoSuchKey;
    }
    if (meta) {
        *meta = entry.meta;
    }
    return S3Error::None;
}

S3Error StorageEngine::ListObjects(const std::string& bucket, std::vector<ObjectSummary>* objects) {
    std::shared_lock<std::shared_mutex> gate;
    std::shared_ptr<Bucket> target = AcquireBucket(bucket, &gate);
    if (!target) {
        return S3Error::NoSuchBucket;
    }

    *objects = target->index.ListSorted();
    return S3Error::None;
}

S3Error StorageEngine::DeleteObject(const std::string& bucket, const std::string& key) {
    std::shared_lock<std::shared_mutex> gate;
    std::shared_ptr<Bucket> target = AcquireBucket(bucket, &gate);
    if (!target) {
        return S3Error::NoSuchBucket;
    }

    // No put can have stored such a key, so it is simply absent.
    if (!IsValidKey(key)) {
        Logger::Debug("DeleteObject " + bucket + ": invalid key of " + std::to_string(key.size()) +
                      " bytes, nothing to release", kComponent);
        return S3Error::None;
    }

    std::unique_lock<std::shared_mutex> key_lock(target->index.KeyMutex(key));

    std::optional<BlobRef> released = target->index.Delete(key);
    if (!released) {
        Logger::Debug("DeleteObject " + Path(bucket, key) + ": no such key, nothing to release", kComponent);
        return S3Error::None;
    }

    ReleaseBlob(*released, "delete " + Path(bucket, key));
    Logger::Debug("DeleteObject " + Path(bucket, key), kComponent);
    return S3Error::None;
}

size_t StorageEngine::BlobCount() {
    return blobs_->Count();
}
