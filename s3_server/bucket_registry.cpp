#include "bucket_registry.hpp"
#include <mutex>

S3Error BucketRegistry::Create(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (buckets_.count(name) > 0) {
        return S3Error::BucketAlreadyExists;
    }
    buckets_.emplace(name, std::make_shared<Bucket>(name));
    return S3Error::None;
}

bool BucketRegistry::Exists(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return buckets_.count(name) > 0;
}

std::shared_ptr<Bucket> BucketRegistry::Find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = buckets_.find(name);
    if (it == buckets_.end()) {
        return nullptr;
    }
    return it->second;
}

S3Error BucketRegistry::Delete(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = buckets_.find(name);
    if (it == buckets_.end()) {
        return S3Error::NoSuchBucket;
    }

    // Lock order: registry, then bucket gate. Object operations never take
    // the registry lock while holding a gate.
    std::shared_ptr<Bucket> bucket = it->second;
    std::unique_lock<std::shared_mutex> gate(bucket->gate);
    if (!bucket->index.IsEmpty()) {
        return S3Error::BucketNotEmpty;
    }
    bucket->deleted = true;
    buckets_.erase(it);
    return S3Error::None;
}

std::vector<BucketSummary> BucketRegistry::List() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<BucketSummary> result;
    result.reserve(buckets_.size());
    for (const auto& entry : buckets_) {
        result.push_back(BucketSummary{entry.first, entry.second->created});
    }
    return result;
}
