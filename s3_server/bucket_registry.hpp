#ifndef BUCKET_REGISTRY_HPP
#define BUCKET_REGISTRY_HPP

#include <chrono>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "object_index.hpp"
#include "s3_error.hpp"

struct Bucket {
    explicit Bucket(const std::string& bucket_name)
        : name(bucket_name), created(std::chrono::system_clock::now()) {}

    const std::string name;
    const std::chrono::system_clock::time_point created;
    ObjectIndex index;

    // Object mutations hold this shared; bucket deletion holds it exclusive
    // so the emptiness check cannot race with an in-flight put.
    std::shared_mutex gate;

    // Set under exclusive gate when the bucket leaves the registry. Operations
    // that resolved the bucket before that must re-check it under the gate.
    bool deleted = false;
};

struct BucketSummary {
    std::string name;
    std::chrono::system_clock::time_point created;
};

// Bucket name -> bucket. Names are unique for the lifetime of the registry.
class BucketRegistry {
public:
    BucketRegistry() = default;

    BucketRegistry(const BucketRegistry&) = delete;
    BucketRegistry& operator=(const BucketRegistry&) = delete;

    // BucketAlreadyExists if name is taken.
    S3Error Create(const std::string& name);

    bool Exists(const std::string& name) const;

    // nullptr if absent.
    std::shared_ptr<Bucket> Find(const std::string& name) const;

    // NoSuchBucket if absent, BucketNotEmpty if its index has any entry.
    // Never deletes objects.
    S3Error Delete(const std::string& name);

    // Ascending by name.
    std::vector<BucketSummary> List() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Bucket>> buckets_;
};

#endif // BUCKET_REGISTRY_HPP
