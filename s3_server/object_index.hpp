#ifndef OBJECT_INDEX_HPP
#define OBJECT_INDEX_HPP

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "blob_store.hpp"

struct ObjectMeta {
    size_t size = 0;
    std::string etag;
    std::chrono::system_clock::time_point last_modified;
};

struct IndexEntry {
    ObjectMeta meta;
    BlobRef blob;
};

struct ObjectSummary {
    std::string key;
    ObjectMeta meta;
};

// Key -> current version of one bucket's objects, kept in lexicographic
// (byte-wise) key order.
//
// The map itself is guarded by a reader/writer lock held only for the
// duration of a single lookup or mutation. Callers that need a longer
// critical section around one key (store blob, swap entry, release old blob)
// take KeyMutex(key) exclusively; readers of that key take it shared.
class ObjectIndex {
public:
    ObjectIndex() = default;

    ObjectIndex(const ObjectIndex&) = delete;
    ObjectIndex& operator=(const ObjectIndex&) = delete;

    // Inserts or replaces the entry for key. Returns the blob the previous
    // version referenced so the caller can release it.
    std::optional<BlobRef> Put(const std::string& key, const ObjectMeta& meta, const BlobRef& blob);

    // Returns false if key is absent.
    bool Get(const std::string& key, IndexEntry* entry) const;

    // Removes key. Returns the blob to release, or nullopt if the key was
    // already absent.
    std::optional<BlobRef> Delete(const std::string& key);

    // Point-in-time copy of every entry in ascending key order. Each call
    // takes a fresh snapshot; later mutations do not affect a returned list.
    std::vector<ObjectSummary> ListSorted() const;

    bool IsEmpty() const;
    size_t Size() const;

    // Striped per-key lock. Two keys may share a stripe; that only costs
    // concurrency, never correctness.
    std::shared_mutex& KeyMutex(const std::string& key);

private:
    static constexpr size_t kKeyStripes = 64;

    mutable std::shared_mutex mutex_;
    std::map<std::string, IndexEntry> entries_;
    std::array<std::shared_mutex, kKeyStripes> key_stripes_;
};

#endif // OBJECT_INDEX_HPP
