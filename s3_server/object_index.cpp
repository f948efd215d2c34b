#include "object_index.hpp"
#include <functional>
#include <mutex>

std::optional<BlobRef> ObjectIndex::Put(const std::string& key, const ObjectMeta& meta, const BlobRef& blob) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        entries_.emplace(key, IndexEntry{meta, blob});
        return std::nullopt;
    }

    BlobRef previous = it->second.blob;
    it->second = IndexEntry{meta, blob};
    return previous;
}

bool ObjectIndex::Get(const std::string& key, IndexEntry* entry) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    *entry = it->second;
    return true;
}

std::optional<BlobRef> ObjectIndex::Delete(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    BlobRef released = it->second.blob;
    entries_.erase(it);
    return released;
}

std::vector<ObjectSummary> ObjectIndex::ListSorted() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ObjectSummary> snapshot;
    snapshot.reserve(entries_.size());
    for (const auto& entry : entries_) {
        snapshot.push_back(ObjectSummary{entry.first, entry.second.meta});
    }
    return snapshot;
}

bool ObjectIndex::IsEmpty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.empty();
}

size_t ObjectIndex::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::shared_mutex& ObjectIndex::KeyMutex(const std::string& key) {
    return key_stripes_[std::hash<std::string>{}(key) % kKeyStripes];
}
