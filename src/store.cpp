#include "hashcons/store.hpp"
#include "hashcons/config.hpp"

#include <iostream>
#include <mutex>

namespace hashcons {

InternStore& InternStore::global() {
    static InternStore instance;
    return instance;
}

InternStore& InternStore::local() {
    thread_local InternStore instance;
    return instance;
}

BucketBase* InternStore::findBucket(std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = buckets_.find(type);
    if (it == buckets_.end()) {
        return nullptr;
    }
    return it->second.get();
}

BucketBase& InternStore::getOrCreateBucket(std::type_index type, BucketFactory factory) {
    std::unique_lock lock(mutex_);

    // Double-check after acquiring write lock
    auto it = buckets_.find(type);
    if (it != buckets_.end()) {
        return *it->second;
    }

    auto& config = InternConfig::instance();
    auto inserted = buckets_.emplace(type, factory(config.bucketReserve()));
    if (config.debugLogging()) {
        std::cerr << "[InternStore] New partition for " << type.name() << '\n';
    }
    return *inserted.first->second;
}

std::vector<BucketBase*> InternStore::snapshotBuckets() const {
    std::shared_lock lock(mutex_);
    std::vector<BucketBase*> result;
    result.reserve(buckets_.size());
    for (const auto& [type, bucket] : buckets_) {
        result.push_back(bucket.get());
    }
    return result;
}

size_t InternStore::gc() {
    // Buckets are never removed, so the pointers outlive the store lock
    size_t reclaimed = 0;
    size_t remaining = 0;
    for (BucketBase* bucket : snapshotBuckets()) {
        reclaimed += bucket->sweep();
        remaining += bucket->size();
    }

    if (InternConfig::instance().debugLogging()) {
        std::cerr << "[InternStore] gc reclaimed " << reclaimed
                  << " slot(s), " << remaining << " live\n";
    }
    return reclaimed;
}

size_t InternStore::size() const {
    size_t total = 0;
    for (BucketBase* bucket : snapshotBuckets()) {
        total += bucket->size();
    }
    return total;
}

size_t InternStore::bucketCount() const {
    std::shared_lock lock(mutex_);
    return buckets_.size();
}

void InternStore::clear() {
    for (BucketBase* bucket : snapshotBuckets()) {
        bucket->clear();
    }
}

}  // namespace hashcons
