#pragma once

/**
 * @file store.hpp
 * @brief Type-partitioned registry of buckets
 *
 * The store maps std::type_index to one Bucket per interned type. Buckets
 * are created lazily on first use and live as long as the store. Hashes of
 * different types never meet: int32_t{7} and int64_t{7} hash equal but land
 * in different buckets.
 *
 * Locking:
 *   - The store's shared_mutex guards only the type -> bucket map. Lookups
 *     take a shared lock; creating a partition takes a unique lock.
 *   - Each bucket has its own mutex, so interning values of different types
 *     never contends.
 *   - gc() snapshots the bucket list, then sweeps each bucket under its own
 *     lock. No operation holds two bucket locks at once.
 *
 * Usage:
 *   auto& store = InternStore::global();
 *   auto a = store.intern(std::string("alpha"));
 *   auto b = store.intern(std::string("alpha"));
 *   // a == b (same slot)
 *   store.gc();  // removes slots no handle refers to
 */

#include "hashcons/bucket.hpp"
#include "hashcons/error.hpp"
#include "hashcons/hash.hpp"
#include "hashcons/internable.hpp"
#include "hashcons/interned.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace hashcons {

class InternStore {
public:
    InternStore() = default;
    ~InternStore() = default;

    // Non-copyable, non-movable (owns mutexes; handles point into buckets)
    InternStore(const InternStore&) = delete;
    InternStore& operator=(const InternStore&) = delete;

    // Process-wide store
    static InternStore& global();

    // Per-thread store (one per calling thread, destroyed with the thread)
    static InternStore& local();

    // Intern a value. Returns a handle to the existing slot if a value with
    // the same hash was interned before in this type's partition, otherwise
    // stores value in a new slot.
    //
    // Values are NOT compared: two different values whose hashes collide are
    // unified, and both handles see whichever value was stored first.
    template<Internable T>
    [[nodiscard]] Interned<T> intern(T value) {
        uint64_t hash = hashValue(value);
        return Interned<T>(bucket<T>().getOrInsert(hash, std::move(value)));
    }

    // Check whether a slot with value's hash exists in T's partition
    template<Internable T>
    [[nodiscard]] bool contains(const T& value) const {
        const Bucket<T>* b = findBucket<T>();
        return b != nullptr && b->contains(hashValue(value));
    }

    // Remove every slot that no handle refers to.
    // Returns the number of slots removed.
    size_t gc();

    // Total slots across all partitions
    [[nodiscard]] size_t size() const;

    // Slots in T's partition (0 if T was never interned)
    template<Internable T>
    [[nodiscard]] size_t size() const {
        const Bucket<T>* b = findBucket<T>();
        return b != nullptr ? b->size() : 0;
    }

    // Slots T's partition holds before rehashing (0 if T was never interned)
    template<Internable T>
    [[nodiscard]] size_t capacity() const {
        const Bucket<T>* b = findBucket<T>();
        return b != nullptr ? b->capacity() : 0;
    }

    // Number of type partitions created so far
    [[nodiscard]] size_t bucketCount() const;

    // Drop every slot from every partition. Outstanding handles stay valid.
    void clear();

private:
    using BucketFactory = std::unique_ptr<BucketBase> (*)(size_t reserve);

    [[nodiscard]] BucketBase* findBucket(std::type_index type) const;
    BucketBase& getOrCreateBucket(std::type_index type, BucketFactory factory);
    [[nodiscard]] std::vector<BucketBase*> snapshotBuckets() const;

    template<typename T>
    [[nodiscard]] static Bucket<T>& downcast(BucketBase& base) {
        auto* typed = dynamic_cast<Bucket<T>*>(&base);
        if (typed == nullptr) {
            throw InternError(std::string("InternStore: bucket type mismatch for ") +
                              typeid(T).name());
        }
        return *typed;
    }

    template<typename T>
    [[nodiscard]] const Bucket<T>* findBucket() const {
        BucketBase* base = findBucket(std::type_index(typeid(T)));
        if (base == nullptr) {
            return nullptr;
        }
        return &downcast<T>(*base);
    }

    template<typename T>
    Bucket<T>& bucket() {
        std::type_index type(typeid(T));
        if (BucketBase* base = findBucket(type)) {
            return downcast<T>(*base);
        }
        BucketFactory factory = [](size_t reserve) -> std::unique_ptr<BucketBase> {
            return std::make_unique<Bucket<T>>(reserve);
        };
        return downcast<T>(getOrCreateBucket(type, factory));
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<BucketBase>> buckets_;
};

}  // namespace hashcons
