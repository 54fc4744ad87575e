#pragma once

/**
 * @file bucket.hpp
 * @brief Per-type map from 64-bit hash to shared slot
 *
 * One Bucket exists per interned type. All lookups, inserts and sweeps on a
 * bucket run under its mutex, so "is the bucket the only holder?" and
 * "erase it" happen atomically with respect to a concurrent intern that
 * would hand out a new reference to the same slot.
 *
 * Thread-safety: all public methods are thread-safe.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace hashcons {

// Type-erased view used by InternStore for sweeping and bookkeeping
class BucketBase {
public:
    virtual ~BucketBase() = default;

    // Erase every slot held only by this bucket. Returns the number erased.
    virtual size_t sweep() = 0;

    [[nodiscard]] virtual size_t size() const = 0;

    // Slots that fit before the hash table has to grow
    [[nodiscard]] virtual size_t capacity() const = 0;

    // Drop every slot; outstanding handles keep their payloads
    virtual void clear() = 0;

    [[nodiscard]] virtual std::type_index type() const = 0;
};

template<typename T>
class Bucket final : public BucketBase {
public:
    using Slot = std::shared_ptr<const T>;

    explicit Bucket(size_t reserve = 0) {
        if (reserve > 0) {
            slots_.reserve(reserve);
        }
    }

    Bucket(const Bucket&) = delete;
    Bucket& operator=(const Bucket&) = delete;

    // Return the slot stored under hash, or store value as a new slot.
    // An existing slot is returned as-is; its payload is never compared
    // against value.
    Slot getOrInsert(uint64_t hash, T&& value) {
        std::lock_guard lock(mutex_);
        auto it = slots_.find(hash);
        if (it != slots_.end()) {
            return it->second;
        }

        Slot slot = std::make_shared<const T>(std::move(value));
        slots_.emplace(hash, slot);
        return slot;
    }

    [[nodiscard]] bool contains(uint64_t hash) const {
        std::lock_guard lock(mutex_);
        return slots_.contains(hash);
    }

    // Introspection: visit every (hash, value) pair under the bucket lock.
    // sweep() does its own pass since it needs to erase while iterating.
    // The visitor must not call back into this bucket.
    template<typename Func>
    void forEachSlot(Func&& func) const {
        std::lock_guard lock(mutex_);
        for (const auto& [hash, slot] : slots_) {
            func(hash, *slot);
        }
    }

    size_t sweep() override {
        std::lock_guard lock(mutex_);
        return std::erase_if(slots_, [](const auto& entry) {
            return entry.second.use_count() == 1;
        });
    }

    [[nodiscard]] size_t size() const override {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

    [[nodiscard]] size_t capacity() const override {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(static_cast<float>(slots_.bucket_count()) *
                                   slots_.max_load_factor());
    }

    void clear() override {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    [[nodiscard]] std::type_index type() const override {
        return std::type_index(typeid(T));
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, Slot> slots_;
};

}  // namespace hashcons
