#pragma once

/**
 * @file intern.hpp
 * @brief Entry points: intern values and sweep unreferenced slots
 *
 * Free functions operate on InternStore::global(). The hashcons::local
 * variants use a store owned by the calling thread; handles from it may
 * still be passed to and read from other threads.
 *
 * Usage:
 *   {
 *       auto a = hashcons::intern(std::string("alpha"));
 *       auto b = hashcons::intern(std::string("alpha"));
 *       assert(a == b);        // one slot
 *   }
 *   hashcons::gc();            // no handles left, slot reclaimed
 *
 * Collision policy: deduplication compares 64-bit hashes only. Two distinct
 * values of the same type that collide are unified, and every handle sees
 * the first value stored. Types that need strict separation must supply a
 * hashAppend that cannot collide for their value space.
 */

#include "hashcons/store.hpp"

#include <cstddef>
#include <utility>

namespace hashcons {

template<Internable T>
[[nodiscard]] Interned<T> intern(T value) {
    return InternStore::global().intern(std::move(value));
}

inline size_t gc() {
    return InternStore::global().gc();
}

[[nodiscard]] inline size_t size() {
    return InternStore::global().size();
}

template<Internable T>
[[nodiscard]] size_t size() {
    return InternStore::global().size<T>();
}

inline void clear() {
    InternStore::global().clear();
}

namespace local {

template<Internable T>
[[nodiscard]] Interned<T> intern(T value) {
    return InternStore::local().intern(std::move(value));
}

inline size_t gc() {
    return InternStore::local().gc();
}

[[nodiscard]] inline size_t size() {
    return InternStore::local().size();
}

template<Internable T>
[[nodiscard]] size_t size() {
    return InternStore::local().size<T>();
}

inline void clear() {
    InternStore::local().clear();
}

}  // namespace local

}  // namespace hashcons
