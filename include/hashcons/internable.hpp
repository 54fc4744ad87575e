#pragma once

/**
 * @file internable.hpp
 * @brief Capability marker for types that can be interned
 *
 * A type is internable when it
 *   - has a deterministic hash: an ADL-visible hashAppend(Hasher&, const T&)
 *   - can be shared across threads: a plain object type (no const, volatile,
 *     reference or raw pointer) that is only ever exposed as const T
 *   - defines equality with operator==
 *
 * Equality is part of the contract but deduplication never calls it; two
 * values are the same interned value when their hashes match. Keeping the
 * requirement leaves room for a stricter, equality-checked store later.
 */

#include "hashcons/hash.hpp"

#include <concepts>
#include <type_traits>

namespace hashcons {

template<typename T>
concept Hashable = requires(Hasher& h, const T& value) {
    hashAppend(h, value);
};

template<typename T>
concept Shareable = std::is_object_v<T> &&
                    !std::is_const_v<T> &&
                    !std::is_volatile_v<T> &&
                    !std::is_pointer_v<T> &&
                    !std::is_array_v<T> &&
                    std::move_constructible<T> &&
                    std::destructible<T>;

template<typename T>
concept Internable = Hashable<T> && Shareable<T> && std::equality_comparable<T>;

}  // namespace hashcons
