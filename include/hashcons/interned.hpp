#pragma once

/**
 * @file interned.hpp
 * @brief Shared read-only handle to an interned value
 *
 * Interned<T> wraps a shared_ptr<const T> whose control block is the slot's
 * share count. The store's bucket holds one reference; every handle holds
 * another. Copying a handle never allocates.
 *
 * A handle stays valid for its whole lifetime. gc() only removes the slot
 * from future lookups; the payload is destroyed when the last holder lets go.
 *
 * Equality between handles is slot identity. Comparing a handle with a plain
 * T, or ordering handles, looks at the payload.
 */

#include "hashcons/hash.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <utility>

namespace hashcons {

class InternStore;

template<typename T>
class Interned {
public:
    Interned(const Interned&) = default;
    Interned& operator=(const Interned&) = default;
    Interned(Interned&&) noexcept = default;
    Interned& operator=(Interned&&) noexcept = default;
    ~Interned() = default;

    [[nodiscard]] const T& operator*() const { return *slot_; }
    [[nodiscard]] const T* operator->() const { return slot_.get(); }
    [[nodiscard]] const T& get() const { return *slot_; }

    // Number of strong holders: the bucket (if still listed) plus all handles
    [[nodiscard]] long useCount() const { return slot_.use_count(); }

    [[nodiscard]] static bool sameSlot(const Interned& a, const Interned& b) {
        return a.slot_.get() == b.slot_.get();
    }

    // Identity: same slot means same interned value
    friend bool operator==(const Interned& a, const Interned& b) {
        return sameSlot(a, b);
    }

    friend bool operator==(const Interned& a, const T& value) {
        return *a.slot_ == value;
    }

    friend auto operator<=>(const Interned& a, const Interned& b)
        requires std::three_way_comparable<T>
    {
        return *a.slot_ <=> *b.slot_;
    }

    friend auto operator<=>(const Interned& a, const T& value)
        requires std::three_way_comparable<T>
    {
        return *a.slot_ <=> value;
    }

    friend std::ostream& operator<<(std::ostream& os, const Interned& handle)
        requires requires(std::ostream& s, const T& v) { s << v; }
    {
        return os << "Interned(" << *handle.slot_ << ")";
    }

private:
    friend class InternStore;

    explicit Interned(std::shared_ptr<const T> slot) : slot_(std::move(slot)) {}

    std::shared_ptr<const T> slot_;
};

// Handles hash by payload so interned values can nest
template<typename T>
void hashAppend(Hasher& h, const Interned<T>& value) {
    hashAppend(h, value.get());
}

}  // namespace hashcons

template<typename T>
struct std::hash<hashcons::Interned<T>> {
    size_t operator()(const hashcons::Interned<T>& handle) const noexcept {
        return static_cast<size_t>(hashcons::hashValue(handle.get()));
    }
};
