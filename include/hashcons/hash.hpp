#pragma once

/**
 * @file hash.hpp
 * @brief Fixed 64-bit streaming hash used for every interned value
 *
 * The hash is FNV-1a over a canonical byte stream, followed by a 64-bit
 * avalanche finalizer. It is deterministic across runs and platforms
 * (integers are fed little-endian, floating point zero is normalized) but
 * it is NOT collision resistant. Interning treats equal hashes as equal
 * values, see intern.hpp.
 *
 * Types opt in by providing an ADL-visible overload:
 *
 *   struct Point { int32_t x, y; bool operator==(const Point&) const = default; };
 *   void hashAppend(hashcons::Hasher& h, const Point& p) {
 *       hashAppend(h, p.x);
 *       hashAppend(h, p.y);
 *   }
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace hashcons {

class Hasher {
public:
    static constexpr uint64_t OFFSET_BASIS = 0xcbf29ce484222325ULL;
    static constexpr uint64_t PRIME = 0x100000001b3ULL;

    Hasher() = default;

    void writeByte(uint8_t byte) {
        state_ ^= byte;
        state_ *= PRIME;
    }

    void writeBytes(const void* data, size_t size) {
        const auto* bytes = static_cast<const uint8_t*>(data);
        for (size_t i = 0; i < size; ++i) {
            writeByte(bytes[i]);
        }
    }

    // Little-endian regardless of host byte order
    void writeU64(uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            writeByte(static_cast<uint8_t>(value >> (i * 8)));
        }
    }

    // Length prefix for variable-sized sequences (keeps ("ab","c") != ("a","bc"))
    void writeLength(size_t length) { writeU64(static_cast<uint64_t>(length)); }

    [[nodiscard]] uint64_t finish() const {
        uint64_t h = state_;
        h ^= h >> 31;
        h *= 0xbf58476d1ce4e5b9ULL;
        h ^= h >> 31;
        h *= 0x94d049bb133111ebULL;
        h ^= h >> 31;
        return h;
    }

private:
    uint64_t state_ = OFFSET_BASIS;
};

// ============================================================================
// hashAppend overloads for standard types
// ============================================================================

// All integers widen to 64 bits, so int32_t{7} and int64_t{7} hash equal.
// Type partitioning in the store keeps them apart.
template<typename T>
    requires std::is_integral_v<T>
void hashAppend(Hasher& h, T value) {
    if constexpr (std::is_signed_v<T>) {
        h.writeU64(static_cast<uint64_t>(static_cast<int64_t>(value)));
    } else {
        h.writeU64(static_cast<uint64_t>(value));
    }
}

template<typename T>
    requires std::is_floating_point_v<T>
void hashAppend(Hasher& h, T value) {
    double d = static_cast<double>(value);
    if (d == 0.0) {
        d = 0.0;  // -0.0 == 0.0
    }
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    h.writeU64(bits);
}

template<typename T>
    requires std::is_enum_v<T>
void hashAppend(Hasher& h, T value) {
    hashAppend(h, static_cast<std::underlying_type_t<T>>(value));
}

inline void hashAppend(Hasher& h, const std::string& value) {
    h.writeLength(value.size());
    h.writeBytes(value.data(), value.size());
}

template<typename A, typename B>
void hashAppend(Hasher& h, const std::pair<A, B>& value) {
    hashAppend(h, value.first);
    hashAppend(h, value.second);
}

template<typename... Ts>
void hashAppend(Hasher& h, const std::tuple<Ts...>& value) {
    std::apply([&h](const auto&... elems) { (hashAppend(h, elems), ...); }, value);
}

template<typename T, size_t N>
void hashAppend(Hasher& h, const std::array<T, N>& value) {
    for (const auto& elem : value) {
        hashAppend(h, elem);
    }
}

template<typename T, typename Alloc>
void hashAppend(Hasher& h, const std::vector<T, Alloc>& value) {
    h.writeLength(value.size());
    for (const auto& elem : value) {
        hashAppend(h, elem);
    }
}

template<typename T>
void hashAppend(Hasher& h, const std::optional<T>& value) {
    h.writeByte(value.has_value() ? 1 : 0);
    if (value) {
        hashAppend(h, *value);
    }
}

// Hash a single value from a fresh hasher
template<typename T>
[[nodiscard]] uint64_t hashValue(const T& value) {
    Hasher h;
    hashAppend(h, value);
    return h.finish();
}

}  // namespace hashcons
