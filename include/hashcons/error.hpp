#pragma once

#include <stdexcept>
#include <string>

namespace hashcons {

// Thrown when the store's internal invariants are broken (for example a
// bucket registered under one type but holding another). Not recoverable;
// callers should let it propagate.
class InternError : public std::logic_error {
public:
    explicit InternError(const std::string& what) : std::logic_error(what) {}
};

}  // namespace hashcons
