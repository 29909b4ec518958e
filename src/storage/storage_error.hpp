// File: src/storage/storage_error.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace engram {

/// Raised when a snapshot cannot be read, written or decoded
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace engram
