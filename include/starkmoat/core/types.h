// STARKMOAT - Core Types Header
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// This file defines fundamental types used throughout STARKMOAT.

#ifndef STARKMOAT_CORE_TYPES_H
#define STARKMOAT_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace starkmoat {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

// ============================================================================
// Time
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size digest. Bytes are kept in the order the hash function emitted them.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    constexpr size_t size() const noexcept { return SIZE; }
    
    auto begin() noexcept { return data_.begin(); }
    auto end() noexcept { return data_.end(); }
    auto begin() const noexcept { return data_.begin(); }
    auto end() const noexcept { return data_.end(); }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return data_ != other.data_;
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

private:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (SHA256 output)
using Hash256 = BaseHash<256>;

} // namespace starkmoat

#endif // STARKMOAT_CORE_TYPES_H
