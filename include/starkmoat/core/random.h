// STARKMOAT - Secure Random Number Generation Header
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// Cryptographically secure random bytes from the OS entropy source, and the
// RandomSource capability that secret generation draws from. Tests substitute
// SeededRandomSource to get reproducible secrets.

#ifndef STARKMOAT_CORE_RANDOM_H
#define STARKMOAT_CORE_RANDOM_H

#include <starkmoat/core/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <sys/types.h>

namespace starkmoat {

// ============================================================================
// Core Random Functions
// ============================================================================

/// Fill buffer with cryptographically secure random bytes
/// Uses OS entropy source (getrandom on Linux, arc4random on macOS/BSD).
/// Throws std::runtime_error if the OS source fails.
void GetRandBytes(uint8_t* buf, size_t len);

// ============================================================================
// Random Sources
// ============================================================================

/**
 * Source of random bytes.
 * 
 * Secret generation takes a RandomSource rather than calling the OS directly
 * so that callers can inject a deterministic stream.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    
    /// Fill buf with len random bytes
    virtual void Fill(uint8_t* buf, size_t len) = 0;
};

/// RandomSource backed by the OS entropy pool
class OSRandomSource : public RandomSource {
public:
    void Fill(uint8_t* buf, size_t len) override;
};

/**
 * Deterministic RandomSource for tests.
 * 
 * Block i of the stream is SHA256(seed || i), with i as a big-endian
 * 64-bit counter. Never use this for real secrets.
 */
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);
    
    void Fill(uint8_t* buf, size_t len) override;

private:
    uint64_t seed_;
    uint64_t counter_{0};
    Hash256 block_;
    size_t blockPos_{Hash256::SIZE};
    std::mutex mutex_;
    
    void NextBlock();
};

/// Process-wide OS random source
RandomSource& GetOSRandomSource();

// ============================================================================
// Internal Entropy Functions (Platform-Specific)
// ============================================================================

namespace detail {

/// Get entropy from OS - implementation is platform-specific
/// Returns true on success, false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

/// getrandom()-shaped read: bytes written, or -1 with errno set
using EntropyReader = std::function<ssize_t(uint8_t* buf, size_t len)>;

/// Fill buf from read, accepting short reads and retrying on EINTR
bool FillFromReader(uint8_t* buf, size_t len, const EntropyReader& read);

} // namespace detail

} // namespace starkmoat

#endif // STARKMOAT_CORE_RANDOM_H
