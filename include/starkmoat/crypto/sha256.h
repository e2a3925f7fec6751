// STARKMOAT - SHA256 Hash Function
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// SHA-256 hasher over OpenSSL's EVP digest interface.

#ifndef STARKMOAT_CRYPTO_SHA256_H
#define STARKMOAT_CRYPTO_SHA256_H

#include <starkmoat/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Forward declaration to keep OpenSSL headers out of the public interface
struct evp_md_ctx_st;

namespace starkmoat {

/// SHA-256 hasher class
/// Provides incremental hashing capability
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    /// Default constructor - initializes to empty state
    /// Throws std::runtime_error if OpenSSL cannot allocate a digest context
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);
    
    /// Write the bytes of a string
    SHA256& Write(const std::string& str) {
        return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    }
    
    /// Finalize the hash and write to output. The hasher must be Reset()
    /// before it is used again.
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
/// @param data Input data
/// @param len Length of input
/// @return Hash256 containing the result
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256 hash of the bytes of a string
inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace starkmoat

#endif // STARKMOAT_CRYPTO_SHA256_H
