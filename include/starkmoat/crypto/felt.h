// STARKMOAT - STARK Field Elements
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// Elements of the STARK prime field
//   P = 2^251 + 17 * 2^192 + 1
//     = 0x800000000000011000000000000000000000000000000000000000000000001
// Secrets, leaves, roots, nullifiers and account identities are all felts.

#ifndef STARKMOAT_CRYPTO_FELT_H
#define STARKMOAT_CRYPTO_FELT_H

#include <starkmoat/core/types.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace starkmoat {

// ============================================================================
// 256-bit Unsigned Integer
// ============================================================================

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;
    
    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;
    
    /// Default constructor - zero
    constexpr Uint256() : limbs{0, 0, 0, 0} {}
    
    /// Construct from limbs (little-endian)
    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}
    
    /// Construct from single value
    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}
    
    /// Construct from big-endian bytes. Inputs shorter than 32 bytes are
    /// left-padded with zeros; longer inputs keep the trailing 32 bytes.
    static Uint256 FromBigEndian(const Byte* data, size_t len);
    
    /// Convert to big-endian byte array (32 bytes)
    std::array<Byte, 32> ToBigEndian() const;
    
    /// Fixed-width hex (64 lowercase digits, no prefix)
    std::string ToHex() const;
    
    /// Check if zero
    bool IsZero() const;
    
    /// Comparison operators
    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const;
    bool operator>(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;
    
    /// Left shift; bits shifted past 2^255 are dropped
    Uint256 operator<<(int shift) const;
    
    /// Subtraction with explicit borrow (modular reduction is in Felt)
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
};

// ============================================================================
// Felt - element of the STARK prime field
// ============================================================================

/**
 * A field element in canonical form, i.e. always strictly less than MODULUS.
 * 
 * Every constructor reduces or rejects, so holding a Felt is proof of range.
 */
class Felt {
public:
    /// The STARK prime
    static const Uint256 MODULUS;
    
    /// Zero element
    Felt() = default;
    
    /// Construct from a small integer
    explicit Felt(uint64_t val) : value_(val) {}
    
    /// Reduce an arbitrary 256-bit value modulo P
    static Felt Reduce(const Uint256& val);
    
    /// Interpret up to 32 big-endian bytes as an integer and reduce modulo P
    static Felt FromBigEndian(const Byte* data, size_t len);
    
    /// Reduce a digest, read as a big-endian integer
    static Felt FromHash(const Hash256& hash) {
        return FromBigEndian(hash.data(), hash.size());
    }
    
    /**
     * Parse hex text. Accepts an optional 0x/0X prefix, 1 to 64 digits of
     * either case. Returns nullopt for empty or non-hex input and for values
     * that are not below P.
     */
    static std::optional<Felt> FromHex(const std::string& hex);
    
    /// Canonical text: "0x" + lowercase hex without leading zeros ("0x0" for zero)
    std::string ToHex() const;
    
    /// 32-byte big-endian encoding
    std::array<Byte, 32> ToBytes() const { return value_.ToBigEndian(); }
    
    /// Decode a 32-byte big-endian encoding; nullopt if not canonical
    static std::optional<Felt> FromBytes(const Byte* data, size_t len);
    
    const Uint256& Value() const { return value_; }
    
    bool IsZero() const { return value_.IsZero(); }
    
    bool operator==(const Felt& other) const { return value_ == other.value_; }
    bool operator!=(const Felt& other) const { return value_ != other.value_; }
    bool operator<(const Felt& other) const { return value_ < other.value_; }

private:
    Uint256 value_;
};

} // namespace starkmoat

#endif // STARKMOAT_CRYPTO_FELT_H
