// STARKMOAT - STARK Field Element Implementation
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <starkmoat/crypto/felt.h>
#include <starkmoat/core/hex.h>

#include <cctype>
#include <cstring>

namespace starkmoat {

// ============================================================================
// STARK Field Constants
// ============================================================================

// P = 2^251 + 17 * 2^192 + 1
const Uint256 Felt::MODULUS{
    0x0000000000000001ULL,  // limb 0 (least significant)
    0x0000000000000000ULL,  // limb 1
    0x0000000000000000ULL,  // limb 2
    0x0800000000000011ULL   // limb 3 (most significant)
};

namespace {

/// Largest k with (P << k) < 2^256. Any 256-bit value is below P << (k + 1).
constexpr int MAX_MODULUS_SHIFT = 4;

} // namespace

// ============================================================================
// Uint256 Implementation
// ============================================================================

Uint256 Uint256::FromBigEndian(const Byte* data, size_t len) {
    Byte temp[32] = {0};
    if (len >= 32) {
        std::memcpy(temp, data + (len - 32), 32);
    } else if (len > 0) {
        std::memcpy(temp + (32 - len), data, len);
    }
    
    Uint256 result;
    for (int i = 0; i < 4; ++i) {
        // limb 0 is taken from the last 8 bytes
        const Byte* p = temp + (3 - i) * 8;
        uint64_t limb = 0;
        for (int j = 0; j < 8; ++j) {
            limb = (limb << 8) | p[j];
        }
        result.limbs[i] = limb;
    }
    return result;
}

std::array<Byte, 32> Uint256::ToBigEndian() const {
    std::array<Byte, 32> result;
    for (int i = 0; i < 4; ++i) {
        uint64_t limb = limbs[3 - i];
        for (int j = 0; j < 8; ++j) {
            result[i * 8 + j] = static_cast<Byte>(limb >> (56 - 8 * j));
        }
    }
    return result;
}

std::string Uint256::ToHex() const {
    auto bytes = ToBigEndian();
    return BytesToHex(bytes.data(), bytes.size());
}

bool Uint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator<=(const Uint256& other) const {
    return !(other < *this);
}

bool Uint256::operator>(const Uint256& other) const {
    return other < *this;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

Uint256 Uint256::operator<<(int shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();
    
    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;
    
    for (int i = 3; i >= limbShift; --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift != 0 && i > limbShift) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }
    
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;
    
    for (int i = 0; i < 4; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) - 
                           static_cast<__uint128_t>(b.limbs[i]) - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>(diff >> 127) & 1;
    }
    
    borrow = (bw != 0);
    return result;
}

// ============================================================================
// Felt Implementation
// ============================================================================

Felt Felt::Reduce(const Uint256& val) {
    // Shift-subtract long division; val < 2^256 < 32 * P
    Uint256 rem = val;
    for (int shift = MAX_MODULUS_SHIFT; shift >= 0; --shift) {
        Uint256 m = MODULUS << shift;
        if (rem >= m) {
            bool borrow;
            rem = Uint256::Sub(rem, m, borrow);
        }
    }
    
    Felt result;
    result.value_ = rem;
    return result;
}

Felt Felt::FromBigEndian(const Byte* data, size_t len) {
    return Reduce(Uint256::FromBigEndian(data, len));
}

std::optional<Felt> Felt::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.empty() || digits.size() > 64) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    
    digits.insert(0, 64 - digits.size(), '0');
    auto bytes = HexToBytes(digits);
    Uint256 val = Uint256::FromBigEndian(bytes.data(), bytes.size());
    if (val >= MODULUS) {
        return std::nullopt;
    }
    
    Felt result;
    result.value_ = val;
    return result;
}

std::string Felt::ToHex() const {
    std::string digits = value_.ToHex();
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return "0x0";
    }
    return "0x" + digits.substr(first);
}

std::optional<Felt> Felt::FromBytes(const Byte* data, size_t len) {
    if (len != 32) {
        return std::nullopt;
    }
    Uint256 val = Uint256::FromBigEndian(data, len);
    if (val >= MODULUS) {
        return std::nullopt;
    }
    
    Felt result;
    result.value_ = val;
    return result;
}

} // namespace starkmoat
