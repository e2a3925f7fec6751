// STARKMOAT - Secure Random Number Generation Implementation
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <starkmoat/core/random.h>
#include <starkmoat/crypto/sha256.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

// Platform-specific includes
#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>  // arc4random_buf
#else
    #include <fstream>
#endif

namespace starkmoat {

namespace detail {

bool FillFromReader(uint8_t* buf, size_t len, const EntropyReader& read) {
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = read(buf + filled, len - filled);
        if (ret < 0 && errno == EINTR) {
            continue;
        }
        if (ret <= 0) {
            return false;
        }
        filled += static_cast<size_t>(ret);
    }
    return true;
}

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    // getrandom() may return short reads for large requests
    return FillFromReader(buf, len, [](uint8_t* out, size_t n) {
        return getrandom(out, n, 0);
    });

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;

#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), len);
    return urandom.good();
#endif
}

} // namespace detail

// ============================================================================
// Core Random Functions
// ============================================================================

void GetRandBytes(uint8_t* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

// ============================================================================
// Random Sources
// ============================================================================

void OSRandomSource::Fill(uint8_t* buf, size_t len) {
    GetRandBytes(buf, len);
}

SeededRandomSource::SeededRandomSource(uint64_t seed) : seed_(seed) {}

void SeededRandomSource::NextBlock() {
    Byte input[16];
    for (int i = 0; i < 8; ++i) {
        input[i] = static_cast<Byte>(seed_ >> (56 - 8 * i));
        input[8 + i] = static_cast<Byte>(counter_ >> (56 - 8 * i));
    }
    ++counter_;
    block_ = SHA256Hash(input, sizeof(input));
    blockPos_ = 0;
}

void SeededRandomSource::Fill(uint8_t* buf, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    while (len > 0) {
        if (blockPos_ == Hash256::SIZE) {
            NextBlock();
        }
        size_t n = std::min(len, Hash256::SIZE - blockPos_);
        std::memcpy(buf, block_.data() + blockPos_, n);
        blockPos_ += n;
        buf += n;
        len -= n;
    }
}

RandomSource& GetOSRandomSource() {
    static OSRandomSource source;
    return source;
}

} // namespace starkmoat
