// STARKMOAT - Local Replay Guard Implementation
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <starkmoat/identity/replayguard.h>

namespace starkmoat {
namespace identity {

const char* ReserveResultToString(ReserveResult result) {
    switch (result) {
        case ReserveResult::Reserved:    return "reserved";
        case ReserveResult::AlreadyUsed: return "already-used";
        default:                         return "unknown";
    }
}

// ============================================================================
// ReplayGuard
// ============================================================================

ReserveResult ReplayGuard::CheckAndReserve(const Felt& nullifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (used_.count(nullifier) > 0) {
        return ReserveResult::AlreadyUsed;
    }
    if (!reserved_.insert(nullifier).second) {
        return ReserveResult::AlreadyUsed;
    }
    return ReserveResult::Reserved;
}

bool ReplayGuard::Commit(const Felt& nullifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (reserved_.erase(nullifier) == 0) {
        return false;
    }
    used_.insert(nullifier);
    return true;
}

bool ReplayGuard::Release(const Felt& nullifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.erase(nullifier) > 0;
}

bool ReplayGuard::IsUsed(const Felt& nullifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_.count(nullifier) > 0;
}

bool ReplayGuard::IsReserved(const Felt& nullifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.count(nullifier) > 0;
}

size_t ReplayGuard::UsedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_.size();
}

size_t ReplayGuard::ReservedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.size();
}

// ============================================================================
// ScopedReservation
// ============================================================================

ScopedReservation::ScopedReservation(ReplayGuard& guard, const Felt& nullifier)
    : guard_(guard)
    , nullifier_(nullifier)
    , held_(guard.CheckAndReserve(nullifier) == ReserveResult::Reserved) {}

ScopedReservation::~ScopedReservation() {
    if (held_) {
        guard_.Release(nullifier_);
    }
}

bool ScopedReservation::Commit() {
    if (!held_) {
        return false;
    }
    held_ = false;
    return guard_.Commit(nullifier_);
}

} // namespace identity
} // namespace starkmoat
