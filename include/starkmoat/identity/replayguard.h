// STARKMOAT - Local Replay Guard
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// Tracks nullifiers spent by this process. A nullifier is reserved while its
// action is in flight and committed only once the action is confirmed, so a
// failed or cancelled submission can be retried with the same nullifier.
//
// This guard is advisory and lives only as long as the process. It is not a
// substitute for an on-chain spent-nullifier check.

#ifndef STARKMOAT_IDENTITY_REPLAYGUARD_H
#define STARKMOAT_IDENTITY_REPLAYGUARD_H

#include <starkmoat/crypto/felt.h>

#include <cstddef>
#include <mutex>
#include <set>

namespace starkmoat {
namespace identity {

/// Outcome of CheckAndReserve
enum class ReserveResult {
    Reserved,     ///< Nullifier was free and is now reserved for the caller
    AlreadyUsed   ///< Nullifier is spent or reserved by another in-flight action
};

const char* ReserveResultToString(ReserveResult result);

/**
 * Set of spent nullifiers plus the set of in-flight reservations.
 * 
 * The spent set only grows. All methods are thread-safe; no lock is held
 * after a method returns.
 */
class ReplayGuard {
public:
    ReplayGuard() = default;
    
    ReplayGuard(const ReplayGuard&) = delete;
    ReplayGuard& operator=(const ReplayGuard&) = delete;
    
    /// Reserve a nullifier if it is neither spent nor already reserved
    ReserveResult CheckAndReserve(const Felt& nullifier);
    
    /// Mark a reserved nullifier as spent. Returns false if it was not reserved.
    bool Commit(const Felt& nullifier);
    
    /// Drop a reservation without spending. Returns false if it was not reserved.
    bool Release(const Felt& nullifier);
    
    /// Check if a nullifier has been spent
    bool IsUsed(const Felt& nullifier) const;
    
    /// Check if a nullifier is currently reserved
    bool IsReserved(const Felt& nullifier) const;
    
    /// Number of spent nullifiers
    size_t UsedCount() const;
    
    /// Number of in-flight reservations
    size_t ReservedCount() const;

private:
    std::set<Felt> used_;
    std::set<Felt> reserved_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Scoped Reservation
// ============================================================================

/**
 * RAII reservation. Releases the nullifier on destruction unless Commit()
 * was called, so an exception or early return while a submission is
 * outstanding leaves the guard as it was.
 */
class ScopedReservation {
public:
    /// Attempt to reserve; check Reserved() for the outcome
    ScopedReservation(ReplayGuard& guard, const Felt& nullifier);
    ~ScopedReservation();
    
    ScopedReservation(const ScopedReservation&) = delete;
    ScopedReservation& operator=(const ScopedReservation&) = delete;
    
    /// True if this object holds the reservation
    bool Reserved() const { return held_; }
    
    /// Spend the nullifier. Returns false if nothing was held.
    bool Commit();
    
    const Felt& Nullifier() const { return nullifier_; }

private:
    ReplayGuard& guard_;
    Felt nullifier_;
    bool held_;
};

} // namespace identity
} // namespace starkmoat

#endif // STARKMOAT_IDENTITY_REPLAYGUARD_H
