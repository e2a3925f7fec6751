// STARKMOAT - Group Root Registry
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// Tracks which membership-set roots are valid. One admin, fixed at
// initialization, may rotate the current root; every root ever accepted
// stays accepted so actions built against a superseded root still verify.

#ifndef STARKMOAT_REGISTRY_ROOTREGISTRY_H
#define STARKMOAT_REGISTRY_ROOTREGISTRY_H

#include <starkmoat/crypto/felt.h>
#include <starkmoat/db/database.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace starkmoat {
namespace registry {

/// An account identity as attested by the host (caller address)
using Identity = Felt;

/// Result of registry operations
enum class RegistryStatus {
    Ok,
    InvalidRoot,          ///< Zero root supplied
    NoOpRoot,             ///< New root equals the current root
    Unauthorized,         ///< Caller is not the admin
    NotInitialized,       ///< SetRoot before Initialize
    AlreadyInitialized,   ///< Second Initialize
    StorageError          ///< Database write failed or stored state is corrupt
};

const char* RegistryStatusToString(RegistryStatus status);

/// One root change, in acceptance order. Initialization is sequence 0 with
/// a zero previous root.
struct RootTransition {
    Felt previousRoot;
    Felt newRoot;
    Identity updatedBy;
    uint64_t sequence{0};
    
    static constexpr size_t SERIALIZED_SIZE = 96;
    
    /// previous || new || updatedBy, 32 bytes big-endian each
    std::string Serialize() const;
    static std::optional<RootTransition> Deserialize(uint64_t sequence,
                                                     const std::string& data);
    
    bool operator==(const RootTransition& other) const {
        return previousRoot == other.previousRoot && newRoot == other.newRoot &&
               updatedBy == other.updatedBy && sequence == other.sequence;
    }
};

/**
 * Admin-controlled root registry persisted in a key-value database.
 * 
 * Writers are serialized on one mutex and each state change is a single
 * atomic batch, so the stored state always satisfies:
 *  - the accepted set is empty iff the registry is uninitialized
 *  - the current root is in the accepted set
 *  - the admin never changes once written
 * 
 * The database must outlive the registry.
 */
class RootRegistry {
public:
    using TransitionListener = std::function<void(const RootTransition&)>;
    
    explicit RootRegistry(db::Database& db);
    
    RootRegistry(const RootRegistry&) = delete;
    RootRegistry& operator=(const RootRegistry&) = delete;
    
    /**
     * Rebuild in-memory state from the database. Call once after
     * construction when the database may already hold a registry.
     * @return Ok, or StorageError if the stored state is unreadable or
     *         violates the invariants above
     */
    RegistryStatus Load();
    
    /// Make caller the admin and accept initialRoot as the current root
    RegistryStatus Initialize(const Identity& caller, const Felt& initialRoot);
    
    /// Rotate the current root (admin only)
    RegistryStatus SetRoot(const Identity& caller, const Felt& newRoot);
    
    /// Current root, zero before initialization
    Felt GetCurrentRoot() const;
    
    /// True if root is or ever was the current root
    bool IsRootAccepted(const Felt& root) const;
    
    std::optional<Identity> GetAdmin() const;
    
    bool IsInitialized() const;
    
    /// All accepted roots in ascending order
    std::vector<Felt> GetAcceptedRoots() const;
    
    /// Transition log, oldest first
    std::vector<RootTransition> GetTransitions() const;
    
    /**
     * Register a callback for every stored transition.
     * 
     * Transitions are delivered one at a time in sequence order, with no
     * registry lock held, so a listener may read the registry, rotate it or
     * add listeners. A transition made from inside a listener is delivered
     * after the current one. Under concurrent writers, delivery may run on
     * whichever writer's thread is already delivering.
     */
    void AddTransitionListener(TransitionListener listener);

private:
    RegistryStatus Apply(const RootTransition& transition, bool initializing);
    void DeliverPending();
    
    db::Database& db_;
    
    mutable std::mutex mutex_;
    std::optional<Identity> admin_;
    Felt currentRoot_;
    std::set<Felt> acceptedRoots_;
    std::vector<RootTransition> transitions_;
    
    // Guarded by mutex_. pending_ is in sequence order; only the thread that
    // set delivering_ pops from it.
    std::vector<TransitionListener> listeners_;
    std::deque<RootTransition> pending_;
    bool delivering_{false};
};

} // namespace registry
} // namespace starkmoat

#endif // STARKMOAT_REGISTRY_ROOTREGISTRY_H
