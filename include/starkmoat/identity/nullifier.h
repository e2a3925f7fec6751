// STARKMOAT - Leaf and Nullifier Derivation
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// A member holds a random secret felt. From it they derive:
// - a leaf, the public commitment enrolled into the membership set
// - one nullifier per action context, a single-use token that is the same
//   every time the same secret acts in the same context
//
// Key properties:
// - Deterministic: same secret + context = same nullifier
// - Unlinkable: nullifiers from one secret in different contexts cannot be
//   linked without the secret (one-wayness of SHA-256)
// - Pure: no shared state, safe to call from any thread

#ifndef STARKMOAT_IDENTITY_NULLIFIER_H
#define STARKMOAT_IDENTITY_NULLIFIER_H

#include <starkmoat/core/random.h>
#include <starkmoat/crypto/felt.h>

#include <string>
#include <vector>

namespace starkmoat {
namespace identity {

/// Separator placed between hash inputs
constexpr char HASH_SEPARATOR = '|';

// ============================================================================
// Action Context
// ============================================================================

/**
 * The public description of what a member is authorizing.
 * 
 * The root and actor are kept as the text the caller supplied; they are
 * hashed verbatim, so "0x11" and "0x011" are different contexts.
 */
struct ActionContext {
    /// Domain separator, e.g. "SN_SEPOLIA|<account>|<registry>"
    std::string domain;
    
    /// Action label / intent, e.g. "signal:vote"
    std::string action;
    
    /// Membership root the action is made against
    std::string root;
    
    /// Identifier of the on-chain actor slot submitting the action
    std::string actor;
    
    /// True if action, root or actor contains HASH_SEPARATOR. Such contexts
    /// can collide with a different tuple once joined.
    bool HasAmbiguousField() const;
};

// ============================================================================
// Derivation
// ============================================================================

/// Join parts with HASH_SEPARATOR, SHA-256 the bytes, reduce the big-endian
/// digest modulo P
Felt HashToField(const std::vector<std::string>& parts);

/// Draw 32 bytes from rng and reduce modulo P
Felt GenerateSecret(RandomSource& rng = GetOSRandomSource());

/// Leaf = HashToField([secret])
Felt DeriveLeaf(const Felt& secret);

/// ActionHash = HashToField([domain, action, root, actor])
Felt DeriveActionHash(const std::string& domain,
                      const std::string& action,
                      const std::string& root,
                      const std::string& actor);

inline Felt DeriveActionHash(const ActionContext& context) {
    return DeriveActionHash(context.domain, context.action,
                            context.root, context.actor);
}

/// Nullifier = HashToField([secret, actionHash])
Felt DeriveNullifier(const Felt& secret, const Felt& actionHash);

inline Felt DeriveNullifier(const Felt& secret, const ActionContext& context) {
    return DeriveNullifier(secret, DeriveActionHash(context));
}

} // namespace identity
} // namespace starkmoat

#endif // STARKMOAT_IDENTITY_NULLIFIER_H
