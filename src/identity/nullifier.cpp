// STARKMOAT - Leaf and Nullifier Derivation Implementation
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <starkmoat/identity/nullifier.h>
#include <starkmoat/crypto/sha256.h>

#include <array>

namespace starkmoat {
namespace identity {

// ============================================================================
// Action Context
// ============================================================================

bool ActionContext::HasAmbiguousField() const {
    return action.find(HASH_SEPARATOR) != std::string::npos ||
           root.find(HASH_SEPARATOR) != std::string::npos ||
           actor.find(HASH_SEPARATOR) != std::string::npos;
}

// ============================================================================
// Derivation
// ============================================================================

Felt HashToField(const std::vector<std::string>& parts) {
    SHA256 hasher;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            const Byte sep = static_cast<Byte>(HASH_SEPARATOR);
            hasher.Write(&sep, 1);
        }
        hasher.Write(parts[i]);
    }
    
    Hash256 digest;
    hasher.Finalize(digest.data());
    return Felt::FromHash(digest);
}

Felt GenerateSecret(RandomSource& rng) {
    std::array<Byte, 32> bytes;
    rng.Fill(bytes.data(), bytes.size());
    return Felt::FromBigEndian(bytes.data(), bytes.size());
}

Felt DeriveLeaf(const Felt& secret) {
    return HashToField({secret.ToHex()});
}

Felt DeriveActionHash(const std::string& domain,
                      const std::string& action,
                      const std::string& root,
                      const std::string& actor) {
    return HashToField({domain, action, root, actor});
}

Felt DeriveNullifier(const Felt& secret, const Felt& actionHash) {
    return HashToField({secret.ToHex(), actionHash.ToHex()});
}

} // namespace identity
} // namespace starkmoat
