// STARKMOAT - Anonymous Action Submission
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// The member side of an anonymous action: derive the nullifier for the
// action context, reserve it, hand the call to the transport and spend the
// nullifier only once the transport confirms.

#ifndef STARKMOAT_IDENTITY_SIGNAL_H
#define STARKMOAT_IDENTITY_SIGNAL_H

#include <starkmoat/core/random.h>
#include <starkmoat/core/types.h>
#include <starkmoat/crypto/felt.h>
#include <starkmoat/identity/replayguard.h>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace starkmoat {

namespace registry {
class RootRegistry;
}

namespace identity {

// ============================================================================
// Transport
// ============================================================================

/// A contract invocation
struct ActionCall {
    std::string contractAddress;
    std::string entrypoint;
    std::vector<std::string> calldata;
};

/// What the transport reported
struct SubmitResult {
    bool success{false};
    std::string txHash;
    std::string error;
    
    static SubmitResult Accepted(const std::string& txHash) {
        return {true, txHash, ""};
    }
    static SubmitResult Failed(const std::string& error) {
        return {false, "", error};
    }
};

/**
 * Sends calls to the ledger under the connected account. May block; it is
 * always called without any guard or service lock held. Throwing is allowed
 * and leaves the nullifier unspent.
 */
class ActionSubmitter {
public:
    virtual ~ActionSubmitter() = default;
    virtual SubmitResult Submit(const ActionCall& call) = 0;
};

/// Split calldata text on commas and newlines, trimming items and dropping
/// empty ones
std::vector<std::string> ParseCalldata(const std::string& raw);

// ============================================================================
// Credentials and Requests
// ============================================================================

/// A member's secret and the leaf that was enrolled for it
struct MemberCredential {
    Felt secret;
    Felt leaf;
    
    static MemberCredential Generate(RandomSource& rng = GetOSRandomSource());
    static MemberCredential FromSecret(const Felt& secret);
    
    /// True if leaf is the leaf of secret
    bool IsConsistent() const;
};

struct SignalRequest {
    std::optional<MemberCredential> credential;
    std::string action;
    std::string root;
    std::string actor;
    std::string targetContract;
    std::string rawCalldata;
};

enum class SignalStatus {
    Ok,
    InvalidRequest,     ///< Missing credential, actor, target or entrypoint
    RootNotAccepted,    ///< Registry attached and the root is not accepted
    ReplayBlocked,      ///< Nullifier already spent or in flight
    SubmissionFailed    ///< Transport rejected the call; safe to retry
};

const char* SignalStatusToString(SignalStatus status);

struct SignalResult {
    SignalStatus status{SignalStatus::InvalidRequest};
    std::optional<Felt> nullifier;
    std::string txHash;
    std::string error;
    
    bool ok() const { return status == SignalStatus::Ok; }
};

/// One accepted signal
struct SignalEvent {
    std::string action;
    Felt nullifier;
    std::string txHash;
    Timestamp createdAt{0};
};

// ============================================================================
// Signal Service
// ============================================================================

class SignalService {
public:
    struct Config {
        std::string domain;
        std::string entrypoint{"signal"};
        bool appendNullifier{true};
    };
    
    /// submitter, guard and registry must outlive the service
    SignalService(ActionSubmitter& submitter, ReplayGuard& guard,
                  const registry::RootRegistry* registry = nullptr);
    
    SignalService(const SignalService&) = delete;
    SignalService& operator=(const SignalService&) = delete;
    
    void SetConfig(const Config& config);
    Config GetConfig() const;
    
    SignalResult Submit(const SignalRequest& request);
    
    /// Accepted signals, newest first
    std::vector<SignalEvent> GetSignals() const;
    
    size_t SignalCount() const;

private:
    ActionSubmitter& submitter_;
    ReplayGuard& guard_;
    const registry::RootRegistry* registry_;
    
    mutable std::mutex mutex_;
    Config config_;
    std::vector<SignalEvent> signals_;
};

} // namespace identity
} // namespace starkmoat

#endif // STARKMOAT_IDENTITY_SIGNAL_H
