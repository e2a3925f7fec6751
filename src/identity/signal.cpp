// STARKMOAT - Anonymous Action Submission Implementation
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <starkmoat/identity/signal.h>
#include <starkmoat/core/hex.h>
#include <starkmoat/identity/nullifier.h>
#include <starkmoat/registry/rootregistry.h>
#include <starkmoat/util/logging.h>

namespace starkmoat {
namespace identity {

std::vector<std::string> ParseCalldata(const std::string& raw) {
    std::vector<std::string> items;
    const char* whitespace = " \t\r";
    
    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find_first_of(",\n", start);
        if (end == std::string::npos) {
            end = raw.size();
        }
        
        std::string item = raw.substr(start, end - start);
        size_t first = item.find_first_not_of(whitespace);
        if (first != std::string::npos) {
            size_t last = item.find_last_not_of(whitespace);
            items.push_back(item.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    
    return items;
}

// ============================================================================
// MemberCredential
// ============================================================================

MemberCredential MemberCredential::Generate(RandomSource& rng) {
    return FromSecret(GenerateSecret(rng));
}

MemberCredential MemberCredential::FromSecret(const Felt& secret) {
    MemberCredential credential;
    credential.secret = secret;
    credential.leaf = DeriveLeaf(secret);
    return credential;
}

bool MemberCredential::IsConsistent() const {
    return DeriveLeaf(secret) == leaf;
}

const char* SignalStatusToString(SignalStatus status) {
    switch (status) {
        case SignalStatus::Ok: return "ok";
        case SignalStatus::InvalidRequest: return "invalid-request";
        case SignalStatus::RootNotAccepted: return "root-not-accepted";
        case SignalStatus::ReplayBlocked: return "replay-blocked";
        case SignalStatus::SubmissionFailed: return "submission-failed";
    }
    return "unknown";
}

// ============================================================================
// SignalService
// ============================================================================

SignalService::SignalService(ActionSubmitter& submitter, ReplayGuard& guard,
                             const registry::RootRegistry* registry)
    : submitter_(submitter), guard_(guard), registry_(registry) {}

void SignalService::SetConfig(const Config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

SignalService::Config SignalService::GetConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

SignalResult SignalService::Submit(const SignalRequest& request) {
    SignalResult result;
    Config config = GetConfig();
    
    auto reject = [&result](SignalStatus status, const std::string& why) {
        LOG_DEBUG(util::LogCategory::SIGNAL) << "Signal rejected ("
                                             << SignalStatusToString(status) << "): " << why;
        result.status = status;
        result.error = why;
        return result;
    };
    
    if (!request.credential) {
        return reject(SignalStatus::InvalidRequest, "no member credential");
    }
    if (!request.credential->IsConsistent()) {
        return reject(SignalStatus::InvalidRequest, "leaf does not match secret");
    }
    if (request.actor.empty()) {
        return reject(SignalStatus::InvalidRequest, "no actor");
    }
    if (request.targetContract.empty() || config.entrypoint.empty()) {
        return reject(SignalStatus::InvalidRequest, "no target contract or entrypoint");
    }
    
    if (registry_) {
        auto root = Felt::FromHex(request.root);
        if (!root || !registry_->IsRootAccepted(*root)) {
            return reject(SignalStatus::RootNotAccepted, "root " + request.root + " is not accepted");
        }
    }
    
    ActionContext context{config.domain, request.action, request.root, request.actor};
    if (context.HasAmbiguousField()) {
        LOG_WARN(util::LogCategory::SIGNAL) << "Action context contains '" << HASH_SEPARATOR
                                            << "'; it may collide with another context";
    }
    
    Felt nullifier = DeriveNullifier(request.credential->secret, context);
    result.nullifier = nullifier;
    
    ScopedReservation reservation(guard_, nullifier);
    if (!reservation.Reserved()) {
        LOG_WARN(util::LogCategory::SIGNAL) << "Replay blocked. Nullifier already used: "
                                            << ShortHex(nullifier.ToHex());
        return reject(SignalStatus::ReplayBlocked, "nullifier already used");
    }
    
    ActionCall call;
    call.contractAddress = request.targetContract;
    call.entrypoint = config.entrypoint;
    call.calldata = ParseCalldata(request.rawCalldata);
    if (config.appendNullifier) {
        call.calldata.push_back(nullifier.ToHex());
    }
    
    SubmitResult submitted = submitter_.Submit(call);
    if (!submitted.success) {
        LOG_WARN(util::LogCategory::SIGNAL) << "Submission failed: " << submitted.error;
        result.status = SignalStatus::SubmissionFailed;
        result.error = submitted.error;
        return result;   // reservation released
    }
    
    reservation.Commit();
    
    SignalEvent event;
    event.action = request.action;
    event.nullifier = nullifier;
    event.txHash = submitted.txHash;
    event.createdAt = GetTime();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        signals_.insert(signals_.begin(), event);
    }
    
    LOG_INFO(util::LogCategory::SIGNAL) << "Invoke submitted: " << ShortHex(submitted.txHash)
                                        << " nullifier " << ShortHex(nullifier.ToHex());
    
    result.status = SignalStatus::Ok;
    result.txHash = submitted.txHash;
    return result;
}

std::vector<SignalEvent> SignalService::GetSignals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_;
}

size_t SignalService::SignalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_.size();
}

} // namespace identity
} // namespace starkmoat
