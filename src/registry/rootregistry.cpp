// STARKMOAT - Group Root Registry Implementation
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <starkmoat/registry/rootregistry.h>
#include <starkmoat/core/hex.h>
#include <starkmoat/util/logging.h>

#include <algorithm>

namespace starkmoat {
namespace registry {

namespace {

constexpr size_t FELT_SIZE = 32;

std::string FeltBytes(const Felt& value) {
    auto bytes = value.ToBytes();
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::optional<Felt> FeltFromBytes(const std::string& data, size_t offset = 0) {
    if (data.size() < offset + FELT_SIZE) {
        return std::nullopt;
    }
    return Felt::FromBytes(reinterpret_cast<const Byte*>(data.data()) + offset, FELT_SIZE);
}

std::string EncodeSequence(uint64_t seq) {
    std::string out(8, '\0');
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<char>(seq & 0xff);
        seq >>= 8;
    }
    return out;
}

std::optional<uint64_t> DecodeSequence(const db::Slice& data) {
    if (data.size() != 8) {
        return std::nullopt;
    }
    uint64_t seq = 0;
    for (size_t i = 0; i < 8; ++i) {
        seq = (seq << 8) | static_cast<uint8_t>(data[i]);
    }
    return seq;
}

std::string AcceptedKey(const Felt& root) {
    return db::MakeKey(db::prefix::REGISTRY_ACCEPTED, FeltBytes(root));
}

std::string TransitionKey(uint64_t seq) {
    return db::MakeKey(db::prefix::REGISTRY_TRANSITION, EncodeSequence(seq));
}

} // namespace

const char* RegistryStatusToString(RegistryStatus status) {
    switch (status) {
        case RegistryStatus::Ok: return "ok";
        case RegistryStatus::InvalidRoot: return "invalid-root";
        case RegistryStatus::NoOpRoot: return "no-op-root";
        case RegistryStatus::Unauthorized: return "unauthorized";
        case RegistryStatus::NotInitialized: return "not-initialized";
        case RegistryStatus::AlreadyInitialized: return "already-initialized";
        case RegistryStatus::StorageError: return "storage-error";
    }
    return "unknown";
}

// ============================================================================
// RootTransition
// ============================================================================

std::string RootTransition::Serialize() const {
    std::string out;
    out.reserve(SERIALIZED_SIZE);
    out += FeltBytes(previousRoot);
    out += FeltBytes(newRoot);
    out += FeltBytes(updatedBy);
    return out;
}

std::optional<RootTransition> RootTransition::Deserialize(uint64_t sequence,
                                                          const std::string& data) {
    if (data.size() != SERIALIZED_SIZE) {
        return std::nullopt;
    }
    auto previous = FeltFromBytes(data, 0);
    auto next = FeltFromBytes(data, FELT_SIZE);
    auto by = FeltFromBytes(data, 2 * FELT_SIZE);
    if (!previous || !next || !by) {
        return std::nullopt;
    }
    
    RootTransition t;
    t.previousRoot = *previous;
    t.newRoot = *next;
    t.updatedBy = *by;
    t.sequence = sequence;
    return t;
}

// ============================================================================
// RootRegistry
// ============================================================================

RootRegistry::RootRegistry(db::Database& db) : db_(db) {}

RegistryStatus RootRegistry::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::optional<Identity> admin;
    Felt current;
    std::set<Felt> accepted;
    std::vector<RootTransition> transitions;
    
    auto fail = [](const std::string& why) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Corrupt registry state: " << why;
        return RegistryStatus::StorageError;
    };
    
    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::REGISTRY_ADMIN), &value);
    if (s.ok()) {
        admin = FeltFromBytes(value);
        if (!admin || value.size() != FELT_SIZE) {
            return fail("bad admin record");
        }
    } else if (!s.IsNotFound()) {
        return fail(s.ToString());
    }
    
    bool hasCurrent = false;
    s = db_.Get(db::MakeKey(db::prefix::REGISTRY_CURRENT), &value);
    if (s.ok()) {
        auto root = FeltFromBytes(value);
        if (!root || value.size() != FELT_SIZE || root->IsZero()) {
            return fail("bad current root record");
        }
        current = *root;
        hasCurrent = true;
    } else if (!s.IsNotFound()) {
        return fail(s.ToString());
    }
    
    auto it = db_.NewIterator();
    const std::string acceptedPrefix = db::MakeKey(db::prefix::REGISTRY_ACCEPTED);
    for (it->Seek(acceptedPrefix); it->Valid() && it->key().starts_with(acceptedPrefix); it->Next()) {
        std::string key = it->key().ToString();
        auto root = FeltFromBytes(key, 1);
        if (!root || key.size() != 1 + FELT_SIZE || root->IsZero()) {
            return fail("bad accepted root key");
        }
        accepted.insert(*root);
    }
    
    const std::string transitionPrefix = db::MakeKey(db::prefix::REGISTRY_TRANSITION);
    for (it->Seek(transitionPrefix); it->Valid() && it->key().starts_with(transitionPrefix); it->Next()) {
        db::Slice key = it->key();
        auto seq = DecodeSequence(db::Slice(key.data() + 1, key.size() - 1));
        if (!seq || *seq != transitions.size()) {
            return fail("transition log is not contiguous");
        }
        auto t = RootTransition::Deserialize(*seq, it->value().ToString());
        if (!t) {
            return fail("bad transition record");
        }
        transitions.push_back(*t);
    }
    if (!it->status().ok()) {
        return fail(it->status().ToString());
    }
    
    if (admin.has_value() != hasCurrent) {
        return fail("admin and current root must be stored together");
    }
    if (hasCurrent) {
        if (accepted.count(current) == 0) {
            return fail("current root is not accepted");
        }
        if (transitions.empty() || transitions.back().newRoot != current) {
            return fail("transition log does not end at the current root");
        }
    } else if (!accepted.empty() || !transitions.empty()) {
        return fail("roots stored for an uninitialized registry");
    }
    
    admin_ = admin;
    currentRoot_ = current;
    acceptedRoots_ = std::move(accepted);
    transitions_ = std::move(transitions);
    
    if (admin_) {
        LOG_DEBUG(util::LogCategory::REGISTRY)
            << "Loaded registry: current root " << ShortHex(currentRoot_.ToHex())
            << ", " << acceptedRoots_.size() << " accepted";
    }
    return RegistryStatus::Ok;
}

RegistryStatus RootRegistry::Apply(const RootTransition& transition, bool initializing) {
    db::WriteBatch batch;
    if (initializing) {
        batch.Put(db::MakeKey(db::prefix::REGISTRY_ADMIN), FeltBytes(transition.updatedBy));
    }
    batch.Put(db::MakeKey(db::prefix::REGISTRY_CURRENT), FeltBytes(transition.newRoot));
    batch.Put(AcceptedKey(transition.newRoot), "");
    batch.Put(TransitionKey(transition.sequence), transition.Serialize());
    
    db::WriteOptions options;
    options.sync = true;
    db::Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Failed to store root transition: "
                                               << s.ToString();
        return RegistryStatus::StorageError;
    }
    
    if (initializing) {
        admin_ = transition.updatedBy;
    }
    currentRoot_ = transition.newRoot;
    acceptedRoots_.insert(transition.newRoot);
    transitions_.push_back(transition);
    return RegistryStatus::Ok;
}

RegistryStatus RootRegistry::Initialize(const Identity& caller, const Felt& initialRoot) {
    RootTransition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        if (admin_) {
            LOG_DEBUG(util::LogCategory::REGISTRY) << "Initialize rejected: already initialized";
            return RegistryStatus::AlreadyInitialized;
        }
        if (initialRoot.IsZero()) {
            LOG_DEBUG(util::LogCategory::REGISTRY) << "Initialize rejected: zero root";
            return RegistryStatus::InvalidRoot;
        }
        
        transition.previousRoot = Felt();
        transition.newRoot = initialRoot;
        transition.updatedBy = caller;
        transition.sequence = transitions_.size();
        
        RegistryStatus status = Apply(transition, true);
        if (status != RegistryStatus::Ok) {
            return status;
        }
        pending_.push_back(transition);
    }
    
    LOG_INFO(util::LogCategory::REGISTRY) << "Registry initialized by " << ShortHex(caller.ToHex())
                                          << " with root " << initialRoot.ToHex();
    
    DeliverPending();
    return RegistryStatus::Ok;
}

RegistryStatus RootRegistry::SetRoot(const Identity& caller, const Felt& newRoot) {
    RootTransition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        RegistryStatus rejected = RegistryStatus::Ok;
        if (!admin_) {
            rejected = RegistryStatus::NotInitialized;
        } else if (caller != *admin_) {
            rejected = RegistryStatus::Unauthorized;
        } else if (newRoot.IsZero()) {
            rejected = RegistryStatus::InvalidRoot;
        } else if (newRoot == currentRoot_) {
            rejected = RegistryStatus::NoOpRoot;
        }
        if (rejected != RegistryStatus::Ok) {
            LOG_DEBUG(util::LogCategory::REGISTRY) << "SetRoot from " << ShortHex(caller.ToHex())
                                                   << " rejected: "
                                                   << RegistryStatusToString(rejected);
            return rejected;
        }
        
        transition.previousRoot = currentRoot_;
        transition.newRoot = newRoot;
        transition.updatedBy = caller;
        transition.sequence = transitions_.size();
        
        RegistryStatus status = Apply(transition, false);
        if (status != RegistryStatus::Ok) {
            return status;
        }
        pending_.push_back(transition);
    }
    
    LOG_INFO(util::LogCategory::REGISTRY) << "Root updated " << transition.previousRoot.ToHex()
                                          << " -> " << newRoot.ToHex();
    
    DeliverPending();
    return RegistryStatus::Ok;
}

void RootRegistry::DeliverPending() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (delivering_) {
        // The active deliverer drains what we queued
        return;
    }
    delivering_ = true;
    
    while (!pending_.empty()) {
        RootTransition transition = pending_.front();
        pending_.pop_front();
        std::vector<TransitionListener> listeners = listeners_;
        
        lock.unlock();
        try {
            for (const auto& listener : listeners) {
                listener(transition);
            }
        } catch (...) {
            lock.lock();
            delivering_ = false;
            throw;
        }
        lock.lock();
    }
    
    delivering_ = false;
}

Felt RootRegistry::GetCurrentRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentRoot_;
}

bool RootRegistry::IsRootAccepted(const Felt& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acceptedRoots_.count(root) > 0;
}

std::optional<Identity> RootRegistry::GetAdmin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_;
}

bool RootRegistry::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_.has_value();
}

std::vector<Felt> RootRegistry::GetAcceptedRoots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Felt>(acceptedRoots_.begin(), acceptedRoots_.end());
}

std::vector<RootTransition> RootRegistry::GetTransitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transitions_;
}

void RootRegistry::AddTransitionListener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

} // namespace registry
} // namespace starkmoat
