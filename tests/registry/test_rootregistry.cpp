// STARKMOAT - Root Registry Tests
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <gtest/gtest.h>
#include <starkmoat/registry/rootregistry.h>
#include <starkmoat/db/leveldb.h>

#include <filesystem>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace starkmoat;
using namespace starkmoat::registry;

// ============================================================================
// Test Fixture
// ============================================================================

class RootRegistryTest : public ::testing::Test {
protected:
    db::MemoryDatabase db_;
    RootRegistry registry_{db_};
    
    const Identity admin_{0xabc};
    const Identity other_{0xdef};
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(RootRegistryTest, StartsUninitialized) {
    EXPECT_FALSE(registry_.IsInitialized());
    EXPECT_TRUE(registry_.GetCurrentRoot().IsZero());
    EXPECT_FALSE(registry_.GetAdmin().has_value());
    EXPECT_TRUE(registry_.GetAcceptedRoots().empty());
    EXPECT_TRUE(registry_.GetTransitions().empty());
    EXPECT_FALSE(registry_.IsRootAccepted(Felt()));
}

TEST_F(RootRegistryTest, Initialize) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    
    EXPECT_TRUE(registry_.IsInitialized());
    EXPECT_EQ(registry_.GetCurrentRoot(), Felt(0x11));
    EXPECT_TRUE(registry_.IsRootAccepted(Felt(0x11)));
    ASSERT_TRUE(registry_.GetAdmin().has_value());
    EXPECT_EQ(*registry_.GetAdmin(), admin_);
    
    auto transitions = registry_.GetTransitions();
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_TRUE(transitions[0].previousRoot.IsZero());
    EXPECT_EQ(transitions[0].newRoot, Felt(0x11));
    EXPECT_EQ(transitions[0].updatedBy, admin_);
    EXPECT_EQ(transitions[0].sequence, 0u);
}

TEST_F(RootRegistryTest, InitializeRejectsZeroRoot) {
    EXPECT_EQ(registry_.Initialize(admin_, Felt()), RegistryStatus::InvalidRoot);
    EXPECT_FALSE(registry_.IsInitialized());
    EXPECT_EQ(db_.Size(), 0u);
}

TEST_F(RootRegistryTest, SecondInitializeIsRejected) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    EXPECT_EQ(registry_.Initialize(other_, Felt(0x22)), RegistryStatus::AlreadyInitialized);
    EXPECT_EQ(*registry_.GetAdmin(), admin_);
    EXPECT_EQ(registry_.GetCurrentRoot(), Felt(0x11));
}

// ============================================================================
// Rotation
// ============================================================================

TEST_F(RootRegistryTest, SetRootKeepsHistory) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x22)), RegistryStatus::Ok);
    
    EXPECT_EQ(registry_.GetCurrentRoot(), Felt(0x22));
    EXPECT_TRUE(registry_.IsRootAccepted(Felt(0x11)));
    EXPECT_TRUE(registry_.IsRootAccepted(Felt(0x22)));
    EXPECT_FALSE(registry_.IsRootAccepted(Felt(0x33)));
    
    auto transitions = registry_.GetTransitions();
    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[1].previousRoot, Felt(0x11));
    EXPECT_EQ(transitions[1].newRoot, Felt(0x22));
    EXPECT_EQ(transitions[1].sequence, 1u);
}

TEST_F(RootRegistryTest, SetRootRejections) {
    EXPECT_EQ(registry_.SetRoot(admin_, Felt(0x22)), RegistryStatus::NotInitialized);
    
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    EXPECT_EQ(registry_.SetRoot(other_, Felt(0x22)), RegistryStatus::Unauthorized);
    EXPECT_EQ(registry_.SetRoot(admin_, Felt()), RegistryStatus::InvalidRoot);
    EXPECT_EQ(registry_.SetRoot(admin_, Felt(0x11)), RegistryStatus::NoOpRoot);
    
    EXPECT_EQ(registry_.GetCurrentRoot(), Felt(0x11));
    EXPECT_EQ(registry_.GetTransitions().size(), 1u);
}

TEST_F(RootRegistryTest, UnauthorizedCheckedBeforeRootValue) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    EXPECT_EQ(registry_.SetRoot(other_, Felt()), RegistryStatus::Unauthorized);
    EXPECT_EQ(registry_.SetRoot(other_, Felt(0x11)), RegistryStatus::Unauthorized);
}

TEST_F(RootRegistryTest, ReacceptingHistoricalRootSucceeds) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x22)), RegistryStatus::Ok);
    EXPECT_EQ(registry_.SetRoot(admin_, Felt(0x11)), RegistryStatus::Ok);
    
    EXPECT_EQ(registry_.GetCurrentRoot(), Felt(0x11));
    EXPECT_EQ(registry_.GetAcceptedRoots().size(), 2u);
    EXPECT_EQ(registry_.GetTransitions().size(), 3u);
}

TEST_F(RootRegistryTest, AcceptedRootsAreSorted) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x30)), RegistryStatus::Ok);
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x10)), RegistryStatus::Ok);
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x20)), RegistryStatus::Ok);
    
    std::vector<Felt> expected = {Felt(0x10), Felt(0x20), Felt(0x30)};
    EXPECT_EQ(registry_.GetAcceptedRoots(), expected);
}

TEST_F(RootRegistryTest, ListenersSeeEveryTransition) {
    std::vector<RootTransition> seen;
    registry_.AddTransitionListener([&seen](const RootTransition& t) { seen.push_back(t); });
    
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    ASSERT_EQ(registry_.SetRoot(other_, Felt(0x22)), RegistryStatus::Unauthorized);
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x22)), RegistryStatus::Ok);
    
    EXPECT_EQ(seen, registry_.GetTransitions());
}

TEST_F(RootRegistryTest, ListenerMayReadRegistry) {
    Felt observed;
    registry_.AddTransitionListener([this, &observed](const RootTransition&) {
        observed = registry_.GetCurrentRoot();
    });
    
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    EXPECT_EQ(observed, Felt(0x11));
}

TEST_F(RootRegistryTest, ListenerMayRotateRegistry) {
    std::vector<uint64_t> delivered;
    RegistryStatus nested = RegistryStatus::StorageError;
    registry_.AddTransitionListener([&](const RootTransition& t) {
        delivered.push_back(t.sequence);
        if (t.sequence == 1) {
            nested = registry_.SetRoot(admin_, Felt(0x33));
        }
    });

    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x22)), RegistryStatus::Ok);

    EXPECT_EQ(nested, RegistryStatus::Ok);
    std::vector<uint64_t> expected = {0, 1, 2};
    EXPECT_EQ(delivered, expected);
    EXPECT_EQ(registry_.GetCurrentRoot(), Felt(0x33));
}

TEST_F(RootRegistryTest, ListenerMayAddListener) {
    int lateCalls = 0;
    bool added = false;
    registry_.AddTransitionListener([&](const RootTransition&) {
        if (!added) {
            added = true;
            registry_.AddTransitionListener([&lateCalls](const RootTransition&) { ++lateCalls; });
        }
    });

    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    EXPECT_EQ(lateCalls, 0);
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x22)), RegistryStatus::Ok);
    EXPECT_EQ(lateCalls, 1);
}

TEST_F(RootRegistryTest, ThrowingListenerDoesNotStallDelivery) {
    std::vector<uint64_t> delivered;
    registry_.AddTransitionListener([&delivered](const RootTransition& t) {
        delivered.push_back(t.sequence);
        if (t.sequence == 0) {
            throw std::runtime_error("sink unavailable");
        }
    });

    EXPECT_THROW(registry_.Initialize(admin_, Felt(0x11)), std::runtime_error);
    EXPECT_TRUE(registry_.IsInitialized());
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x22)), RegistryStatus::Ok);

    std::vector<uint64_t> expected = {0, 1};
    EXPECT_EQ(delivered, expected);
}

TEST_F(RootRegistryTest, ConcurrentDeliveryIsInSequenceOrder) {
    std::mutex seenMutex;
    std::vector<uint64_t> delivered;
    registry_.AddTransitionListener([&](const RootTransition& t) {
        std::lock_guard<std::mutex> lock(seenMutex);
        delivered.push_back(t.sequence);
    });

    ASSERT_EQ(registry_.Initialize(admin_, Felt(1)), RegistryStatus::Ok);

    std::vector<std::thread> threads;
    for (uint64_t t = 0; t < 8; ++t) {
        threads.emplace_back([this, t] {
            for (uint64_t i = 0; i < 250; ++i) {
                EXPECT_EQ(registry_.SetRoot(admin_, Felt(100000 * (t + 1) + i)), RegistryStatus::Ok);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::lock_guard<std::mutex> lock(seenMutex);
    ASSERT_EQ(delivered.size(), 2001u);
    for (size_t i = 0; i < delivered.size(); ++i) {
        ASSERT_EQ(delivered[i], i);
    }
}

TEST_F(RootRegistryTest, ConcurrentRotationsAreSerialized) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(1)), RegistryStatus::Ok);
    
    std::vector<std::thread> threads;
    for (uint64_t t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (uint64_t i = 0; i < 25; ++i) {
                // Distinct roots per thread, never equal to the current one
                EXPECT_EQ(registry_.SetRoot(admin_, Felt(1000 * (t + 1) + i)), RegistryStatus::Ok);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    auto transitions = registry_.GetTransitions();
    ASSERT_EQ(transitions.size(), 101u);
    for (size_t i = 1; i < transitions.size(); ++i) {
        EXPECT_EQ(transitions[i].sequence, i);
        EXPECT_EQ(transitions[i].previousRoot, transitions[i - 1].newRoot);
    }
    EXPECT_EQ(registry_.GetCurrentRoot(), transitions.back().newRoot);
}

TEST(RegistryStatusTest, Names) {
    EXPECT_STREQ(RegistryStatusToString(RegistryStatus::Ok), "ok");
    EXPECT_STREQ(RegistryStatusToString(RegistryStatus::InvalidRoot), "invalid-root");
    EXPECT_STREQ(RegistryStatusToString(RegistryStatus::NoOpRoot), "no-op-root");
    EXPECT_STREQ(RegistryStatusToString(RegistryStatus::Unauthorized), "unauthorized");
}

// ============================================================================
// Persistence
// ============================================================================

TEST(RootTransitionTest, SerializedLayout) {
    RootTransition t;
    t.previousRoot = Felt(1);
    t.newRoot = Felt(2);
    t.updatedBy = Felt(3);
    
    std::string data = t.Serialize();
    ASSERT_EQ(data.size(), RootTransition::SERIALIZED_SIZE);
    EXPECT_EQ(static_cast<uint8_t>(data[31]), 1);
    EXPECT_EQ(static_cast<uint8_t>(data[63]), 2);
    EXPECT_EQ(static_cast<uint8_t>(data[95]), 3);
    
    auto decoded = RootTransition::Deserialize(0, data);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, t);
    
    EXPECT_FALSE(RootTransition::Deserialize(0, data.substr(1)).has_value());
}

TEST_F(RootRegistryTest, ReloadFromMemoryDatabase) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    ASSERT_EQ(registry_.SetRoot(admin_, Felt(0x22)), RegistryStatus::Ok);
    
    RootRegistry reloaded(db_);
    ASSERT_EQ(reloaded.Load(), RegistryStatus::Ok);
    EXPECT_EQ(reloaded.GetCurrentRoot(), Felt(0x22));
    EXPECT_EQ(*reloaded.GetAdmin(), admin_);
    EXPECT_EQ(reloaded.GetAcceptedRoots(), registry_.GetAcceptedRoots());
    EXPECT_EQ(reloaded.GetTransitions(), registry_.GetTransitions());
    EXPECT_EQ(reloaded.Initialize(other_, Felt(0x33)), RegistryStatus::AlreadyInitialized);
}

TEST_F(RootRegistryTest, LoadEmptyDatabase) {
    EXPECT_EQ(registry_.Load(), RegistryStatus::Ok);
    EXPECT_FALSE(registry_.IsInitialized());
}

TEST_F(RootRegistryTest, LoadRejectsCurrentRootOutsideAcceptedSet) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    
    auto bytes = Felt(0x99).ToBytes();
    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::REGISTRY_CURRENT),
                        db::Slice(reinterpret_cast<const char*>(bytes.data()), bytes.size())).ok());
    
    RootRegistry reloaded(db_);
    EXPECT_EQ(reloaded.Load(), RegistryStatus::StorageError);
    EXPECT_FALSE(reloaded.IsInitialized());
}

TEST_F(RootRegistryTest, LoadRejectsAdminWithoutCurrentRoot) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    ASSERT_TRUE(db_.Delete(db::MakeKey(db::prefix::REGISTRY_CURRENT)).ok());
    
    RootRegistry reloaded(db_);
    EXPECT_EQ(reloaded.Load(), RegistryStatus::StorageError);
}

TEST_F(RootRegistryTest, LoadRejectsTruncatedRecord) {
    ASSERT_EQ(registry_.Initialize(admin_, Felt(0x11)), RegistryStatus::Ok);
    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::REGISTRY_ADMIN), db::Slice("short")).ok());
    
    RootRegistry reloaded(db_);
    EXPECT_EQ(reloaded.Load(), RegistryStatus::StorageError);
}

/// Database whose writes always fail
class FailingDatabase : public db::MemoryDatabase {
public:
    db::Status Write(const db::WriteOptions&, db::WriteBatch*) override {
        return db::Status::IOError("disk full");
    }
};

TEST(RootRegistryStorageTest, WriteFailureLeavesStateUnchanged) {
    FailingDatabase database;
    RootRegistry reg(database);
    
    EXPECT_EQ(reg.Initialize(Felt(1), Felt(0x11)), RegistryStatus::StorageError);
    EXPECT_FALSE(reg.IsInitialized());
    EXPECT_TRUE(reg.GetTransitions().empty());
}

// ============================================================================
// LevelDB Persistence
// ============================================================================

class RootRegistryLevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;
    
    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        
        testDir_ = std::filesystem::temp_directory_path() /
                   ("starkmoat_registry_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }
    
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

TEST_F(RootRegistryLevelDBTest, SurvivesReopen) {
    const Identity admin(0xabc);
    {
        auto [status, database] = db::OpenDatabase(testDir_ / "registry");
        ASSERT_TRUE(status.ok()) << status.ToString();
        RootRegistry reg(*database);
        ASSERT_EQ(reg.Load(), RegistryStatus::Ok);
        ASSERT_EQ(reg.Initialize(admin, Felt(0x11)), RegistryStatus::Ok);
        ASSERT_EQ(reg.SetRoot(admin, Felt(0x22)), RegistryStatus::Ok);
    }
    
    auto [status, database] = db::OpenDatabase(testDir_ / "registry");
    ASSERT_TRUE(status.ok()) << status.ToString();
    RootRegistry reg(*database);
    ASSERT_EQ(reg.Load(), RegistryStatus::Ok);
    
    EXPECT_EQ(reg.GetCurrentRoot(), Felt(0x22));
    EXPECT_TRUE(reg.IsRootAccepted(Felt(0x11)));
    EXPECT_EQ(*reg.GetAdmin(), admin);
    ASSERT_EQ(reg.GetTransitions().size(), 2u);
    EXPECT_EQ(reg.GetTransitions()[1].previousRoot, Felt(0x11));
    EXPECT_EQ(reg.SetRoot(Felt(0xdef), Felt(0x33)), RegistryStatus::Unauthorized);
}
