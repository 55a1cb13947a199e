#include <gtest/gtest.h>
#include <atomic>
#include <thread>

#include "mailcache/mail_store.hpp"
#include "mailcache/sync_lock_manager.hpp"
#include "FakeProcessInspector.hpp"
#include "TestSupport.hpp"

class SyncLockManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = makeScratchDir();
        store = new MailStore();
        store->migrate();
        locks = new SyncLockManager(store, &inspector);
    }

    void TearDown() override {
        delete locks;
        delete store;
        removeScratchDir(dir);
    }

    void insertForeignLock(std::string accountId, int pid, int64_t fingerprint) {
        SyncLock lock{accountId, pid, fingerprint, time(0)};
        store->insert(&lock);
    }

    std::string dir;
    FakeProcessInspector inspector;
    MailStore * store;
    SyncLockManager * locks;
};

TEST_F(SyncLockManagerTest, SecondAcquireFailsUntilReleased) {
    EXPECT_TRUE(locks->acquire("a1"));
    EXPECT_TRUE(locks->isLocked("a1"));
    EXPECT_FALSE(locks->acquire("a1"));

    locks->release("a1");
    EXPECT_FALSE(locks->isLocked("a1"));
    EXPECT_TRUE(locks->acquire("a1"));
}

TEST_F(SyncLockManagerTest, LocksAreIndependentPerAccount) {
    EXPECT_TRUE(locks->acquire("a1"));
    EXPECT_TRUE(locks->acquire("a2"));
    locks->release("a1");
    EXPECT_TRUE(locks->isLocked("a2"));
}

TEST_F(SyncLockManagerTest, LiveForeignHolderBlocksAcquire) {
    inspector.running.insert(2000);
    inspector.fingerprints[2000] = 7000;
    insertForeignLock("a1", 2000, 7000);

    EXPECT_FALSE(locks->acquire("a1"));
}

TEST_F(SyncLockManagerTest, RecycledPidIsTreatedAsStale) {
    // pid 2000 is alive, but it started after the lock was written
    inspector.running.insert(2000);
    inspector.fingerprints[2000] = 9999;
    insertForeignLock("a1", 2000, 7000);

    EXPECT_FALSE(locks->isLocked("a1"));
    EXPECT_TRUE(locks->acquire("a1"));
}

TEST_F(SyncLockManagerTest, DeadHolderIsTreatedAsStale) {
    insertForeignLock("a1", 3000, 7000);
    EXPECT_TRUE(locks->acquire("a1"));
}

TEST_F(SyncLockManagerTest, WithoutFingerprintFallsBackToProcessFamily) {
    inspector.family.insert(4000);
    insertForeignLock("a1", 4000, 0);
    EXPECT_FALSE(locks->acquire("a1"));

    inspector.family.clear();
    EXPECT_TRUE(locks->acquire("a1"));
}

TEST_F(SyncLockManagerTest, ReleaseLeavesOtherProcessLockAlone) {
    inspector.running.insert(2000);
    inspector.fingerprints[2000] = 7000;
    insertForeignLock("a1", 2000, 7000);

    locks->release("a1");
    EXPECT_TRUE(locks->isLocked("a1"));
}

TEST_F(SyncLockManagerTest, CleanupRemovesOnlyStaleLocks) {
    inspector.running.insert(2000);
    inspector.fingerprints[2000] = 7000;
    insertForeignLock("live", 2000, 7000);
    insertForeignLock("dead", 3000, 1);
    insertForeignLock("recycled", 1000, 1);

    EXPECT_EQ(locks->cleanupStaleLocks(), 2);
    EXPECT_TRUE(locks->isLocked("live"));
    EXPECT_FALSE(locks->isLocked("dead"));
    EXPECT_EQ(locks->cleanupStaleLocks(), 0);
}

TEST_F(SyncLockManagerTest, ConcurrentAcquireFromTwoConnectionsHasOneWinner) {
    std::atomic<int> winners{0};
    auto contend = [&]() {
        MailStore own;
        SyncLockManager ownLocks(&own, &inspector);
        if (ownLocks.acquire("a1")) {
            winners ++;
        }
    };

    std::thread first(contend);
    std::thread second(contend);
    first.join();
    second.join();

    EXPECT_EQ(winners, 1);
}
