#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mailcache/constants.hpp"
#include "mailcache/mail_store.hpp"
#include "mailcache/mutation_queue.hpp"
#include "mailcache/sync_exception.hpp"
#include "MockRemoteSession.hpp"
#include "TestSupport.hpp"

using ::testing::_;
using ::testing::InSequence;
using ::testing::Throw;

class MutationQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = makeScratchDir();
        store = new MailStore();
        store->migrate();
        queue = new MutationQueue(store);
        for (uint32_t uid = 1; uid <= 3; uid ++) {
            store->insertIfAbsent(makeMessage("a1", "INBOX", uid, time(0)).get());
        }
    }

    void TearDown() override {
        delete queue;
        delete store;
        removeScratchDir(dir);
    }

    std::string dir;
    MailStore * store;
    MutationQueue * queue;
    MockRemoteSession remote;
};

TEST_F(MutationQueueTest, RejectsUnknownKind) {
    EXPECT_THROW(queue->enqueue("a1", "INBOX", 1, "archive"), SyncException);
    EXPECT_EQ(store->pendingMutationCount("a1"), 0);
}

TEST_F(MutationQueueTest, DrainsInSubmissionOrder) {
    queue->enqueue("a1", "INBOX", 2, MUTATION_KIND_MARK_READ);
    queue->enqueue("a1", "INBOX", 1, MUTATION_KIND_MOVE_TRASH);
    queue->enqueue("a1", "INBOX", 3, MUTATION_KIND_DELETE);
    {
        InSequence seq;
        EXPECT_CALL(remote, markRead("INBOX", 2));
        EXPECT_CALL(remote, moveToTrash("INBOX", 1));
        EXPECT_CALL(remote, deleteMessage("INBOX", 3));
    }

    DrainResult result = queue->drain("a1", &remote);

    EXPECT_EQ(result.completed, 3);
    EXPECT_EQ(result.failed, 0);
    EXPECT_EQ(result.remaining, 0);
    EXPECT_EQ(store->pendingMutationCount("a1"), 0);
}

TEST_F(MutationQueueTest, SuccessAppliesMutationToCache) {
    queue->enqueue("a1", "INBOX", 1, MUTATION_KIND_MARK_READ);
    queue->enqueue("a1", "INBOX", 2, MUTATION_KIND_DELETE);
    EXPECT_CALL(remote, markRead("INBOX", 1));
    EXPECT_CALL(remote, deleteMessage("INBOX", 2));

    queue->drain("a1", &remote);

    EXPECT_FALSE(store->findMessage("a1", "INBOX", 1)->isUnread());
    EXPECT_EQ(store->findMessage("a1", "INBOX", 2), nullptr);
    EXPECT_NE(store->findMessage("a1", "INBOX", 3), nullptr);

    auto log = store->recentMutationLog(10);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0]["status"], "completed");
}

TEST_F(MutationQueueTest, FailureKeepsEntryAndContinues) {
    queue->enqueue("a1", "INBOX", 1, MUTATION_KIND_MOVE_TRASH);
    queue->enqueue("a1", "INBOX", 2, MUTATION_KIND_MARK_READ);
    EXPECT_CALL(remote, moveToTrash("INBOX", 1))
        .WillOnce(Throw(SyncException("no-trash", "Trash folder is missing", false)));
    EXPECT_CALL(remote, markRead("INBOX", 2));

    DrainResult result = queue->drain("a1", &remote);

    EXPECT_EQ(result.completed, 1);
    EXPECT_EQ(result.failed, 1);
    EXPECT_EQ(result.remaining, 1);

    auto pending = store->pendingMutations("a1");
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0]->remoteUID(), 1u);
    EXPECT_EQ(pending[0]->retries(), 1);
    EXPECT_EQ(pending[0]->lastError(), "no-trash: Trash folder is missing");

    // the cached copy stays until the server agrees
    EXPECT_NE(store->findMessage("a1", "INBOX", 1), nullptr);
}

TEST_F(MutationQueueTest, RetriesAccumulateAcrossDrains) {
    queue->enqueue("a1", "INBOX", 1, MUTATION_KIND_DELETE);
    EXPECT_CALL(remote, deleteMessage("INBOX", 1))
        .WillOnce(Throw(SyncException("timeout", "", true)))
        .WillOnce(Throw(SyncException("timeout", "", true)))
        .WillOnce(::testing::Return());

    queue->drain("a1", &remote);
    queue->drain("a1", &remote);
    EXPECT_EQ(store->pendingMutations("a1")[0]->retries(), 2);

    DrainResult result = queue->drain("a1", &remote);
    EXPECT_EQ(result.completed, 1);
    EXPECT_EQ(store->pendingMutationCount("a1"), 0);
}

TEST_F(MutationQueueTest, OfflineStopsDrainWithoutCountingRetries) {
    queue->enqueue("a1", "INBOX", 1, MUTATION_KIND_MARK_READ);
    queue->enqueue("a1", "INBOX", 2, MUTATION_KIND_MARK_READ);
    EXPECT_CALL(remote, markRead("INBOX", 1))
        .WillOnce(Throw(SyncException(mailcore::ErrorConnection, "network unreachable")));
    EXPECT_CALL(remote, markRead("INBOX", 2)).Times(0);

    DrainResult result = queue->drain("a1", &remote);

    EXPECT_TRUE(result.stoppedOffline);
    EXPECT_EQ(result.remaining, 2);
    auto pending = store->pendingMutations("a1");
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0]->retries(), 0);
    EXPECT_EQ(store->recentMutationLog(10).size(), 0u);
}

TEST_F(MutationQueueTest, DrainOnlyTouchesTheGivenAccount) {
    queue->enqueue("a2", "INBOX", 1, MUTATION_KIND_DELETE);
    EXPECT_CALL(remote, deleteMessage(_, _)).Times(0);

    DrainResult result = queue->drain("a1", &remote);
    EXPECT_EQ(result.completed, 0);
    EXPECT_EQ(store->pendingMutationCount("a2"), 1);
}
