#include <gtest/gtest.h>
#include <memory>

#include "mailcache/mail_store.hpp"
#include "mailcache/mail_store_transaction.hpp"
#include "mailcache/models/attachment.hpp"
#include "mailcache/models/pending_mutation.hpp"
#include "TestSupport.hpp"

class MailStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = makeScratchDir();
        store = new MailStore();
        store->migrate();
    }

    void TearDown() override {
        delete store;
        removeScratchDir(dir);
    }

    int countRows(std::string table) {
        SQLite::Statement q(store->db(), "SELECT COUNT(*) FROM " + table);
        q.executeStep();
        return q.getColumn(0).getInt();
    }

    std::string dir;
    MailStore * store;
};

TEST_F(MailStoreTest, MigrateIsIdempotent) {
    store->migrate();
    SQLite::Statement uv(store->db(), "PRAGMA user_version");
    uv.executeStep();
    EXPECT_EQ(uv.getColumn(0).getInt(), 2);
    EXPECT_EQ(countRows("MutationLog"), 0);
}

TEST_F(MailStoreTest, InsertIfAbsentNeverClearsBody) {
    auto withBody = makeMessage("a1", "INBOX", 7, time(0));
    withBody->setBody("<p>hello</p>");
    EXPECT_TRUE(store->insertIfAbsent(withBody.get()));

    auto metadataOnly = makeMessage("a1", "INBOX", 7, time(0));
    metadataOnly->setSubject("Changed subject");
    EXPECT_FALSE(store->insertIfAbsent(metadataOnly.get()));

    auto found = store->findMessage("a1", "INBOX", 7);
    ASSERT_NE(found, nullptr);
    EXPECT_TRUE(found->hasBody());
    EXPECT_EQ(found->body(), "<p>hello</p>");
    EXPECT_EQ(found->subject(), "Message 7");
}

TEST_F(MailStoreTest, InsertIfAbsentDoesNotReplaceCachedBody) {
    auto first = makeMessage("a1", "INBOX", 7, time(0));
    first->setBody("original");
    store->insertIfAbsent(first.get());

    auto second = makeMessage("a1", "INBOX", 7, time(0));
    second->setBody("replacement");
    store->insertIfAbsent(second.get());

    EXPECT_EQ(store->findMessage("a1", "INBOX", 7)->body(), "original");
}

TEST_F(MailStoreTest, InsertIfAbsentStoresAttachmentDescriptors) {
    auto msg = makeMessage("a1", "INBOX", 3, time(0));
    Attachment pdf{"a1", "INBOX", 3, "1.2"};
    pdf.setFilename("report.pdf");
    pdf.setContentType("application/pdf");
    pdf.setSize(52000);
    pdf.setEncoding("base64");
    Attachment png{"a1", "INBOX", 3, "1.3"};
    png.setFilename("chart.png");
    std::vector<Attachment> attachments{pdf, png};
    msg->setAttachments(attachments);

    store->insertIfAbsent(msg.get());
    EXPECT_EQ(countRows("Attachment"), 2);

    auto found = store->findMessage("a1", "INBOX", 3);
    auto descriptors = found->attachments();
    ASSERT_EQ(descriptors.size(), 2u);
    EXPECT_EQ(descriptors[0].filename(), "report.pdf");
    EXPECT_EQ(descriptors[0].size(), 52000u);
}

TEST_F(MailStoreTest, DiffUIDsFindsMissingAndStale) {
    for (uint32_t uid = 1; uid <= 5; uid ++) {
        store->insertIfAbsent(makeMessage("a1", "INBOX", uid, time(0)).get());
    }
    store->insertIfAbsent(makeMessage("a1", "Archive", 1, time(0)).get());

    UIDDiff diff = store->diffUIDs("a1", "INBOX", {3, 4, 5, 6, 7});
    EXPECT_EQ(diff.missing, (std::vector<uint32_t>{6, 7}));
    std::sort(diff.stale.begin(), diff.stale.end());
    EXPECT_EQ(diff.stale, (std::vector<uint32_t>{1, 2}));
}

TEST_F(MailStoreTest, PurgeMailboxRemovesBodiesAndAttachmentsOfThatMailboxOnly) {
    auto inbox = makeMessage("a1", "INBOX", 1, time(0));
    inbox->setBody("body");
    Attachment a{"a1", "INBOX", 1, "2"};
    std::vector<Attachment> attachments{a};
    inbox->setAttachments(attachments);
    store->insertIfAbsent(inbox.get());
    store->insertIfAbsent(makeMessage("a1", "Archive", 1, time(0)).get());
    store->insertIfAbsent(makeMessage("a2", "INBOX", 1, time(0)).get());

    EXPECT_EQ(store->purgeMailbox("a1", "INBOX"), 1);
    EXPECT_EQ(store->messageCount("a1", "INBOX"), 0);
    EXPECT_EQ(store->messageCount("a1", "Archive"), 1);
    EXPECT_EQ(store->messageCount("a2"), 1);
    EXPECT_EQ(countRows("MessageBody"), 0);
    EXPECT_EQ(countRows("Attachment"), 0);
}

TEST_F(MailStoreTest, RemoveMessagesOlderThanHonorsKeepSet) {
    time_t now = time(0);
    store->insertIfAbsent(makeMessage("a1", "INBOX", 1, now - 30 * ONE_DAY).get());
    store->insertIfAbsent(makeMessage("a1", "INBOX", 2, now - 20 * ONE_DAY).get());
    store->insertIfAbsent(makeMessage("a1", "INBOX", 3, now).get());

    EXPECT_EQ(store->removeMessagesOlderThan("a1", "INBOX", now - 14 * ONE_DAY, {2}), 1);
    EXPECT_EQ(store->findMessage("a1", "INBOX", 1), nullptr);
    EXPECT_NE(store->findMessage("a1", "INBOX", 2), nullptr);
    EXPECT_NE(store->findMessage("a1", "INBOX", 3), nullptr);
}

TEST_F(MailStoreTest, SaveBodyUpdatesSnippet) {
    store->insertIfAbsent(makeMessage("a1", "INBOX", 9, time(0)).get());
    EXPECT_TRUE(store->saveBody("a1", "INBOX", 9, "<p>Hi</p>", "Hi there,\r\nsee you soon"));

    auto found = store->findMessage("a1", "INBOX", 9);
    EXPECT_EQ(found->body(), "<p>Hi</p>");
    EXPECT_EQ(found->snippet(), "Hi there, see you soon");
}

TEST_F(MailStoreTest, SaveBodyForMissingMessageIsRefused) {
    EXPECT_FALSE(store->saveBody("a1", "INBOX", 404, "body"));
    EXPECT_EQ(countRows("MessageBody"), 0);
}

TEST_F(MailStoreTest, UIDsMissingBodiesNewestFirst) {
    time_t now = time(0);
    for (uint32_t uid = 1; uid <= 4; uid ++) {
        store->insertIfAbsent(makeMessage("a1", "INBOX", uid, now - (5 - uid) * 60).get());
    }
    store->saveBody("a1", "INBOX", 4, "cached");

    EXPECT_EQ(store->uidsMissingBodies("a1", "INBOX", 2), (std::vector<uint32_t>{3, 2}));
}

TEST_F(MailStoreTest, FindMessagesIsNewestFirstWithPaging) {
    time_t now = time(0);
    for (uint32_t uid = 1; uid <= 5; uid ++) {
        store->insertIfAbsent(makeMessage("a1", "INBOX", uid, now - (10 - uid) * 60).get());
    }

    auto page = store->findMessages("a1", "INBOX", 2, 1);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0]->remoteUID(), 4u);
    EXPECT_EQ(page[1]->remoteUID(), 3u);
    EXPECT_FALSE(page[0]->hasBody());

    EXPECT_EQ(store->findMessages("a1", "INBOX", 0, 0).size(), 5u);
}

TEST_F(MailStoreTest, UpdateUnreadIsVisibleOnRead) {
    store->insertIfAbsent(makeMessage("a1", "INBOX", 1, time(0)).get());
    EXPECT_EQ(store->updateUnread("a1", "INBOX", {{1, false}, {99, false}}), 1);
    EXPECT_FALSE(store->findMessage("a1", "INBOX", 1)->isUnread());
    EXPECT_EQ(store->updateUnread("a1", "INBOX", {{1, false}}), 0);
}

TEST_F(MailStoreTest, CheckpointsAndFreshness) {
    EXPECT_EQ(store->findCheckpoint("a1", "INBOX"), nullptr);
    EXPECT_EQ(store->lastSyncTime("a1"), 0);
    EXPECT_FALSE(store->isFresh("a1", "INBOX", 300));

    MailboxCheckpoint old{"a1", "Archive", 7, time(0) - 3600};
    store->saveCheckpoint(&old);
    MailboxCheckpoint recent{"a1", "INBOX", 42, time(0) - 10};
    store->saveCheckpoint(&recent);

    EXPECT_EQ(store->findCheckpoint("a1", "INBOX")->generationId(), 42u);
    EXPECT_EQ(store->lastSyncTime("a1"), recent.lastSyncTime());
    EXPECT_TRUE(store->isFresh("a1", "INBOX", 300));
    EXPECT_FALSE(store->isFresh("a1", "Archive", 300));
}

TEST_F(MailStoreTest, PendingMutationsSurviveReopen) {
    PendingMutation first{"a1", "INBOX", 5, MUTATION_KIND_DELETE};
    PendingMutation second{"a1", "INBOX", 6, MUTATION_KIND_MARK_READ};
    int64_t firstId = store->enqueueMutation(&first);
    int64_t secondId = store->enqueueMutation(&second);
    EXPECT_GT(secondId, firstId);

    delete store;
    store = new MailStore();
    store->migrate();

    auto pending = store->pendingMutations("a1");
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0]->id(), firstId);
    EXPECT_EQ(pending[0]->kind(), MUTATION_KIND_DELETE);
    EXPECT_EQ(pending[1]->remoteUID(), 6u);
    EXPECT_EQ(store->pendingMutationCount("a1"), 2);

    store->removeMutation(firstId);
    EXPECT_EQ(store->pendingMutationCount("a1"), 1);
}

TEST_F(MailStoreTest, MutationLogIsNewestFirst) {
    PendingMutation m{"a1", "INBOX", 5, MUTATION_KIND_MOVE_TRASH};
    store->logMutation(&m, "failed", "timeout");
    store->logMutation(&m, "completed", "");

    auto log = store->recentMutationLog(10);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0]["status"], "completed");
    EXPECT_EQ(log[1]["error"], "timeout");
}

TEST_F(MailStoreTest, ResetForAccountLeavesOtherAccounts) {
    store->insertIfAbsent(makeMessage("a1", "INBOX", 1, time(0)).get());
    store->insertIfAbsent(makeMessage("a2", "INBOX", 1, time(0)).get());
    PendingMutation m{"a1", "INBOX", 1, MUTATION_KIND_DELETE};
    store->enqueueMutation(&m);

    store->resetForAccount("a1");
    EXPECT_EQ(store->messageCount("a1"), 0);
    EXPECT_EQ(store->pendingMutationCount("a1"), 0);
    EXPECT_EQ(store->messageCount("a2"), 1);
}

TEST_F(MailStoreTest, TransactionRollsBackWhenNotCommitted) {
    {
        MailStoreTransaction transaction{store, "test"};
        store->insertIfAbsent(makeMessage("a1", "INBOX", 1, time(0)).get());
    }
    EXPECT_EQ(store->messageCount("a1"), 0);
}
