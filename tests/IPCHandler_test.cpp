#include <gtest/gtest.h>

#include "mailcache/constants.hpp"
#include "mailcache/daemon.hpp"
#include "mailcache/ipc_handler.hpp"
#include "mailcache/mail_store.hpp"
#include "mailcache/reconciler.hpp"
#include "FakeProcessInspector.hpp"
#include "FakeRemoteSession.hpp"
#include "TestSupport.hpp"

using nlohmann::json;

class IPCHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = makeScratchDir();
        store = new MailStore();
        store->migrate();

        remote = std::make_shared<FakeRemoteSession>("a1");
        remote->addMessages("INBOX", 1, 3, time(0), 60);

        DaemonConfig config{dir};
        config.syncIntervalSeconds = 3600;
        config.drainIntervalSeconds = 3600;
        config.prefetchCount = 0;

        auto fake = remote;
        daemon = new Daemon(config, {makeAccount("a1")}, [fake](std::shared_ptr<Account>) {
            return fake;
        }, &inspector);
        handler = new IPCHandler(daemon, store);
    }

    void TearDown() override {
        delete handler;
        delete daemon;
        delete store;
        removeScratchDir(dir);
    }

    void syncInbox() {
        Reconciler reconciler{store, remote, daemon->findAccount("a1"), daemon->getConfig().reconcilerOptions()};
        reconciler.reconcileMailbox("INBOX");
    }

    std::string dir;
    MailStore * store;
    FakeProcessInspector inspector;
    std::shared_ptr<FakeRemoteSession> remote;
    Daemon * daemon;
    IPCHandler * handler;
};

TEST_F(IPCHandlerTest, HelloReportsVersionAndEchoesId) {
    json resp = handler->handle({{"type", "hello"}, {"version", "0.0.1"}, {"id", 7}});
    EXPECT_EQ(resp["type"], "hello");
    EXPECT_EQ(resp["version"], MAILCACHE_VERSION);
    EXPECT_EQ(resp["id"], 7);
}

TEST_F(IPCHandlerTest, Ping) {
    EXPECT_EQ(handler->handle({{"type", "ping"}})["type"], "pong");
}

TEST_F(IPCHandlerTest, GetAccounts) {
    syncInbox();
    json resp = handler->handle({{"type", "get_accounts"}});

    ASSERT_EQ(resp["accounts"].size(), 1u);
    json account = resp["accounts"][0];
    EXPECT_EQ(account["id"], "a1");
    EXPECT_EQ(account["email"], "a1@example.com");
    EXPECT_EQ(account["mailboxes"], json::array({"INBOX"}));
    EXPECT_EQ(account["syncing"], false);
    EXPECT_EQ(account["cached_count"], 3);
    EXPECT_GT(account["last_sync_time"].get<time_t>(), 0);
}

TEST_F(IPCHandlerTest, GetMessagesDefaultsToInboxNewestFirst) {
    syncInbox();
    json resp = handler->handle({{"type", "get_messages"}, {"account", "a1"}, {"limit", 2}});

    EXPECT_EQ(resp["type"], "messages");
    ASSERT_EQ(resp["messages"].size(), 2u);
    EXPECT_EQ(resp["messages"][0]["uid"], 3);
    EXPECT_EQ(resp["messages"][1]["uid"], 2);
    EXPECT_FALSE(resp["messages"][0].contains("body"));
}

TEST_F(IPCHandlerTest, GetMessageBodyFetchesOnDemand) {
    syncInbox();
    json resp = handler->handle({{"type", "get_message_body"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 2}});

    EXPECT_EQ(resp["type"], "message");
    EXPECT_EQ(resp["message"]["body"], "<p>Body of 2</p>");
    EXPECT_TRUE(store->findMessage("a1", "INBOX", 2)->hasBody());

    // a second open is served from the cache
    handler->handle({{"type", "get_message_body"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 2}});
    EXPECT_EQ(std::count(remote->calls.begin(), remote->calls.end(), "fetchBody"), 1);
}

TEST_F(IPCHandlerTest, GetMessageBodyReportsVanished) {
    syncInbox();
    remote->dropMessage("INBOX", 1);

    std::vector<json> events;
    daemon->addListener([&events](const json & event) {
        events.push_back(event);
    });

    json resp = handler->handle({{"type", "get_message_body"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 1}});

    EXPECT_EQ(resp["type"], "vanished");
    EXPECT_EQ(resp["uid"], 1);
    EXPECT_EQ(store->findMessage("a1", "INBOX", 1), nullptr);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["type"], "message_vanished");
}

TEST_F(IPCHandlerTest, GetMessageBodyForUncachedMessageIsVanished) {
    json resp = handler->handle({{"type", "get_message_body"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 99}});
    EXPECT_EQ(resp["type"], "vanished");
    EXPECT_TRUE(remote->calls.empty());
}

TEST_F(IPCHandlerTest, SubmitMutationAndStatus) {
    json resp = handler->handle({{"type", "submit_mutation"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 1}, {"kind", "mark_read"}});
    EXPECT_EQ(resp["type"], "mutation");
    EXPECT_EQ(resp["result"], "accepted");
    EXPECT_GT(resp["mutation_id"].get<int64_t>(), 0);

    json status = handler->handle({{"type", "get_status"}, {"account", "a1"}});
    EXPECT_EQ(status["status"]["pending_mutation_count"], 1);
}

TEST_F(IPCHandlerTest, SubmitMutationRejectsUnknownKind) {
    json resp = handler->handle({{"type", "submit_mutation"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 1}, {"kind", "archive"}});
    EXPECT_EQ(resp["type"], "error");
    EXPECT_EQ(store->pendingMutationCount("a1"), 0);
}

TEST_F(IPCHandlerTest, SubmitMutationRejectsUIDsOutsideTheIMAPRange) {
    json resp = handler->handle({{"type", "submit_mutation"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 4294967301ULL}, {"kind", "delete"}});
    EXPECT_EQ(resp["type"], "error");

    resp = handler->handle({{"type", "submit_mutation"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 0}, {"kind", "delete"}});
    EXPECT_EQ(resp["type"], "error");

    resp = handler->handle({{"type", "submit_mutation"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", -5}, {"kind", "delete"}});
    EXPECT_EQ(resp["type"], "error");

    EXPECT_EQ(store->pendingMutationCount("a1"), 0);

    resp = handler->handle({{"type", "submit_mutation"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 4294967295ULL}, {"kind", "delete"}});
    EXPECT_EQ(resp["result"], "accepted");
}

TEST_F(IPCHandlerTest, SubmitMutationRejectsUnknownAccount) {
    json resp = handler->handle({{"type", "submit_mutation"}, {"account", "nobody"}, {"mailbox", "INBOX"}, {"uid", 1}, {"kind", "mark_read"}});
    EXPECT_EQ(resp["type"], "error");
    EXPECT_EQ(store->pendingMutationCount("nobody"), 0);
}

TEST_F(IPCHandlerTest, UnexpectedRemoteErrorBecomesErrorResponse) {
    syncInbox();
    remote->failUnexpectedly = true;

    json resp = handler->handle({{"type", "get_message_body"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", 2}, {"id", 9}});

    EXPECT_EQ(resp["type"], "error");
    EXPECT_EQ(resp["id"], 9);
    EXPECT_NE(store->findMessage("a1", "INBOX", 2), nullptr);
}

TEST_F(IPCHandlerTest, RequestSyncNeedsRunningDaemon) {
    json resp = handler->handle({{"type", "request_sync"}, {"account", "a1"}, {"id", "r1"}});
    EXPECT_EQ(resp["type"], "error");
    EXPECT_EQ(resp["id"], "r1");

    resp = handler->handle({{"type", "request_sync"}, {"account", "nobody"}});
    EXPECT_EQ(resp["type"], "error");
}

TEST_F(IPCHandlerTest, RequestSyncAcceptedWhenIdle) {
    std::mutex mtx;
    std::condition_variable cv;
    int completed = 0;
    daemon->addListener([&](const json & event) {
        if (event["type"] == "sync_completed") {
            std::lock_guard<std::mutex> lck(mtx);
            completed ++;
            cv.notify_all();
        }
    });

    daemon->start();
    {
        std::unique_lock<std::mutex> lck(mtx);
        ASSERT_TRUE(cv.wait_for(lck, std::chrono::seconds(10), [&]() { return completed >= 1; }));
    }

    json resp = handler->handle({{"type", "request_sync"}, {"account", "a1"}});
    EXPECT_EQ(resp["type"], "sync");
    EXPECT_EQ(resp["result"], "accepted");
    daemon->stop();
}

TEST_F(IPCHandlerTest, ShutdownRequestsStop) {
    json resp = handler->handle({{"type", "shutdown"}});
    EXPECT_EQ(resp["type"], "ok");
    daemon->waitForStopRequest();
}

TEST_F(IPCHandlerTest, MalformedRequestsBecomeErrors) {
    EXPECT_EQ(handler->handle(json::array({1, 2}))["type"], "error");
    EXPECT_EQ(handler->handle({{"kind", "ping"}})["type"], "error");
    EXPECT_EQ(handler->handle({{"type", "launch_rockets"}})["type"], "error");
    EXPECT_EQ(handler->handle({{"type", "get_messages"}})["type"], "error");
    EXPECT_EQ(handler->handle({{"type", "get_message_body"}, {"account", "a1"}, {"mailbox", "INBOX"}, {"uid", "one"}})["type"], "error");
}
