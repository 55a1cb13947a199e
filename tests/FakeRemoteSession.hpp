#ifndef FakeRemoteSession_hpp
#define FakeRemoteSession_hpp

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "mailcache/remote_session.hpp"
#include "mailcache/sync_exception.hpp"

struct FakeRemoteMessage {
    uint32_t uid;
    time_t receivedAt;
    bool unread;
    std::string body;
};

/*
 In-memory server. Each mailbox is a list in sequence-number order. Tests can
 change the generation, drop messages, make every call fail, or hold a pass
 open at its first remote call to observe overlap.
 */
class FakeRemoteSession : public RemoteSession {
    std::mutex mtx;
    std::string accountId;

    std::shared_ptr<Message> toMessage(std::string mailbox, const FakeRemoteMessage & m) {
        auto msg = std::make_shared<Message>(accountId, mailbox, m.uid);
        msg->setReceivedAt(m.receivedAt);
        msg->setDate(m.receivedAt);
        msg->setSubject("Remote " + std::to_string(m.uid));
        msg->setUnread(m.unread);
        return msg;
    }

    void maybeFail(std::string call) {
        std::lock_guard<std::mutex> lck(mtx);
        calls.push_back(call);
        if (failKey != "") {
            throw SyncException(failKey, "fake failure in " + call, true);
        }
        if (failOffline) {
            throw SyncException(mailcore::ErrorConnection, "fake offline in " + call);
        }
        if (failUnexpectedly) {
            throw std::runtime_error("fake internal error in " + call);
        }
    }

public:
    std::map<std::string, std::vector<FakeRemoteMessage>> mailboxes;
    std::map<std::string, uint32_t> generations;
    std::vector<std::string> calls;
    std::string failKey = "";
    bool failOffline = false;
    bool failUnexpectedly = false;

    // overlap instrumentation: a pass is "active" from generationId to fetchAllUIDs
    std::atomic<int> activePasses{0};
    std::atomic<int> maxActivePasses{0};

    // when holdPasses is set, generationId blocks until release() is called
    bool holdPasses = false;
    bool held = false;
    std::condition_variable holdCv;

    FakeRemoteSession(std::string accountId) : accountId(accountId) {}

    void addMessages(std::string mailbox, uint32_t firstUID, int count, time_t newestReceivedAt, time_t spacing) {
        std::lock_guard<std::mutex> lck(mtx);
        auto & list = mailboxes[mailbox];
        for (int ii = 0; ii < count; ii ++) {
            uint32_t uid = firstUID + ii;
            time_t received = newestReceivedAt - (time_t)(count - 1 - ii) * spacing;
            list.push_back({uid, received, true, "<p>Body of " + std::to_string(uid) + "</p>"});
        }
        if (!generations.count(mailbox)) {
            generations[mailbox] = 1;
        }
    }

    void dropMessage(std::string mailbox, uint32_t uid) {
        std::lock_guard<std::mutex> lck(mtx);
        auto & list = mailboxes[mailbox];
        list.erase(std::remove_if(list.begin(), list.end(), [uid](const FakeRemoteMessage & m) { return m.uid == uid; }), list.end());
    }

    bool hasMessage(std::string mailbox, uint32_t uid) {
        std::lock_guard<std::mutex> lck(mtx);
        for (auto & m : mailboxes[mailbox]) {
            if (m.uid == uid) {
                return true;
            }
        }
        return false;
    }

    void waitUntilHeld() {
        std::unique_lock<std::mutex> lck(mtx);
        holdCv.wait(lck, [this]() { return held; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lck(mtx);
            holdPasses = false;
        }
        holdCv.notify_all();
    }

    uint32_t generationId(std::string mailbox) override {
        maybeFail("generationId");
        int active = ++activePasses;
        int prev = maxActivePasses;
        while (active > prev && !maxActivePasses.compare_exchange_weak(prev, active)) {}

        std::unique_lock<std::mutex> lck(mtx);
        if (holdPasses) {
            held = true;
            holdCv.notify_all();
            holdCv.wait(lck, [this]() { return !holdPasses; });
        }
        return generations[mailbox];
    }

    std::vector<std::shared_ptr<Message>> fetchLatestMetadata(std::string mailbox, int count) override {
        maybeFail("fetchLatestMetadata");
        std::lock_guard<std::mutex> lck(mtx);
        auto & list = mailboxes[mailbox];
        std::vector<std::shared_ptr<Message>> results{};
        size_t start = list.size() > (size_t)count ? list.size() - count : 0;
        for (size_t ii = start; ii < list.size(); ii ++) {
            results.push_back(toMessage(mailbox, list[ii]));
        }
        return results;
    }

    std::map<uint32_t, bool> fetchFlagsSince(std::string mailbox, time_t since) override {
        maybeFail("fetchFlagsSince");
        std::lock_guard<std::mutex> lck(mtx);
        std::map<uint32_t, bool> results{};
        for (auto & m : mailboxes[mailbox]) {
            if (m.receivedAt >= since) {
                results[m.uid] = m.unread;
            }
        }
        return results;
    }

    std::vector<std::shared_ptr<Message>> fetchMetadataByUID(std::string mailbox, std::vector<uint32_t> uids) override {
        maybeFail("fetchMetadataByUID");
        std::lock_guard<std::mutex> lck(mtx);
        std::vector<std::shared_ptr<Message>> results{};
        for (auto & m : mailboxes[mailbox]) {
            if (std::find(uids.begin(), uids.end(), m.uid) != uids.end()) {
                results.push_back(toMessage(mailbox, m));
            }
        }
        return results;
    }

    std::vector<uint32_t> fetchAllUIDs(std::string mailbox) override {
        maybeFail("fetchAllUIDs");
        activePasses --;
        std::lock_guard<std::mutex> lck(mtx);
        std::vector<uint32_t> uids{};
        for (auto & m : mailboxes[mailbox]) {
            uids.push_back(m.uid);
        }
        return uids;
    }

    RemoteBody fetchBody(std::string mailbox, uint32_t uid) override {
        maybeFail("fetchBody");
        std::lock_guard<std::mutex> lck(mtx);
        for (auto & m : mailboxes[mailbox]) {
            if (m.uid == uid) {
                return RemoteBody{m.body, "Body of " + std::to_string(uid)};
            }
        }
        throw RemoteVanishedException(accountId, mailbox, uid);
    }

    void deleteMessage(std::string mailbox, uint32_t uid) override {
        maybeFail("deleteMessage");
        dropMessage(mailbox, uid);
    }

    void moveToTrash(std::string mailbox, uint32_t uid) override {
        maybeFail("moveToTrash");
        std::lock_guard<std::mutex> lck(mtx);
        auto & list = mailboxes[mailbox];
        for (auto it = list.begin(); it != list.end(); it ++) {
            if (it->uid == uid) {
                mailboxes["Trash"].push_back(*it);
                list.erase(it);
                return;
            }
        }
    }

    void markRead(std::string mailbox, uint32_t uid) override {
        maybeFail("markRead");
        std::lock_guard<std::mutex> lck(mtx);
        for (auto & m : mailboxes[mailbox]) {
            if (m.uid == uid) {
                m.unread = false;
            }
        }
    }
};

#endif /* FakeRemoteSession_hpp */
