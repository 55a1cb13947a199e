#include "mailcache/reconciler.hpp"
#include "mailcache/mail_store_transaction.hpp"
#include "mailcache/sync_exception.hpp"

#include <map>
#include <set>
#include <time.h>

nlohmann::json ReconcileResult::toJSON() {
    return {
        {"purged", purged},
        {"added", added},
        {"flags_changed", flagsChanged},
        {"removed", removed},
        {"expired", expired},
        {"prefetched", prefetched},
    };
}

Reconciler::Reconciler(MailStore * store, std::shared_ptr<RemoteSession> remote, std::shared_ptr<Account> account, ReconcilerOptions options) :
    store(store), remote(remote), account(account), logger(spdlog::get("logger")), options(options)
{
}

time_t Reconciler::retentionHorizon(time_t now) {
    return now - (time_t)options.recencyWindowDays * 24 * 60 * 60;
}

ReconcileResult Reconciler::reconcileMailbox(std::string mailbox) {
    ReconcileResult result{};
    std::string aid = account->id();
    time_t horizon = retentionHorizon(time(0));

    logger->info("Reconciling {} / {}", account->emailAddress(), mailbox);

    // A new UIDVALIDITY means every UID we hold for the mailbox refers to
    // something else now, so nothing cached can be kept.
    uint32_t generation = remote->generationId(mailbox);
    auto checkpoint = store->findCheckpoint(aid, mailbox);
    if (checkpoint == nullptr || checkpoint->generationId() != generation) {
        MailStoreTransaction transaction{store, "purgeMailbox"};
        int purged = store->purgeMailbox(aid, mailbox);
        transaction.commit();
        result.purged = true;
        if (checkpoint != nullptr) {
            logger->info("-- Generation changed {} -> {}, purged {} messages", checkpoint->generationId(), generation, purged);
        }
    }

    auto latest = remote->fetchLatestMetadata(mailbox, options.sequenceFloor);
    auto recentFlags = remote->fetchFlagsSince(mailbox, horizon);

    std::map<uint32_t, std::shared_ptr<Message>> target{};
    std::map<uint32_t, bool> unreadByUID{};
    for (auto & msg : latest) {
        target[msg->remoteUID()] = msg;
        unreadByUID[msg->remoteUID()] = msg->isUnread();
    }

    // Only union members we have neither just fetched nor already cached need
    // metadata. The cached ones only need their flags refreshed.
    std::set<uint32_t> cached = store->cachedUIDs(aid, mailbox);
    std::vector<uint32_t> needed{};
    for (const auto & pair : recentFlags) {
        unreadByUID[pair.first] = pair.second;
        if (!target.count(pair.first) && !cached.count(pair.first)) {
            needed.push_back(pair.first);
        }
    }
    if (needed.size() > 0) {
        logger->info("-- Fetching metadata for {} messages inside the recency window", needed.size());
        for (auto & msg : remote->fetchMetadataByUID(mailbox, needed)) {
            target[msg->remoteUID()] = msg;
        }
    }

    {
        MailStoreTransaction transaction{store, "insertMessages"};
        for (auto & pair : target) {
            if (store->insertIfAbsent(pair.second.get())) {
                result.added ++;
            }
        }
        result.flagsChanged = store->updateUnread(aid, mailbox, unreadByUID);
        transaction.commit();
    }

    // Stale messages are found against the full remote UID list, not just the
    // part of the mailbox this pass looked at.
    UIDDiff diff = store->diffUIDs(aid, mailbox, remote->fetchAllUIDs(mailbox));
    if (diff.stale.size() > 0) {
        MailStoreTransaction transaction{store, "removeStale"};
        result.removed = store->removeMessages(aid, mailbox, diff.stale);
        transaction.commit();
        logger->info("-- Removed {} messages no longer on the server", result.removed);
    }

    std::set<uint32_t> keep{};
    for (const auto & pair : unreadByUID) {
        keep.insert(pair.first);
    }
    {
        MailStoreTransaction transaction{store, "removeExpired"};
        result.expired = store->removeMessagesOlderThan(aid, mailbox, horizon, keep);
        transaction.commit();
    }

    for (uint32_t uid : store->uidsMissingBodies(aid, mailbox, options.prefetchCount)) {
        try {
            RemoteBody body = remote->fetchBody(mailbox, uid);
            if (store->saveBody(aid, mailbox, uid, body.body, body.plainText)) {
                result.prefetched ++;
            }
        } catch (RemoteVanishedException & ex) {
            logger->info("-- Message {} vanished before its body could be fetched, removing", uid);
            store->removeMessages(aid, mailbox, {uid});
        }
    }

    MailboxCheckpoint next{aid, mailbox, generation, time(0)};
    store->saveCheckpoint(&next);

    logger->info("Reconciled {} / {}: {}", account->emailAddress(), mailbox, result.toJSON().dump());
    return result;
}

std::shared_ptr<Message> Reconciler::fetchBodyNow(std::string mailbox, uint32_t uid) {
    std::string aid = account->id();
    try {
        RemoteBody body = remote->fetchBody(mailbox, uid);
        store->saveBody(aid, mailbox, uid, body.body, body.plainText);
    } catch (RemoteVanishedException & ex) {
        store->removeMessages(aid, mailbox, {uid});
        throw;
    }
    return store->findMessage(aid, mailbox, uid);
}
