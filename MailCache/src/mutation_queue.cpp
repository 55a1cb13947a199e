#include "mailcache/mutation_queue.hpp"
#include "mailcache/mail_store_transaction.hpp"
#include "mailcache/sync_exception.hpp"
#include "mailcache/constants.hpp"

nlohmann::json DrainResult::toJSON() {
    return {
        {"completed", completed},
        {"failed", failed},
        {"remaining", remaining},
        {"stopped_offline", stoppedOffline},
    };
}

MutationQueue::MutationQueue(MailStore * store) :
    store(store), logger(spdlog::get("logger"))
{
}

int64_t MutationQueue::enqueue(std::string accountId, std::string mailbox, uint32_t uid, std::string kind) {
    if (!PendingMutation::isValidKind(kind)) {
        throw SyncException("invalid-mutation-kind", "Unknown mutation kind: " + kind, false);
    }
    PendingMutation mutation{accountId, mailbox, uid, kind};
    int64_t id = store->enqueueMutation(&mutation);
    logger->info("Queued {} for {} / {} UID {} (mutation {})", kind, accountId, mailbox, uid, id);
    return id;
}

void MutationQueue::performRemote(RemoteSession * remote, PendingMutation & mutation) {
    std::string kind = mutation.kind();
    if (kind == MUTATION_KIND_DELETE) {
        remote->deleteMessage(mutation.mailbox(), mutation.remoteUID());
    } else if (kind == MUTATION_KIND_MOVE_TRASH) {
        remote->moveToTrash(mutation.mailbox(), mutation.remoteUID());
    } else if (kind == MUTATION_KIND_MARK_READ) {
        remote->markRead(mutation.mailbox(), mutation.remoteUID());
    } else {
        throw SyncException("invalid-mutation-kind", "Unknown mutation kind: " + kind, false);
    }
}

void MutationQueue::applyLocally(PendingMutation & mutation) {
    std::string kind = mutation.kind();
    if (kind == MUTATION_KIND_MARK_READ) {
        store->updateUnread(mutation.accountId(), mutation.mailbox(), {{mutation.remoteUID(), false}});
    } else {
        store->removeMessages(mutation.accountId(), mutation.mailbox(), {mutation.remoteUID()});
    }
}

DrainResult MutationQueue::drain(std::string accountId, RemoteSession * remote) {
    DrainResult result{};
    auto pending = store->pendingMutations(accountId);

    for (size_t ii = 0; ii < pending.size(); ii ++) {
        auto mutation = pending[ii];
        try {
            performRemote(remote, *mutation);
        } catch (SyncException & ex) {
            logger->warn("Mutation {} ({} {} UID {}) failed: {} {}", mutation->id(), mutation->kind(), mutation->mailbox(), mutation->remoteUID(), ex.key, ex.debuginfo);

            // Offline: nothing later in the queue can succeed either, and the
            // entry itself did nothing wrong, so its retry count is left alone.
            if (ex.isOffline()) {
                result.stoppedOffline = true;
                result.remaining = (int)(pending.size() - ii);
                return result;
            }

            MailStoreTransaction transaction{store, "mutationFailed"};
            mutation->incrementRetries();
            mutation->setLastError(ex.key + ": " + ex.debuginfo);
            store->update(mutation.get());
            store->logMutation(mutation.get(), "failed", mutation->lastError());
            transaction.commit();
            result.failed ++;
            result.remaining ++;
            continue;
        }

        MailStoreTransaction transaction{store, "mutationCompleted"};
        store->removeMutation(mutation->id());
        applyLocally(*mutation);
        store->logMutation(mutation.get(), "completed", "");
        transaction.commit();
        result.completed ++;
    }

    if (pending.size() > 0) {
        logger->info("Drained mutations for {}: {}", accountId, result.toJSON().dump());
    }
    return result;
}
