#include "mailcache/sync_lock_manager.hpp"
#include "mailcache/mail_store_transaction.hpp"

#include <time.h>

#include "spdlog/spdlog.h"

SyncLockManager::SyncLockManager(MailStore * store, ProcessInspector * inspector) :
    _store(store), _inspector(inspector)
{
}

bool SyncLockManager::isLive(SyncLock & lock) {
    int pid = lock.pid();
    if (pid <= 0) {
        return false;
    }

    if (lock.startFingerprint() != 0) {
        int64_t current = _inspector->startFingerprint(pid);
        if (current != 0) {
            return current == lock.startFingerprint();
        }
        return _inspector->isRunning(pid);
    }

    if (_inspector->isOwnProcessFamily(pid)) {
        return true;
    }
    return _inspector->isRunning(pid);
}

bool SyncLockManager::acquire(std::string accountId) {
    MailStoreTransaction transaction{_store, "acquireLock"};

    auto existing = _store->find<SyncLock>(Query().equal("accountId", accountId));
    if (existing != nullptr) {
        if (isLive(*existing)) {
            return false;
        }
        spdlog::get("logger")->info("Removing stale sync lock for {} (pid {}, fingerprint {})", accountId, existing->pid(), existing->startFingerprint());
        _store->remove(existing.get());
    }

    int pid = _inspector->currentPid();
    SyncLock lock{accountId, pid, _inspector->startFingerprint(pid), time(0)};
    _store->insert(&lock);
    transaction.commit();
    return true;
}

void SyncLockManager::release(std::string accountId) {
    SQLite::Statement del(_store->db(), "DELETE FROM SyncLock WHERE accountId = ? AND pid = ?");
    del.bind(1, accountId);
    del.bind(2, _inspector->currentPid());
    if (del.exec() == 0) {
        spdlog::get("logger")->warn("Released sync lock for {} but this process did not hold it", accountId);
    }
}

bool SyncLockManager::isLocked(std::string accountId) {
    auto existing = _store->find<SyncLock>(Query().equal("accountId", accountId));
    return existing != nullptr && isLive(*existing);
}

int SyncLockManager::cleanupStaleLocks() {
    MailStoreTransaction transaction{_store, "cleanupStaleLocks"};
    int removed = 0;
    Query all;
    for (auto lock : _store->findAll<SyncLock>(all)) {
        if (!isLive(*lock)) {
            _store->remove(lock.get());
            removed ++;
        }
    }
    transaction.commit();
    if (removed > 0) {
        spdlog::get("logger")->info("Removed {} stale sync lock(s)", removed);
    }
    return removed;
}

SyncLockHold::SyncLockHold(SyncLockManager & locks, std::string accountId) :
    _locks(locks), _accountId(accountId)
{
}

SyncLockHold::~SyncLockHold() {
    try {
        _locks.release(_accountId);
    } catch (SQLite::Exception & ex) {
        spdlog::get("logger")->error("Could not release sync lock for {}: {}", _accountId, ex.what());
    }
}
