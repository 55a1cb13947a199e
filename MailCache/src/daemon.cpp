#include "mailcache/daemon.hpp"
#include "mailcache/mutation_queue.hpp"
#include "mailcache/reconciler.hpp"
#include "mailcache/sync_exception.hpp"
#include "mailcache/sync_lock_manager.hpp"
#include "mailcache/thread_utils.hpp"

#include <algorithm>
#include <chrono>

std::string DaemonStateName(DaemonState state) {
    switch (state) {
        case DaemonState::Stopped: return "stopped";
        case DaemonState::Starting: return "starting";
        case DaemonState::Running: return "running";
        case DaemonState::Stopping: return "stopping";
    }
    return "unknown";
}

Daemon::Daemon(DaemonConfig config, std::vector<std::shared_ptr<Account>> accounts, RemoteSessionFactory sessionFactory, ProcessInspector * inspector) :
    config(config),
    accounts(accounts),
    sessionFactory(sessionFactory),
    inspector(inspector),
    logger(spdlog::get("logger")),
    state(DaemonState::Stopped),
    stopRequested(false),
    nextListenerId(1),
    passesRun(0)
{
}

Daemon::~Daemon() {
    stop();
}

DaemonConfig & Daemon::getConfig() {
    return config;
}

DaemonState Daemon::getState() {
    std::lock_guard<std::mutex> lck(stateMtx);
    return state;
}

ProcessInspector * Daemon::getInspector() {
    return inspector;
}

std::vector<std::shared_ptr<Account>> Daemon::getAccounts() {
    return accounts;
}

std::shared_ptr<Account> Daemon::findAccount(std::string accountId) {
    for (auto & account : accounts) {
        if (account->id() == accountId) {
            return account;
        }
    }
    return nullptr;
}

std::shared_ptr<RemoteSession> Daemon::sessionForAccount(std::shared_ptr<Account> account) {
    return sessionFactory(account);
}

int Daemon::getPassesRun() {
    return passesRun;
}

void Daemon::setState(DaemonState next) {
    DaemonState prev;
    {
        std::lock_guard<std::mutex> lck(stateMtx);
        prev = state;
        state = next;
    }
    stateCv.notify_all();
    logger->info("Daemon state {} -> {}", DaemonStateName(prev), DaemonStateName(next));
}

#pragma mark Lifecycle

void Daemon::start() {
    setState(DaemonState::Starting);
    {
        MailStore store(config.databasePath());
        store.migrate();
        SyncLockManager locks(&store, inspector);
        locks.cleanupStaleLocks();
    }
    {
        std::lock_guard<std::mutex> lck(stateMtx);
        stopRequested = false;
    }
    setState(DaemonState::Running);
    schedulerThread = std::thread([this]() {
        SetThreadName("scheduler");
        runScheduler();
    });
}

void Daemon::requestStop() {
    {
        std::lock_guard<std::mutex> lck(stateMtx);
        stopRequested = true;
    }
    stateCv.notify_all();
}

bool Daemon::isStopRequested() {
    std::lock_guard<std::mutex> lck(stateMtx);
    return stopRequested;
}

void Daemon::waitForStopRequest() {
    std::unique_lock<std::mutex> lck(stateMtx);
    stateCv.wait(lck, [this]() { return stopRequested; });
}

void Daemon::requestStopOnSignal(sigset_t signals) {
    std::thread signalThread([this, signals]() {
        SetThreadName("signals");
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            logger->info("Received signal {}, stopping", sig);
            requestStop();
        }
    });
    signalThread.detach();
}

void Daemon::stop() {
    {
        std::lock_guard<std::mutex> lck(stateMtx);
        if (state == DaemonState::Stopped || state == DaemonState::Stopping) {
            return;
        }
    }
    setState(DaemonState::Stopping);
    requestStop();

    if (schedulerThread.joinable()) {
        schedulerThread.join();
    }
    {
        std::lock_guard<std::mutex> lck(requestedMtx);
        for (auto & pair : requestedSyncs) {
            if (pair.second.joinable()) {
                pair.second.join();
            }
        }
        requestedSyncs.clear();
    }
    setState(DaemonState::Stopped);
}

#pragma mark Scheduling

void Daemon::forEachAccountConcurrently(std::string threadPrefix, std::function<void(std::shared_ptr<Account>)> fn) {
    std::vector<std::thread> threads{};
    for (auto account : accounts) {
        threads.push_back(std::thread([this, threadPrefix, fn, account]() {
            SetThreadName((threadPrefix + "-" + account->id()).c_str());
            try {
                fn(account);
            } catch (SQLite::Exception & ex) {
                logger->error("{} for {} failed: {}", threadPrefix, account->id(), ex.what());
            } catch (SyncException & ex) {
                logger->error("{} for {} failed: {} {}", threadPrefix, account->id(), ex.key, ex.debuginfo);
            } catch (std::exception & ex) {
                logger->error("{} for {} failed unexpectedly: {}", threadPrefix, account->id(), ex.what());
            }
        }));
    }
    for (auto & thread : threads) {
        thread.join();
    }
}

void Daemon::runScheduler() {
    auto syncInterval = std::chrono::seconds(config.syncIntervalSeconds);
    auto drainInterval = std::chrono::seconds(config.drainIntervalSeconds);
    auto nextSync = std::chrono::steady_clock::now();
    auto nextDrain = nextSync + drainInterval;
    bool firstPass = true;

    while (true) {
        {
            std::lock_guard<std::mutex> lck(stateMtx);
            if (state != DaemonState::Running) {
                return;
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= nextSync) {
            // Mailboxes synced moments ago by a previous daemon are left
            // alone on the first cycle after a restart.
            bool skipFresh = firstPass;
            forEachAccountConcurrently("sync", [this, skipFresh](std::shared_ptr<Account> account) {
                syncAccount(account, skipFresh);
            });
            firstPass = false;
            nextSync = std::chrono::steady_clock::now() + syncInterval;
            nextDrain = std::chrono::steady_clock::now() + drainInterval;

        } else if (now >= nextDrain) {
            forEachAccountConcurrently("drain", [this](std::shared_ptr<Account> account) {
                drainAccount(account);
            });
            nextDrain = std::chrono::steady_clock::now() + drainInterval;
        }

        std::unique_lock<std::mutex> lck(stateMtx);
        stateCv.wait_until(lck, std::min(nextSync, nextDrain), [this]() {
            return state != DaemonState::Running;
        });
    }
}

#pragma mark Passes

bool Daemon::syncAccount(std::shared_ptr<Account> account, bool skipFresh) {
    MailStore store(config.databasePath());
    SyncLockManager locks(&store, inspector);
    if (!locks.acquire(account->id())) {
        logger->info("Skipping {}, another pass holds its lock", account->emailAddress());
        return false;
    }
    runLockedPass(store, account, skipFresh);
    return true;
}

void Daemon::runLockedPass(MailStore & store, std::shared_ptr<Account> account, bool skipFresh) {
    std::string aid = account->id();
    SyncLockManager locks(&store, inspector);
    nlohmann::json results = nlohmann::json::object();
    bool failed = false;

    passesRun ++;
    emit({{"type", "sync_started"}, {"account", aid}});

    try {
        SyncLockHold hold(locks, aid);
        auto remote = sessionForAccount(account);
        Reconciler reconciler(&store, remote, account, config.reconcilerOptions());
        bool offline = false;

        for (auto mailbox : account->mailboxes()) {
            if (isStopRequested()) {
                logger->info("Stop requested, not reconciling the rest of {}", account->emailAddress());
                break;
            }
            if (skipFresh && store.isFresh(aid, mailbox, config.freshCacheSeconds)) {
                logger->info("Skipping {} / {}, synced within the last {}s", account->emailAddress(), mailbox, config.freshCacheSeconds);
                continue;
            }
            try {
                results[mailbox] = reconciler.reconcileMailbox(mailbox).toJSON();
            } catch (SyncException & ex) {
                logger->error("Reconciling {} / {} failed: {} {}", account->emailAddress(), mailbox, ex.key, ex.debuginfo);
                emit({{"type", "sync_error"}, {"account", aid}, {"mailbox", mailbox}, {"error", ex.toJSON()}});
                failed = true;
                if (ex.isOffline()) {
                    offline = true;
                    break;
                }
            }
        }

        if (!offline && !isStopRequested()) {
            MutationQueue queue(&store);
            queue.drain(aid, remote.get());
        }
    } catch (SyncException & ex) {
        logger->error("Sync pass for {} failed: {} {}", account->emailAddress(), ex.key, ex.debuginfo);
        emit({{"type", "sync_error"}, {"account", aid}, {"error", ex.toJSON()}});
        failed = true;
    } catch (SQLite::Exception & ex) {
        logger->error("Sync pass for {} failed with a database error: {}", account->emailAddress(), ex.what());
        emit({{"type", "sync_error"}, {"account", aid}, {"error", {{"key", "database"}, {"debuginfo", ex.what()}}}});
        failed = true;
    } catch (std::exception & ex) {
        logger->error("Sync pass for {} failed unexpectedly: {}", account->emailAddress(), ex.what());
        emit({{"type", "sync_error"}, {"account", aid}, {"error", {{"key", "internal"}, {"debuginfo", ex.what()}}}});
        failed = true;
    }

    if (!failed) {
        emit({{"type", "sync_completed"}, {"account", aid}, {"last_sync_time", store.lastSyncTime(aid)}, {"mailboxes", results}});
    }
}

bool Daemon::drainAccount(std::shared_ptr<Account> account) {
    std::string aid = account->id();
    MailStore store(config.databasePath());
    if (store.pendingMutationCount(aid) == 0) {
        return true;
    }

    SyncLockManager locks(&store, inspector);
    if (!locks.acquire(aid)) {
        return false;
    }
    SyncLockHold hold(locks, aid);
    try {
        MutationQueue queue(&store);
        queue.drain(aid, sessionForAccount(account).get());
    } catch (SQLite::Exception & ex) {
        logger->error("Draining mutations for {} failed: {}", account->emailAddress(), ex.what());
    } catch (SyncException & ex) {
        logger->error("Draining mutations for {} failed: {} {}", account->emailAddress(), ex.key, ex.debuginfo);
    } catch (std::exception & ex) {
        logger->error("Draining mutations for {} failed unexpectedly: {}", account->emailAddress(), ex.what());
    }
    return true;
}

std::string Daemon::requestSync(std::string accountId) {
    auto account = findAccount(accountId);
    if (account == nullptr) {
        throw SyncException("unknown-account", "No account with id " + accountId, false);
    }

    // requestedMtx is held until the thread is registered so that stop()
    // cannot miss it.
    std::lock_guard<std::mutex> lck(requestedMtx);
    if (getState() != DaemonState::Running) {
        throw SyncException("not-running", "The daemon is not accepting sync requests", false);
    }

    auto store = std::make_shared<MailStore>(config.databasePath());
    SyncLockManager locks(store.get(), inspector);
    if (!locks.acquire(accountId)) {
        return "busy";
    }

    auto existing = requestedSyncs.find(accountId);
    if (existing != requestedSyncs.end() && existing->second.joinable()) {
        // it has released the lock we just took, so it is about to exit
        existing->second.join();
    }
    requestedSyncs[accountId] = std::thread([this, store, account]() {
        SetThreadName(("sync-" + account->id()).c_str());
        try {
            runLockedPass(*store, account, false);
        } catch (std::exception & ex) {
            logger->error("Requested sync for {} failed: {}", account->id(), ex.what());
        }
    });
    return "accepted";
}

#pragma mark Events

int Daemon::addListener(DaemonEventListener listener) {
    std::lock_guard<std::mutex> lck(listenersMtx);
    int id = nextListenerId ++;
    listeners[id] = listener;
    return id;
}

void Daemon::removeListener(int id) {
    std::lock_guard<std::mutex> lck(listenersMtx);
    listeners.erase(id);
}

void Daemon::emit(nlohmann::json event) {
    std::vector<DaemonEventListener> targets{};
    {
        std::lock_guard<std::mutex> lck(listenersMtx);
        for (auto & pair : listeners) {
            targets.push_back(pair.second);
        }
    }
    for (auto & listener : targets) {
        listener(event);
    }
}
