/** Daemon [MailCache]
 *
 * Owns the account list, the periodic scheduler and the lifecycle
 * (stopped -> starting -> running -> stopping -> stopped).
 *
 * Every sync interval each account is reconciled on its own thread under the
 * account's SyncLock, and every drain interval its mutation queue is replayed.
 * Accounts whose lock is held elsewhere are skipped for that cycle. Stopping
 * lets passes already under way finish and starts no new ones.
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef Daemon_hpp
#define Daemon_hpp

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailcache/daemon_config.hpp"
#include "mailcache/mail_store.hpp"
#include "mailcache/process_inspector.hpp"
#include "mailcache/remote_session.hpp"
#include "mailcache/models/account.hpp"

enum class DaemonState {
    Stopped,
    Starting,
    Running,
    Stopping
};

std::string DaemonStateName(DaemonState state);

typedef std::function<void(const nlohmann::json &)> DaemonEventListener;

class Daemon {
    DaemonConfig config;
    std::vector<std::shared_ptr<Account>> accounts;
    RemoteSessionFactory sessionFactory;
    ProcessInspector * inspector;
    std::shared_ptr<spdlog::logger> logger;

    std::mutex stateMtx;
    std::condition_variable stateCv;
    DaemonState state;
    bool stopRequested;
    std::thread schedulerThread;

    std::mutex requestedMtx;
    std::map<std::string, std::thread> requestedSyncs;

    std::mutex listenersMtx;
    std::map<int, DaemonEventListener> listeners;
    int nextListenerId;

    std::atomic<int> passesRun;

    void setState(DaemonState next);
    void runScheduler();
    void runLockedPass(MailStore & store, std::shared_ptr<Account> account, bool skipFresh);
    void forEachAccountConcurrently(std::string threadPrefix, std::function<void(std::shared_ptr<Account>)> fn);

public:
    Daemon(DaemonConfig config, std::vector<std::shared_ptr<Account>> accounts, RemoteSessionFactory sessionFactory, ProcessInspector * inspector);
    ~Daemon();

    DaemonConfig & getConfig();
    DaemonState getState();
    ProcessInspector * getInspector();
    std::vector<std::shared_ptr<Account>> getAccounts();
    std::shared_ptr<Account> findAccount(std::string accountId);
    std::shared_ptr<RemoteSession> sessionForAccount(std::shared_ptr<Account> account);
    int getPassesRun();

    void start();

    // Wakes anyone in waitForStopRequest(). Safe to call from any thread.
    void requestStop();
    bool isStopRequested();
    void waitForStopRequest();

    /*
     Calls requestStop() from a detached thread once one of `signals` is
     delivered. The signals must already be blocked in every thread, see
     BlockStopSignals().
     */
    void requestStopOnSignal(sigset_t signals);

    // Blocks until in-flight passes finish.
    void stop();

    /*
     Runs one reconciliation pass for every mailbox of the account, then drains
     its mutation queue. Returns false without doing anything if another pass
     holds the account's lock.
     */
    bool syncAccount(std::shared_ptr<Account> account, bool skipFresh = false);

    // Returns "accepted" and runs the pass in the background, or "busy".
    std::string requestSync(std::string accountId);

    bool drainAccount(std::shared_ptr<Account> account);

    int addListener(DaemonEventListener listener);
    void removeListener(int id);
    void emit(nlohmann::json event);
};

#endif /* Daemon_hpp */
