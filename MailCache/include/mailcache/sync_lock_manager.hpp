/** SyncLockManager [MailCache]
 *
 * Per-account mutual exclusion that survives process restarts.
 *
 * A lock record stores the holder's PID and its process start fingerprint.
 * A record is honored only while that PID still belongs to the process that
 * wrote it. PIDs are recycled, so a bare PID check would leave locks behind
 * a crashed daemon that never clear. Neither acquire nor release blocks; a
 * false result from acquire means another pass owns the account and the
 * caller should skip it this cycle.
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

#ifndef SyncLockManager_hpp
#define SyncLockManager_hpp

#include <memory>
#include <string>
#include <vector>

#include "mailcache/mail_store.hpp"
#include "mailcache/process_inspector.hpp"
#include "mailcache/models/sync_lock.hpp"

class SyncLockManager {
    MailStore * _store;
    ProcessInspector * _inspector;

public:
    SyncLockManager(MailStore * store, ProcessInspector * inspector);

    bool isLive(SyncLock & lock);

    /*
     Opens its own transaction on the store, so it must not be called while
     one is already open.
     */
    bool acquire(std::string accountId);

    void release(std::string accountId);

    bool isLocked(std::string accountId);

    int cleanupStaleLocks();
};

// Releases an acquired lock when it goes out of scope.
class SyncLockHold {
    SyncLockManager & _locks;
    std::string _accountId;

public:
    SyncLockHold(SyncLockManager & locks, std::string accountId);
    ~SyncLockHold();
};

#endif /* SyncLockManager_hpp */
