/** Reconciler [MailCache]
 *
 * Brings the cached copy of one mailbox up to date with the server in a single,
 * bounded pass.
 *
 * The pass caches the union of the newest `sequenceFloor` messages and every
 * message received inside the recency window, so a sparse mailbox still has a
 * useful amount of mail and a busy one never loses recent mail. Each step is
 * committed on its own and is safe to repeat; a remote failure aborts the
 * rest of the pass and leaves what was written so far in place.
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

#ifndef Reconciler_hpp
#define Reconciler_hpp

#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailcache/mail_store.hpp"
#include "mailcache/remote_session.hpp"
#include "mailcache/models/account.hpp"

struct ReconcilerOptions {
    int recencyWindowDays = 14;
    int sequenceFloor = 100;
    int prefetchCount = 10;
};

struct ReconcileResult {
    bool purged = false;
    int added = 0;
    int flagsChanged = 0;
    int removed = 0;
    int expired = 0;
    int prefetched = 0;

    nlohmann::json toJSON();
};

class Reconciler {
    MailStore * store;
    std::shared_ptr<RemoteSession> remote;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;
    ReconcilerOptions options;

public:
    Reconciler(MailStore * store, std::shared_ptr<RemoteSession> remote, std::shared_ptr<Account> account, ReconcilerOptions options);

    ReconcileResult reconcileMailbox(std::string mailbox);

    /*
     Fetches and stores the body of one cached message outside the regular pass.
     If the server no longer has the message it is removed from the store and
     RemoteVanishedException is rethrown to the caller.
     */
    std::shared_ptr<Message> fetchBodyNow(std::string mailbox, uint32_t uid);

    time_t retentionHorizon(time_t now);
};

#endif /* Reconciler_hpp */
