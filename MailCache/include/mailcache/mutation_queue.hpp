/** MutationQueue [MailCache]
 *
 * Durable outbox for delete, move-to-trash and mark-read requests.
 *
 * enqueue() only writes the PendingMutation row and returns. drain() replays
 * the rows in the order they were queued. A row is removed, and the change
 * applied to the cached copy, only once the server has confirmed it. Failed
 * rows keep their place with a bumped retry count and the last error.
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

#ifndef MutationQueue_hpp
#define MutationQueue_hpp

#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailcache/mail_store.hpp"
#include "mailcache/remote_session.hpp"
#include "mailcache/models/account.hpp"
#include "mailcache/models/pending_mutation.hpp"

struct DrainResult {
    int completed = 0;
    int failed = 0;
    int remaining = 0;
    bool stoppedOffline = false;

    nlohmann::json toJSON();
};

class MutationQueue {
    MailStore * store;
    std::shared_ptr<spdlog::logger> logger;

    void performRemote(RemoteSession * remote, PendingMutation & mutation);
    void applyLocally(PendingMutation & mutation);

public:
    MutationQueue(MailStore * store);

    // Throws SyncException for an unknown kind.
    int64_t enqueue(std::string accountId, std::string mailbox, uint32_t uid, std::string kind);

    DrainResult drain(std::string accountId, RemoteSession * remote);
};

#endif /* MutationQueue_hpp */
