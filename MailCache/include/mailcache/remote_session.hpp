/** RemoteSession [MailCache]
 *
 * The remote mailbox as seen by the reconciler and the mutation queue.
 *
 * Implementations throw SyncException on failure and RemoteVanishedException
 * when a requested message no longer exists on the server.
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

#ifndef RemoteSession_hpp
#define RemoteSession_hpp

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mailcache/models/account.hpp"
#include "mailcache/models/message.hpp"

struct RemoteBody {
    std::string body;
    std::string plainText;
};

class RemoteSession {
public:
    virtual ~RemoteSession() {}

    // UIDVALIDITY of the mailbox
    virtual uint32_t generationId(std::string mailbox) = 0;

    // Envelope and flags, no body, for the last `count` messages by sequence number.
    virtual std::vector<std::shared_ptr<Message>> fetchLatestMetadata(std::string mailbox, int count) = 0;

    // UID -> unread for every message received at or after `since`.
    virtual std::map<uint32_t, bool> fetchFlagsSince(std::string mailbox, time_t since) = 0;

    virtual std::vector<std::shared_ptr<Message>> fetchMetadataByUID(std::string mailbox, std::vector<uint32_t> uids) = 0;

    virtual std::vector<uint32_t> fetchAllUIDs(std::string mailbox) = 0;

    virtual RemoteBody fetchBody(std::string mailbox, uint32_t uid) = 0;

    virtual void deleteMessage(std::string mailbox, uint32_t uid) = 0;

    virtual void moveToTrash(std::string mailbox, uint32_t uid) = 0;

    virtual void markRead(std::string mailbox, uint32_t uid) = 0;
};

typedef std::function<std::shared_ptr<RemoteSession>(std::shared_ptr<Account>)> RemoteSessionFactory;

#endif /* RemoteSession_hpp */
