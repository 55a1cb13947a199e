/** IMAPRemoteSession [MailCache]
 *
 * RemoteSession over a mailcore2 IMAPSession.
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

#ifndef IMAPRemoteSession_hpp
#define IMAPRemoteSession_hpp

#include <memory>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "spdlog/spdlog.h"

#include "mailcache/remote_session.hpp"
#include "mailcache/models/account.hpp"

class IMAPRemoteSession : public RemoteSession {
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;
    mailcore::IMAPSession session;
    std::string trashPath;

    mailcore::IMAPMessagesRequestKind metadataRequestKind();
    std::shared_ptr<Message> messageFromIMAP(std::string mailbox, mailcore::IMAPMessage * msg);
    std::vector<std::shared_ptr<Message>> messagesFromArray(std::string mailbox, mailcore::Array * msgs);
    std::string findTrashPath();
    bool uidExists(std::string mailbox, uint32_t uid);

public:
    IMAPRemoteSession(std::shared_ptr<Account> account);

    uint32_t generationId(std::string mailbox) override;
    std::vector<std::shared_ptr<Message>> fetchLatestMetadata(std::string mailbox, int count) override;
    std::map<uint32_t, bool> fetchFlagsSince(std::string mailbox, time_t since) override;
    std::vector<std::shared_ptr<Message>> fetchMetadataByUID(std::string mailbox, std::vector<uint32_t> uids) override;
    std::vector<uint32_t> fetchAllUIDs(std::string mailbox) override;
    RemoteBody fetchBody(std::string mailbox, uint32_t uid) override;
    void deleteMessage(std::string mailbox, uint32_t uid) override;
    void moveToTrash(std::string mailbox, uint32_t uid) override;
    void markRead(std::string mailbox, uint32_t uid) override;
};

#endif /* IMAPRemoteSession_hpp */
