/** Message [MailCache]
 *
 * One cached message, keyed by (account, mailbox, remote UID). The body is held
 * apart from the metadata and is only populated when it has been fetched.
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

#ifndef Message_hpp
#define Message_hpp

#include <stdio.h>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

#include "mailcache/models/mail_model.hpp"
#include "mailcache/models/attachment.hpp"


class Message : public MailModel {
    bool _hasBody;
    std::string _body;

public:
    static std::string TABLE_NAME;

    Message(std::string accountId, std::string mailbox, uint32_t uid);
    Message(nlohmann::json json);
    Message(SQLite::Statement & query);

    std::string mailbox();
    uint32_t remoteUID();

    std::string headerMessageId();
    void setHeaderMessageId(std::string id);

    time_t receivedAt();
    void setReceivedAt(time_t t);

    time_t date();
    void setDate(time_t t);

    nlohmann::json from();
    void setFrom(nlohmann::json from);
    nlohmann::json to();
    void setTo(nlohmann::json to);
    nlohmann::json replyTo();
    void setReplyTo(nlohmann::json replyTo);

    std::string subject();
    void setSubject(std::string s);

    std::string snippet();
    void setSnippet(std::string s);

    bool isUnread();
    void setUnread(bool u);

    std::vector<std::string> references();
    void setReferences(std::vector<std::string> refs);

    std::vector<Attachment> attachments();
    void setAttachments(std::vector<Attachment> & attachments);

    bool hasBody();
    std::string body();
    void setBody(std::string body);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    std::vector<std::string> keyColumns();
    void bindToQuery(SQLite::Statement * query);

    nlohmann::json toJSONWithBody();
};

#endif /* Message_hpp */
