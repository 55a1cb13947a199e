/** MailboxCheckpoint [MailCache]
 *
 * Last observed generation (UIDVALIDITY) and completion time of a mailbox pass.
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

#ifndef MailboxCheckpoint_hpp
#define MailboxCheckpoint_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailcache/models/mail_model.hpp"


class MailboxCheckpoint : public MailModel {

public:
    static std::string TABLE_NAME;

    MailboxCheckpoint(std::string accountId, std::string mailbox, uint32_t generationId, time_t lastSyncTime);
    MailboxCheckpoint(nlohmann::json json);
    MailboxCheckpoint(SQLite::Statement & query);

    std::string mailbox();

    uint32_t generationId();
    void setGenerationId(uint32_t g);

    time_t lastSyncTime();
    void setLastSyncTime(time_t t);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    std::vector<std::string> keyColumns();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* MailboxCheckpoint_hpp */
