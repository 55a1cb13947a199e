/** PendingMutation [MailCache]
 *
 * A queued delete, move-to-trash or mark-read awaiting remote confirmation.
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

#ifndef PendingMutation_hpp
#define PendingMutation_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailcache/models/mail_model.hpp"


class PendingMutation : public MailModel {

public:
    static std::string TABLE_NAME;

    static bool isValidKind(std::string kind);

    PendingMutation(std::string accountId, std::string mailbox, uint32_t uid, std::string kind);
    PendingMutation(nlohmann::json json);
    PendingMutation(SQLite::Statement & query);

    // 0 until the row has been inserted
    int64_t id();
    void setId(int64_t id);

    std::string mailbox();
    uint32_t remoteUID();
    std::string kind();
    time_t createdAt();

    int retries();
    void incrementRetries();

    std::string lastError();
    void setLastError(std::string e);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    std::vector<std::string> keyColumns();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* PendingMutation_hpp */
