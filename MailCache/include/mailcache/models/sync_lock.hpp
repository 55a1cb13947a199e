/** SyncLock [MailCache]
 *
 * Persisted per-account lock record: holder PID plus the holder's start fingerprint.
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

#ifndef SyncLock_hpp
#define SyncLock_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailcache/models/mail_model.hpp"


class SyncLock : public MailModel {

public:
    static std::string TABLE_NAME;

    SyncLock(std::string accountId, int pid, int64_t startFingerprint, time_t acquiredAt);
    SyncLock(nlohmann::json json);
    SyncLock(SQLite::Statement & query);

    int pid();

    // 0 when the holder's start time could not be read
    int64_t startFingerprint();

    time_t acquiredAt();

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    std::vector<std::string> keyColumns();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* SyncLock_hpp */
