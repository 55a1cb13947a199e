/** Attachment [MailCache]
 *
 * Attachment descriptor. Only metadata is cached, never the content.
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

#ifndef Attachment_hpp
#define Attachment_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailcache/models/mail_model.hpp"


class Attachment : public MailModel {

public:
    static std::string TABLE_NAME;

    Attachment(std::string accountId, std::string mailbox, uint32_t uid, std::string partId);
    Attachment(nlohmann::json json);
    Attachment(SQLite::Statement & query);

    std::string mailbox();
    uint32_t remoteUID();
    std::string partId();

    std::string filename();
    void setFilename(std::string s);

    std::string contentType();
    void setContentType(std::string s);

    uint64_t size();
    void setSize(uint64_t s);

    std::string encoding();
    void setEncoding(std::string s);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    std::vector<std::string> keyColumns();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* Attachment_hpp */
