/** SyncException [MailCache]
 *
 * Remote failures. RemoteVanishedException marks an object that no longer exists on the server.
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

#ifndef SyncException_hpp
#define SyncException_hpp

#include <stdio.h>
#include <string>
#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"
#include "mailcache/generic_exception.hpp"


class SyncException : public GenericException {
    bool retryable = false;
    bool offline = false;

public:
    SyncException(std::string key, std::string di, bool retryable);
    SyncException(mailcore::ErrorCode c, std::string di);
    std::string key;
    std::string debuginfo;
    bool isRetryable();
    bool isOffline();
    const char * what() const noexcept override;
    nlohmann::json toJSON() override;
};

class RemoteVanishedException : public SyncException {
public:
    RemoteVanishedException(std::string accountId, std::string mailbox, uint32_t uid);
    std::string accountId;
    std::string mailbox;
    uint32_t uid;
    nlohmann::json toJSON() override;
};


#endif /* SyncException_hpp */
