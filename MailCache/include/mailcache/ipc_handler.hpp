/** IPCHandler [MailCache]
 *
 * Answers one client request against the store and the daemon. Independent of
 * the transport, so a request and its response are both plain JSON objects.
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

#ifndef IPCHandler_hpp
#define IPCHandler_hpp

#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailcache/daemon.hpp"
#include "mailcache/mail_store.hpp"

class IPCHandler {
    Daemon * daemon;
    MailStore * store;
    std::shared_ptr<spdlog::logger> logger;

    nlohmann::json getAccounts();
    nlohmann::json getMessages(const nlohmann::json & request);
    nlohmann::json getMessageBody(const nlohmann::json & request);
    nlohmann::json requestSync(const nlohmann::json & request);
    nlohmann::json submitMutation(const nlohmann::json & request);
    nlohmann::json getStatus(const nlohmann::json & request);

public:
    IPCHandler(Daemon * daemon, MailStore * store);

    // Never throws: failures come back as {"type": "error"} responses.
    nlohmann::json handle(const nlohmann::json & request);
};

#endif /* IPCHandler_hpp */
