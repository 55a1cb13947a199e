/** IPCClient [MailCache]
 *
 * Blocking client for the daemon socket, used by the one-shot command line
 * modes and by tests.
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

#ifndef IPCClient_hpp
#define IPCClient_hpp

#include <string>

#include "nlohmann/json.hpp"

class IPCClient {
    std::string socketPath;
    int fd;
    std::string buffer;

public:
    IPCClient(std::string socketPath);
    ~IPCClient();

    // Throws SyncException with key "ipc-unavailable" when no daemon is listening.
    void connect();

    void close();

    nlohmann::json request(nlohmann::json request);

    // Blocks for the next line from the daemon, such as a subscribed event.
    nlohmann::json readMessage();
};

#endif /* IPCClient_hpp */
