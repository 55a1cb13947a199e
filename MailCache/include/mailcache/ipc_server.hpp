/** IPCServer [MailCache]
 *
 * Serves IPCHandler over a Unix domain socket, one JSON object per line.
 * Each connection gets its own thread and its own MailStore. A connection
 * that sends {"type":"subscribe"} also receives every daemon event.
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

#ifndef IPCServer_hpp
#define IPCServer_hpp

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "spdlog/spdlog.h"

#include "mailcache/daemon.hpp"

class IPCServer {
    struct Connection {
        int fd;
        std::thread thread;
        std::atomic<bool> done;
        std::mutex writeMtx;
    };

    Daemon * daemon;
    std::string socketPath;
    int listenFd;
    std::atomic<bool> running;
    std::thread acceptThread;
    std::shared_ptr<spdlog::logger> logger;

    std::mutex connectionsMtx;
    std::list<std::shared_ptr<Connection>> connections;

    void acceptLoop();
    void serveConnection(std::shared_ptr<Connection> conn);
    void pruneFinishedConnections();
    bool writeLine(std::shared_ptr<Connection> conn, std::string line);
    bool writeLineLocked(std::shared_ptr<Connection> conn, std::string line);

public:
    IPCServer(Daemon * daemon, std::string socketPath);
    ~IPCServer();

    // Throws SyncException if the socket cannot be bound.
    void start();

    void stop();
};

#endif /* IPCServer_hpp */
