#include "mailcache/ipc_server.hpp"
#include "mailcache/constants.hpp"
#include "mailcache/ipc_handler.hpp"
#include "mailcache/sync_exception.hpp"
#include "mailcache/thread_utils.hpp"

#include <errno.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

IPCServer::IPCServer(Daemon * daemon, std::string socketPath) :
    daemon(daemon), socketPath(socketPath), listenFd(-1), running(false), logger(spdlog::get("logger"))
{
}

IPCServer::~IPCServer() {
    stop();
}

void IPCServer::start() {
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socketPath.size() >= sizeof(addr.sun_path)) {
        throw SyncException("socket-path-too-long", "Socket path is too long: " + socketPath, false);
    }
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    // a daemon that crashed leaves its socket file behind
    unlink(socketPath.c_str());

    listenFd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (listenFd < 0) {
        throw SyncException("socket-failed", std::string("socket: ") + strerror(errno), false);
    }

    mode_t prevMask = umask(0077);
    int bound = bind(listenFd, (struct sockaddr *)&addr, sizeof(addr));
    umask(prevMask);
    if (bound != 0 || chmod(socketPath.c_str(), 0600) != 0 || listen(listenFd, 16) != 0) {
        std::string err = strerror(errno);
        ::close(listenFd);
        listenFd = -1;
        throw SyncException("socket-failed", "Could not listen on " + socketPath + ": " + err, false);
    }

    running = true;
    acceptThread = std::thread([this]() {
        SetThreadName("ipc");
        acceptLoop();
    });
    logger->info("Listening on {}", socketPath);
}

void IPCServer::stop() {
    if (!running.exchange(false)) {
        return;
    }

    // shutdown() wakes the thread blocked in accept()
    shutdown(listenFd, SHUT_RDWR);
    if (acceptThread.joinable()) {
        acceptThread.join();
    }
    ::close(listenFd);
    listenFd = -1;
    unlink(socketPath.c_str());

    std::list<std::shared_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lck(connectionsMtx);
        remaining.swap(connections);
    }
    for (auto & conn : remaining) {
        std::lock_guard<std::mutex> lck(conn->writeMtx);
        if (!conn->done) {
            shutdown(conn->fd, SHUT_RDWR);
        }
    }
    for (auto & conn : remaining) {
        if (conn->thread.joinable()) {
            conn->thread.join();
        }
    }
    logger->info("IPC server stopped");
}

void IPCServer::pruneFinishedConnections() {
    std::lock_guard<std::mutex> lck(connectionsMtx);
    for (auto it = connections.begin(); it != connections.end();) {
        if ((*it)->done) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = connections.erase(it);
        } else {
            it ++;
        }
    }
}

void IPCServer::acceptLoop() {
    while (running) {
        int fd = accept(listenFd, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (running) {
                logger->error("accept failed: {}", strerror(errno));
            }
            return;
        }

        pruneFinishedConnections();

        auto conn = std::make_shared<Connection>();
        conn->fd = fd;
        conn->done = false;
        std::lock_guard<std::mutex> lck(connectionsMtx);
        connections.push_back(conn);
        conn->thread = std::thread([this, conn]() {
            SetThreadName("ipc-conn");
            serveConnection(conn);
        });
    }
}

bool IPCServer::writeLine(std::shared_ptr<Connection> conn, std::string line) {
    std::lock_guard<std::mutex> lck(conn->writeMtx);
    return writeLineLocked(conn, line);
}

bool IPCServer::writeLineLocked(std::shared_ptr<Connection> conn, std::string line) {
    line += "\n";
    if (conn->done) {
        return false;
    }
    size_t sent = 0;
    while (sent < line.size()) {
        ssize_t n = send(conn->fd, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += (size_t)n;
    }
    return true;
}

void IPCServer::serveConnection(std::shared_ptr<Connection> conn) {
    int listenerId = 0;
    std::string buffer;
    char chunk[4096];

    try {
        MailStore store(daemon->getConfig().databasePath());
        IPCHandler handler(daemon, &store);

        while (true) {
            size_t newline = buffer.find('\n');
            if (newline == std::string::npos) {
                if (buffer.size() > IPC_MAX_LINE_BYTES) {
                    logger->warn("Closing IPC connection after {} bytes without a line break", buffer.size());
                    writeLine(conn, nlohmann::json({{"type", "error"}, {"error", "request line too long"}}).dump());
                    break;
                }
                ssize_t n = recv(conn->fd, chunk, sizeof(chunk), 0);
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    break;
                }
                buffer.append(chunk, (size_t)n);
                continue;
            }

            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (line.empty() || line == "\r") {
                continue;
            }

            nlohmann::json request = nlohmann::json::parse(line, nullptr, false);
            nlohmann::json response;
            if (request.is_discarded()) {
                response = {{"type", "error"}, {"error", "malformed request: not JSON"}};
            } else {
                response = handler.handle(request);
            }

            bool subscribing = request.is_object() && request.count("type") && request["type"] == "subscribe" && listenerId == 0;
            if (!subscribing) {
                if (!writeLine(conn, response.dump())) {
                    break;
                }
                continue;
            }

            // Holding the write lock keeps any event emitted meanwhile
            // behind the subscribe response.
            std::unique_lock<std::mutex> lck(conn->writeMtx);
            std::weak_ptr<Connection> weak = conn;
            listenerId = daemon->addListener([this, weak](const nlohmann::json & event) {
                auto target = weak.lock();
                if (target) {
                    writeLine(target, event.dump());
                }
            });
            if (!writeLineLocked(conn, response.dump())) {
                break;
            }
        }
    } catch (SQLite::Exception & ex) {
        logger->error("IPC connection closed after a database error: {}", ex.what());
    } catch (std::exception & ex) {
        logger->error("IPC connection closed after an unexpected error: {}", ex.what());
    }

    if (listenerId != 0) {
        daemon->removeListener(listenerId);
    }

    // the fd number can be reused as soon as it is closed, so writers must
    // see `done` before that happens
    std::lock_guard<std::mutex> lck(conn->writeMtx);
    conn->done = true;
    ::close(conn->fd);
}
