#include "mailcache/ipc_client.hpp"
#include "mailcache/sync_exception.hpp"

#include <errno.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

IPCClient::IPCClient(std::string socketPath) :
    socketPath(socketPath), fd(-1), buffer("")
{
}

IPCClient::~IPCClient() {
    close();
}

void IPCClient::connect() {
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        throw SyncException("ipc-unavailable", std::string("socket: ") + strerror(errno), true);
    }
    if (::connect(fd, (struct sockaddr *)&addr, sizeof(addr)) != 0) {
        std::string err = strerror(errno);
        close();
        throw SyncException("ipc-unavailable", "Could not connect to " + socketPath + ": " + err, true);
    }
}

void IPCClient::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
    buffer = "";
}

nlohmann::json IPCClient::request(nlohmann::json request) {
    if (fd < 0) {
        connect();
    }
    std::string line = request.dump() + "\n";
    size_t sent = 0;
    while (sent < line.size()) {
        ssize_t n = send(fd, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            throw SyncException("ipc-unavailable", "The daemon closed the connection", true);
        }
        sent += (size_t)n;
    }
    return readMessage();
}

nlohmann::json IPCClient::readMessage() {
    char chunk[4096];
    size_t newline = buffer.find('\n');
    while (newline == std::string::npos) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            throw SyncException("ipc-unavailable", "The daemon closed the connection", true);
        }
        buffer.append(chunk, (size_t)n);
        newline = buffer.find('\n');
    }
    std::string line = buffer.substr(0, newline);
    buffer.erase(0, newline + 1);
    return nlohmann::json::parse(line);
}
