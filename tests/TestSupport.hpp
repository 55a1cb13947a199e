#ifndef TestSupport_hpp
#define TestSupport_hpp

#include <stdlib.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailcache/models/account.hpp"
#include "mailcache/models/message.hpp"

// Each test process gets its own config directory so ctest can run them in parallel.
inline std::string makeScratchDir() {
    std::string dir = "/tmp/mailcache_test_" + std::to_string(getpid());
    system(("rm -rf " + dir + " && mkdir -p " + dir).c_str());
    setenv("CONFIG_DIR_PATH", dir.c_str(), 1);
    return dir;
}

inline void removeScratchDir(std::string dir) {
    system(("rm -rf " + dir).c_str());
}

inline nlohmann::json accountJSON(std::string id, std::vector<std::string> mailboxes = {"INBOX"}) {
    return {
        {"id", id},
        {"provider", "imap"},
        {"emailAddress", id + "@example.com"},
        {"mailboxes", mailboxes},
        {"settings", {
            {"imap_host", "imap.example.com"},
            {"imap_port", 993},
            {"imap_username", id + "@example.com"},
            {"imap_password", "password"},
            {"imap_security", "SSL / TLS"},
            {"imap_allow_insecure_ssl", false},
        }},
    };
}

inline std::shared_ptr<Account> makeAccount(std::string id, std::vector<std::string> mailboxes = {"INBOX"}) {
    return std::make_shared<Account>(accountJSON(id, mailboxes));
}

inline std::shared_ptr<Message> makeMessage(std::string aid, std::string mailbox, uint32_t uid, time_t receivedAt) {
    auto msg = std::make_shared<Message>(aid, mailbox, uid);
    msg->setReceivedAt(receivedAt);
    msg->setDate(receivedAt);
    msg->setSubject("Message " + std::to_string(uid));
    msg->setHeaderMessageId("<" + std::to_string(uid) + "@example.com>");
    msg->setUnread(true);
    return msg;
}

static const time_t ONE_DAY = 24 * 60 * 60;

#endif /* TestSupport_hpp */
