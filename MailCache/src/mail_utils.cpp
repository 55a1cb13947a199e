#include "mailcache/mail_utils.hpp"
#include "mailcache/models/account.hpp"
#include "mailcache/constants.hpp"

#include <stdlib.h>

using namespace mailcore;

std::string MailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string MailUtils::configDirPath() {
    return getEnvUTF8("CONFIG_DIR_PATH");
}

nlohmann::json MailUtils::contactJSONFromAddress(Address * addr) {
    nlohmann::json contact;
    // note: for some reason, using ternarys here doesn't work.
    if (addr->displayName()) {
        contact["name"] = addr->displayName()->UTF8Characters();
    } else {
        contact["name"] = nullptr;
    }
    if (addr->mailbox()) {
        contact["email"] = addr->mailbox()->UTF8Characters();
    } else {
        contact["email"] = nullptr;
    }
    return contact;
}

nlohmann::json MailUtils::contactsJSONFromAddresses(Array * addrs) {
    nlohmann::json result = nlohmann::json::array();
    if (addrs == nullptr) {
        return result;
    }
    for (unsigned int ii = 0; ii < addrs->count(); ii ++) {
        result.push_back(contactJSONFromAddress((Address *)addrs->objectAtIndex(ii)));
    }
    return result;
}

std::string MailUtils::snippetFromText(std::string text) {
    std::string snippet = "";
    snippet.reserve(text.size());
    for (char c : text) {
        if (c == '\r') {
            continue;
        }
        snippet.push_back(c == '\n' ? ' ' : c);
    }
    if (snippet.size() > SNIPPET_MAX_LENGTH) {
        // back up so a multi-byte UTF-8 sequence is not split
        size_t len = SNIPPET_MAX_LENGTH;
        while (len > 0 && (snippet[len] & 0xC0) == 0x80) {
            len --;
        }
        snippet = snippet.substr(0, len) + "...";
    }
    return snippet;
}

IndexSet * MailUtils::indexSetFromUIDs(const std::vector<uint32_t> & uids) {
    IndexSet * set = IndexSet::indexSet();
    for (uint32_t uid : uids) {
        set->addIndex(uid);
    }
    return set;
}

std::string MailUtils::qmarks(size_t count) {
    if (count == 0) {
        return "";
    }
    std::string qmarks{"?"};
    for (size_t i = 1; i < count; i ++) {
        qmarks = qmarks + ",?";
    }
    return qmarks;
}

void MailUtils::configureSessionForAccount(IMAPSession & session, std::shared_ptr<Account> account) {
    session.setHostname(AS_MCSTR(account->IMAPHost()));
    session.setPort(account->IMAPPort());
    session.setUsername(AS_MCSTR(account->IMAPUsername()));
    session.setPassword(AS_MCSTR(account->IMAPPassword()));

    std::string security = account->IMAPSecurity();
    if (security == "SSL / TLS") {
        session.setConnectionType(ConnectionType::ConnectionTypeTLS);
    } else if (security == "STARTTLS") {
        session.setConnectionType(ConnectionType::ConnectionTypeStartTLS);
    } else {
        session.setConnectionType(ConnectionType::ConnectionTypeClear);
    }
    session.setCheckCertificateEnabled(!account->IMAPAllowInsecureSSL());
    session.setTimeout(60);
}
