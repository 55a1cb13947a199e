#include "mailcache/sync_exception.hpp"
#include "mailcache/constants.hpp"

SyncException::SyncException(std::string key, std::string di, bool retryable) :
    GenericException(), retryable(retryable), key(key), debuginfo(di)
{

}

SyncException::SyncException(mailcore::ErrorCode c, std::string di) :
    GenericException(), key(""), debuginfo(di)
{
    if (ErrorCodeToTypeMap.count(c)) {
        key = ErrorCodeToTypeMap[c];
    } else {
        key = "ErrorCode" + std::to_string((int)c);
    }
    if (c == mailcore::ErrorConnection) {
        retryable = true;
        offline = true;
    }
    if (c == mailcore::ErrorParse) {
        // Parse errors are usually an abrupt connection termination.
        retryable = true;
    }
    if (c == mailcore::ErrorFetch) {
        retryable = true;
    }
}

bool SyncException::isRetryable() {
    return retryable;
}

bool SyncException::isOffline() {
    return offline;
}

const char * SyncException::what() const noexcept {
    return key.c_str();
}

nlohmann::json SyncException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}

RemoteVanishedException::RemoteVanishedException(std::string accountId, std::string mailbox, uint32_t uid) :
    SyncException("vanished", "message " + std::to_string(uid) + " in " + mailbox + " no longer exists remotely", false),
    accountId(accountId), mailbox(mailbox), uid(uid)
{
}

nlohmann::json RemoteVanishedException::toJSON() {
    nlohmann::json j = SyncException::toJSON();
    j["account"] = accountId;
    j["mailbox"] = mailbox;
    j["uid"] = uid;
    return j;
}
