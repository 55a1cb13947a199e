#include "mailcache/ipc_handler.hpp"
#include "mailcache/constants.hpp"
#include "mailcache/mutation_queue.hpp"
#include "mailcache/reconciler.hpp"
#include "mailcache/sync_exception.hpp"
#include "mailcache/sync_lock_manager.hpp"

#include <stdint.h>

static std::string requireString(const nlohmann::json & request, const char * key) {
    if (!request.count(key) || !request[key].is_string()) {
        throw SyncException("invalid-request", std::string("Missing string field: ") + key, false);
    }
    return request[key].get<std::string>();
}

static uint32_t requireUID(const nlohmann::json & request) {
    if (!request.count("uid") || !request["uid"].is_number_integer()) {
        throw SyncException("invalid-request", "Missing numeric field: uid", false);
    }
    // IMAP UIDs are non-zero 32-bit values
    if (request["uid"].is_number_unsigned()) {
        uint64_t uid = request["uid"].get<uint64_t>();
        if (uid == 0 || uid > UINT32_MAX) {
            throw SyncException("invalid-request", "uid out of range: " + std::to_string(uid), false);
        }
        return (uint32_t)uid;
    }
    int64_t uid = request["uid"].get<int64_t>();
    if (uid <= 0 || uid > (int64_t)UINT32_MAX) {
        throw SyncException("invalid-request", "uid out of range: " + std::to_string(uid), false);
    }
    return (uint32_t)uid;
}

static int intOrDefault(const nlohmann::json & request, const char * key, int fallback) {
    if (request.count(key) && request[key].is_number_integer()) {
        return request[key].get<int>();
    }
    return fallback;
}

static nlohmann::json errorResponse(std::string message) {
    return {{"type", "error"}, {"error", message}};
}

IPCHandler::IPCHandler(Daemon * daemon, MailStore * store) :
    daemon(daemon), store(store), logger(spdlog::get("logger"))
{
}

nlohmann::json IPCHandler::handle(const nlohmann::json & request) {
    nlohmann::json response;
    std::string type = "";

    try {
        if (!request.is_object()) {
            throw SyncException("invalid-request", "Request must be a JSON object", false);
        }
        type = requireString(request, "type");

        if (type == "hello") {
            std::string clientVersion = request.count("version") && request["version"].is_string() ? request["version"].get<std::string>() : "";
            if (clientVersion != "" && clientVersion != MAILCACHE_VERSION) {
                logger->warn("Client version {} differs from daemon version {}", clientVersion, MAILCACHE_VERSION);
            }
            response = {{"type", "hello"}, {"version", MAILCACHE_VERSION}};
        } else if (type == "ping") {
            response = {{"type", "pong"}};
        } else if (type == "get_accounts") {
            response = getAccounts();
        } else if (type == "get_messages") {
            response = getMessages(request);
        } else if (type == "get_message_body") {
            response = getMessageBody(request);
        } else if (type == "request_sync") {
            response = requestSync(request);
        } else if (type == "submit_mutation") {
            response = submitMutation(request);
        } else if (type == "get_status") {
            response = getStatus(request);
        } else if (type == "subscribe") {
            response = {{"type", "ok"}};
        } else if (type == "shutdown") {
            logger->info("Shutdown requested by client");
            daemon->requestStop();
            response = {{"type", "ok"}};
        } else {
            response = errorResponse("Unknown request type: " + type);
        }

    } catch (SyncException & ex) {
        response = errorResponse(ex.key + ": " + ex.debuginfo);
    } catch (SQLite::Exception & ex) {
        logger->error("IPC {} failed with a database error: {}", type, ex.what());
        response = errorResponse(std::string("database: ") + ex.what());
    } catch (nlohmann::json::exception & ex) {
        response = errorResponse(std::string("malformed request: ") + ex.what());
    } catch (std::exception & ex) {
        logger->error("IPC {} failed unexpectedly: {}", type, ex.what());
        response = errorResponse(std::string("internal: ") + ex.what());
    }

    if (request.is_object() && request.count("id")) {
        response["id"] = request["id"];
    }
    return response;
}

nlohmann::json IPCHandler::getAccounts() {
    SyncLockManager locks(store, daemon->getInspector());
    nlohmann::json accounts = nlohmann::json::array();
    for (auto & account : daemon->getAccounts()) {
        std::string aid = account->id();
        accounts.push_back({
            {"id", aid},
            {"email", account->emailAddress()},
            {"mailboxes", account->mailboxes()},
            {"syncing", locks.isLocked(aid)},
            {"last_sync_time", store->lastSyncTime(aid)},
            {"cached_count", store->messageCount(aid)},
        });
    }
    return {{"type", "accounts"}, {"accounts", accounts}};
}

nlohmann::json IPCHandler::getMessages(const nlohmann::json & request) {
    std::string aid = requireString(request, "account");
    std::string mailbox = request.count("mailbox") ? requireString(request, "mailbox") : "INBOX";
    int limit = intOrDefault(request, "limit", 50);
    int offset = intOrDefault(request, "offset", 0);

    nlohmann::json messages = nlohmann::json::array();
    for (auto & msg : store->findMessages(aid, mailbox, limit, offset)) {
        messages.push_back(msg->toJSON());
    }
    return {{"type", "messages"}, {"messages", messages}};
}

nlohmann::json IPCHandler::getMessageBody(const nlohmann::json & request) {
    std::string aid = requireString(request, "account");
    std::string mailbox = requireString(request, "mailbox");
    uint32_t uid = requireUID(request);
    nlohmann::json vanished = {{"type", "vanished"}, {"key", "vanished"}, {"account", aid}, {"mailbox", mailbox}, {"uid", uid}};

    auto message = store->findMessage(aid, mailbox, uid);
    if (message == nullptr) {
        return vanished;
    }
    if (message->hasBody()) {
        return {{"type", "message"}, {"message", message->toJSONWithBody()}};
    }

    auto account = daemon->findAccount(aid);
    if (account == nullptr) {
        throw SyncException("unknown-account", "No account with id " + aid, false);
    }

    try {
        Reconciler reconciler(store, daemon->sessionForAccount(account), account, daemon->getConfig().reconcilerOptions());
        message = reconciler.fetchBodyNow(mailbox, uid);
    } catch (RemoteVanishedException & ex) {
        logger->info("Message {} / {} UID {} vanished while being opened", aid, mailbox, uid);
        daemon->emit({{"type", "message_vanished"}, {"account", aid}, {"mailbox", mailbox}, {"uid", uid}});
        return vanished;
    }

    if (message == nullptr) {
        return vanished;
    }
    return {{"type", "message"}, {"message", message->toJSONWithBody()}};
}

nlohmann::json IPCHandler::requestSync(const nlohmann::json & request) {
    std::string result = daemon->requestSync(requireString(request, "account"));
    return {{"type", "sync"}, {"result", result}};
}

nlohmann::json IPCHandler::submitMutation(const nlohmann::json & request) {
    std::string aid = requireString(request, "account");
    std::string mailbox = requireString(request, "mailbox");
    uint32_t uid = requireUID(request);
    std::string kind = requireString(request, "kind");

    // nothing would ever drain a queue for an account the daemon does not run
    if (daemon->findAccount(aid) == nullptr) {
        throw SyncException("unknown-account", "No account with id " + aid, false);
    }

    MutationQueue queue(store);
    int64_t id = queue.enqueue(aid, mailbox, uid, kind);
    return {{"type", "mutation"}, {"result", "accepted"}, {"mutation_id", id}};
}

nlohmann::json IPCHandler::getStatus(const nlohmann::json & request) {
    std::string aid = requireString(request, "account");
    return {
        {"type", "status"},
        {"status", {
            {"last_sync_time", store->lastSyncTime(aid)},
            {"pending_mutation_count", store->pendingMutationCount(aid)},
        }},
    };
}
