#include "mailcache/models/pending_mutation.hpp"
#include "mailcache/constants.hpp"

#include <time.h>

std::string PendingMutation::TABLE_NAME = "PendingMutation";

bool PendingMutation::isValidKind(std::string kind) {
    return kind == MUTATION_KIND_DELETE || kind == MUTATION_KIND_MOVE_TRASH || kind == MUTATION_KIND_MARK_READ;
}

PendingMutation::PendingMutation(std::string accountId, std::string mailbox, uint32_t uid, std::string kind) :
    MailModel(accountId)
{
    _data["id"] = 0;
    _data["mailbox"] = mailbox;
    _data["uid"] = uid;
    _data["kind"] = kind;
    _data["createdAt"] = time(0);
    _data["retries"] = 0;
    _data["lastError"] = "";
}

PendingMutation::PendingMutation(nlohmann::json json) : MailModel(json) {

}

PendingMutation::PendingMutation(SQLite::Statement & query) :
    MailModel(query)
{
    // the id is assigned by sqlite after the JSON was written
    _data["id"] = query.getColumn("id").getInt64();
}

int64_t PendingMutation::id() {
    return _data["id"].get<int64_t>();
}

void PendingMutation::setId(int64_t id) {
    _data["id"] = id;
}

std::string PendingMutation::mailbox() {
    return _data["mailbox"].get<std::string>();
}

uint32_t PendingMutation::remoteUID() {
    return _data["uid"].get<uint32_t>();
}

std::string PendingMutation::kind() {
    return _data["kind"].get<std::string>();
}

time_t PendingMutation::createdAt() {
    return _data["createdAt"].get<time_t>();
}

int PendingMutation::retries() {
    return _data["retries"].get<int>();
}

void PendingMutation::incrementRetries() {
    _data["retries"] = retries() + 1;
}

std::string PendingMutation::lastError() {
    return _data["lastError"].get<std::string>();
}

void PendingMutation::setLastError(std::string e) {
    _data["lastError"] = e;
}

std::string PendingMutation::tableName() {
    return PendingMutation::TABLE_NAME;
}

std::vector<std::string> PendingMutation::columnsForQuery() {
    return std::vector<std::string>{"id", "accountId", "mailbox", "remoteUID", "kind", "data", "createdAt", "retries", "lastError"};
}

std::vector<std::string> PendingMutation::keyColumns() {
    return std::vector<std::string>{"id"};
}

void PendingMutation::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    if (id() == 0) {
        query->bind(":id"); // null, assigned on insert
    } else {
        query->bind(":id", id());
    }
    query->bind(":mailbox", mailbox());
    query->bind(":remoteUID", remoteUID());
    query->bind(":kind", kind());
    query->bind(":createdAt", (int64_t)createdAt());
    query->bind(":retries", retries());
    query->bind(":lastError", lastError());
}
