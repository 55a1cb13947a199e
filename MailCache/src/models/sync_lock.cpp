#include "mailcache/models/sync_lock.hpp"

std::string SyncLock::TABLE_NAME = "SyncLock";

SyncLock::SyncLock(std::string accountId, int pid, int64_t startFingerprint, time_t acquiredAt) :
    MailModel(accountId)
{
    _data["pid"] = pid;
    _data["startFingerprint"] = startFingerprint;
    _data["acquiredAt"] = acquiredAt;
}

SyncLock::SyncLock(nlohmann::json json) : MailModel(json) {

}

SyncLock::SyncLock(SQLite::Statement & query) :
    MailModel(query)
{
}

int SyncLock::pid() {
    return _data["pid"].get<int>();
}

int64_t SyncLock::startFingerprint() {
    return _data["startFingerprint"].get<int64_t>();
}

time_t SyncLock::acquiredAt() {
    return _data["acquiredAt"].get<time_t>();
}

std::string SyncLock::tableName() {
    return SyncLock::TABLE_NAME;
}

std::vector<std::string> SyncLock::columnsForQuery() {
    return std::vector<std::string>{"accountId", "data", "pid", "startFingerprint", "acquiredAt"};
}

std::vector<std::string> SyncLock::keyColumns() {
    return std::vector<std::string>{"accountId"};
}

void SyncLock::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":pid", pid());
    query->bind(":startFingerprint", startFingerprint());
    query->bind(":acquiredAt", (int64_t)acquiredAt());
}
