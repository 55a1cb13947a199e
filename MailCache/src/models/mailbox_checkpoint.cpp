#include "mailcache/models/mailbox_checkpoint.hpp"

std::string MailboxCheckpoint::TABLE_NAME = "MailboxCheckpoint";

MailboxCheckpoint::MailboxCheckpoint(std::string accountId, std::string mailbox, uint32_t generationId, time_t lastSyncTime) :
    MailModel(accountId)
{
    _data["mailbox"] = mailbox;
    _data["generationId"] = generationId;
    _data["lastSyncTime"] = lastSyncTime;
}

MailboxCheckpoint::MailboxCheckpoint(nlohmann::json json) : MailModel(json) {

}

MailboxCheckpoint::MailboxCheckpoint(SQLite::Statement & query) :
    MailModel(query)
{
}

std::string MailboxCheckpoint::mailbox() {
    return _data["mailbox"].get<std::string>();
}

uint32_t MailboxCheckpoint::generationId() {
    return _data["generationId"].get<uint32_t>();
}

void MailboxCheckpoint::setGenerationId(uint32_t g) {
    _data["generationId"] = g;
}

time_t MailboxCheckpoint::lastSyncTime() {
    return _data["lastSyncTime"].get<time_t>();
}

void MailboxCheckpoint::setLastSyncTime(time_t t) {
    _data["lastSyncTime"] = t;
}

std::string MailboxCheckpoint::tableName() {
    return MailboxCheckpoint::TABLE_NAME;
}

std::vector<std::string> MailboxCheckpoint::columnsForQuery() {
    return std::vector<std::string>{"accountId", "mailbox", "data", "generationId", "lastSyncTime"};
}

std::vector<std::string> MailboxCheckpoint::keyColumns() {
    return std::vector<std::string>{"accountId", "mailbox"};
}

void MailboxCheckpoint::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":mailbox", mailbox());
    query->bind(":generationId", generationId());
    query->bind(":lastSyncTime", (int64_t)lastSyncTime());
}
