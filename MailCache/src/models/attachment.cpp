#include "mailcache/models/attachment.hpp"

std::string Attachment::TABLE_NAME = "Attachment";

Attachment::Attachment(std::string accountId, std::string mailbox, uint32_t uid, std::string partId) :
    MailModel(accountId)
{
    _data["mailbox"] = mailbox;
    _data["uid"] = uid;
    _data["partId"] = partId;
    _data["filename"] = "";
    _data["contentType"] = "application/octet-stream";
    _data["size"] = 0;
    _data["encoding"] = "";
}

Attachment::Attachment(nlohmann::json json) : MailModel(json) {

}

Attachment::Attachment(SQLite::Statement & query) :
    MailModel(query)
{
}

std::string Attachment::mailbox() {
    return _data["mailbox"].get<std::string>();
}

uint32_t Attachment::remoteUID() {
    return _data["uid"].get<uint32_t>();
}

std::string Attachment::partId() {
    return _data["partId"].get<std::string>();
}

std::string Attachment::filename() {
    return _data["filename"].get<std::string>();
}

void Attachment::setFilename(std::string s) {
    _data["filename"] = s;
}

std::string Attachment::contentType() {
    return _data["contentType"].get<std::string>();
}

void Attachment::setContentType(std::string s) {
    _data["contentType"] = s;
}

uint64_t Attachment::size() {
    return _data["size"].get<uint64_t>();
}

void Attachment::setSize(uint64_t s) {
    _data["size"] = s;
}

std::string Attachment::encoding() {
    return _data["encoding"].get<std::string>();
}

void Attachment::setEncoding(std::string s) {
    _data["encoding"] = s;
}

std::string Attachment::tableName() {
    return Attachment::TABLE_NAME;
}

std::vector<std::string> Attachment::columnsForQuery() {
    return std::vector<std::string>{"accountId", "mailbox", "remoteUID", "partId", "data"};
}

std::vector<std::string> Attachment::keyColumns() {
    return std::vector<std::string>{"accountId", "mailbox", "remoteUID", "partId"};
}

void Attachment::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":mailbox", mailbox());
    query->bind(":remoteUID", remoteUID());
    query->bind(":partId", partId());
}
