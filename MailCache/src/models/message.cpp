#include "mailcache/models/message.hpp"

std::string Message::TABLE_NAME = "Message";

Message::Message(std::string accountId, std::string mailbox, uint32_t uid) :
    MailModel(accountId), _hasBody(false), _body("")
{
    _data["mailbox"] = mailbox;
    _data["uid"] = uid;
    _data["hMsgId"] = "";
    _data["receivedAt"] = 0;
    _data["date"] = 0;
    _data["from"] = nlohmann::json::array();
    _data["to"] = nlohmann::json::array();
    _data["replyTo"] = nlohmann::json::array();
    _data["subject"] = "";
    _data["snippet"] = "";
    _data["unread"] = true;
    _data["references"] = nlohmann::json::array();
    _data["attachments"] = nlohmann::json::array();
}

Message::Message(nlohmann::json json) :
    MailModel(json), _hasBody(false), _body("")
{
    if (_data.count("body") && _data["body"].is_string()) {
        setBody(_data["body"].get<std::string>());
    }
    _data.erase("body");
}

Message::Message(SQLite::Statement & query) :
    MailModel(query), _hasBody(false), _body("")
{
    // the unread column is updated in place by flag refreshes, so it
    // wins over the value captured in the JSON blob.
    for (int ii = 0; ii < query.getColumnCount(); ii ++) {
        std::string col = query.getColumnName(ii);
        if (col == "unread") {
            _data["unread"] = query.getColumn(ii).getInt() != 0;
        } else if (col == "body" && !query.getColumn(ii).isNull()) {
            _hasBody = true;
            _body = query.getColumn(ii).getString();
        }
    }
}

std::string Message::mailbox() {
    return _data["mailbox"].get<std::string>();
}

uint32_t Message::remoteUID() {
    return _data["uid"].get<uint32_t>();
}

std::string Message::headerMessageId() {
    return _data["hMsgId"].get<std::string>();
}

void Message::setHeaderMessageId(std::string id) {
    _data["hMsgId"] = id;
}

time_t Message::receivedAt() {
    return _data["receivedAt"].get<time_t>();
}

void Message::setReceivedAt(time_t t) {
    _data["receivedAt"] = t;
}

time_t Message::date() {
    return _data["date"].get<time_t>();
}

void Message::setDate(time_t t) {
    _data["date"] = t;
}

nlohmann::json Message::from() {
    return _data["from"];
}

void Message::setFrom(nlohmann::json from) {
    _data["from"] = from;
}

nlohmann::json Message::to() {
    return _data["to"];
}

void Message::setTo(nlohmann::json to) {
    _data["to"] = to;
}

nlohmann::json Message::replyTo() {
    return _data["replyTo"];
}

void Message::setReplyTo(nlohmann::json replyTo) {
    _data["replyTo"] = replyTo;
}

std::string Message::subject() {
    return _data["subject"].get<std::string>();
}

void Message::setSubject(std::string s) {
    _data["subject"] = s;
}

std::string Message::snippet() {
    return _data["snippet"].get<std::string>();
}

void Message::setSnippet(std::string s) {
    _data["snippet"] = s;
}

bool Message::isUnread() {
    return _data["unread"].get<bool>();
}

void Message::setUnread(bool u) {
    _data["unread"] = u;
}

std::vector<std::string> Message::references() {
    std::vector<std::string> refs{};
    for (const auto & r : _data["references"]) {
        refs.push_back(r.get<std::string>());
    }
    return refs;
}

void Message::setReferences(std::vector<std::string> refs) {
    _data["references"] = refs;
}

std::vector<Attachment> Message::attachments() {
    std::vector<Attachment> results{};
    for (const auto & a : _data["attachments"]) {
        results.push_back(Attachment(a));
    }
    return results;
}

void Message::setAttachments(std::vector<Attachment> & attachments) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto & a : attachments) {
        arr.push_back(a.toJSON());
    }
    _data["attachments"] = arr;
}

bool Message::hasBody() {
    return _hasBody;
}

std::string Message::body() {
    return _body;
}

void Message::setBody(std::string body) {
    _hasBody = true;
    _body = body;
}

std::string Message::tableName() {
    return Message::TABLE_NAME;
}

std::vector<std::string> Message::columnsForQuery() {
    return std::vector<std::string>{"accountId", "mailbox", "remoteUID", "data", "headerMessageId", "receivedAt", "unread"};
}

std::vector<std::string> Message::keyColumns() {
    return std::vector<std::string>{"accountId", "mailbox", "remoteUID"};
}

void Message::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":mailbox", mailbox());
    query->bind(":remoteUID", remoteUID());
    query->bind(":headerMessageId", headerMessageId());
    query->bind(":receivedAt", (int64_t)receivedAt());
    query->bind(":unread", isUnread() ? 1 : 0);
}

nlohmann::json Message::toJSONWithBody() {
    nlohmann::json j = toJSON();
    j["body"] = _hasBody ? nlohmann::json(_body) : nlohmann::json(nullptr);
    return j;
}
