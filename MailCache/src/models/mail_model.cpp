#include "mailcache/models/mail_model.hpp"
#include "mailcache/sync_exception.hpp"

std::string MailModel::TABLE_NAME = "MailModel";

MailModel::MailModel(std::string accountId) :
    _data({{"aid", accountId}})
{
}

MailModel::MailModel(SQLite::Statement & query) :
    _data(nlohmann::json::parse(query.getColumn("data").getString()))
{
}

MailModel::MailModel(nlohmann::json json) :
    _data(json)
{
    if (!_data.is_object()) {
        throw SyncException("invalid-model", "Model JSON must be an object: " + json.dump(), false);
    }
}

std::string MailModel::accountId()
{
    return _data["aid"].get<std::string>();
}

std::string MailModel::tableName()
{
    return TABLE_NAME;
}

nlohmann::json MailModel::toJSON()
{
    return _data;
}

void MailModel::bindToQuery(SQLite::Statement * query) {
    query->bind(":data", this->toJSON().dump());
    query->bind(":accountId", accountId());
}
