#include "mailcache/query.hpp"
#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"
#include "mailcache/sync_exception.hpp"


Query::Query() noexcept : _clauses(nlohmann::json::object()), _orderBy(""), _limit(0), _offset(0) {
}

Query & Query::equal(std::string col, std::string val) {
    _clauses[col] = {{"op","="}, {"rhs", val}};
    return *this;
}

Query & Query::equal(std::string col, double val) {
    _clauses[col] = {{"op","="}, {"rhs", val}};
    return *this;
}

Query & Query::orderBy(std::string order) {
    _orderBy = order;
    return *this;
}

Query & Query::limit(int l) {
    _limit = l;
    return *this;
}

Query & Query::offset(int o) {
    _offset = o;
    return *this;
}

std::string Query::getSQL() {
    std::string result = "";

    if (_clauses.size() > 0) {
        result += " WHERE ";

        for (nlohmann::json::iterator it = _clauses.begin(); it != _clauses.end(); ++it) {
            if (it != _clauses.begin()) {
                result += " AND ";
            }
            result += it.key() + " " + it.value()["op"].get<std::string>() + " ?";
        }
    }
    return result;
}

// ORDER BY / LIMIT / OFFSET, appended after getSQL().
std::string Query::getSuffixSQL() {
    std::string result = "";
    if (_orderBy != "") {
        result += " ORDER BY " + _orderBy;
    }
    if (_limit != 0) {
        result += " LIMIT " + std::to_string(_limit);
        if (_offset != 0) {
            result += " OFFSET " + std::to_string(_offset);
        }
    }
    return result;
}

void Query::bind(SQLite::Statement & query) {
    int ii = 1;
    for (nlohmann::json::iterator it = _clauses.begin(); it != _clauses.end(); ++it) {
        nlohmann::json & rhs = it.value()["rhs"];
        if (rhs.is_number_integer()) {
            query.bind(ii++, rhs.get<int64_t>());
        } else if (rhs.is_number()) {
            query.bind(ii++, rhs.get<double>());
        } else if (rhs.is_string()) {
            query.bind(ii++, rhs.get<std::string>());
        } else {
            throw SyncException("query-builder", "Unsure of how to bind json to sqlite", false);
        }
    }
}
