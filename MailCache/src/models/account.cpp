#include "mailcache/models/account.hpp"
#include "mailcache/sync_exception.hpp"


std::string Account::TABLE_NAME = "Account";

Account::Account(nlohmann::json json) : MailModel(json) {
    if (!_data.count("aid") && _data.count("id")) {
        _data["aid"] = _data["id"];
    }
}

std::string Account::id() {
    return _data["id"].get<std::string>();
}

std::string Account::valid() {
    if (!_data.count("id") || !_data.count("settings")) {
        return "id or settings";
    }
    if (!_data.count("emailAddress")) {
        return "emailAddress";
    }

    nlohmann::json & s = _data["settings"];

    if (!s.count("imap_password")) {
        return "imap_password";
    }
    if (!(s.count("imap_port") && s.count("imap_host") && s.count("imap_username"))) {
        return "imap configuration";
    }
    if (!(s.count("imap_allow_insecure_ssl") && s["imap_allow_insecure_ssl"].is_boolean())) {
        return "imap_allow_insecure_ssl";
    }
    if (_data.count("mailboxes") && !_data["mailboxes"].is_array()) {
        return "mailboxes";
    }
    return ""; // true
}

std::string Account::provider() {
    return _data.count("provider") ? _data["provider"].get<std::string>() : "imap";
}

std::string Account::emailAddress() {
    return _data["emailAddress"].get<std::string>();
}

unsigned int Account::IMAPPort() {
    nlohmann::json & val = _data["settings"]["imap_port"];
    return val.is_string() ? std::stoi(val.get<std::string>()) : val.get<unsigned int>();
}

std::string Account::IMAPHost() {
    return _data["settings"]["imap_host"].get<std::string>();
}

std::string Account::IMAPUsername() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_username") ? s["imap_username"].get<std::string>() : "";
}

std::string Account::IMAPPassword() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_password") ? s["imap_password"].get<std::string>() : "";
}

std::string Account::IMAPSecurity() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_security") ? s["imap_security"].get<std::string>() : "SSL / TLS";
}

bool Account::IMAPAllowInsecureSSL() {
    return _data["settings"]["imap_allow_insecure_ssl"].get<bool>();
}

std::vector<std::string> Account::mailboxes() {
    std::vector<std::string> results{};
    if (_data.count("mailboxes")) {
        for (const auto & m : _data["mailboxes"]) {
            results.push_back(m.get<std::string>());
        }
    }
    if (results.empty()) {
        results.push_back("INBOX");
    }
    return results;
}

/* Account objects are not stored in the database. */

std::string Account::tableName() {
    throw SyncException("invalid-operation", "Account objects are not stored in the database", false);
}

std::vector<std::string> Account::columnsForQuery() {
    throw SyncException("invalid-operation", "Account objects are not stored in the database", false);
}

std::vector<std::string> Account::keyColumns() {
    throw SyncException("invalid-operation", "Account objects are not stored in the database", false);
}

// Credentials never leave the process.
nlohmann::json Account::toJSON() {
    nlohmann::json j = _data;
    j.erase("settings");
    j["mailboxes"] = mailboxes();
    return j;
}
