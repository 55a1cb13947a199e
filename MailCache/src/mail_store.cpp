#include "mailcache/mail_store.hpp"
#include "mailcache/mail_store_transaction.hpp"
#include "mailcache/mail_utils.hpp"
#include "mailcache/constants.hpp"
#include "mailcache/sync_exception.hpp"

#include <algorithm>
#include <time.h>
#include <unordered_set>

#include "spdlog/spdlog.h"


std::string MailStore::defaultPath() {
    std::string dir = MailUtils::configDirPath();
    if (dir == "") {
        throw SyncException("missing-config-dir", "CONFIG_DIR_PATH is not set", false);
    }
    return dir + FS_PATH_SEP + "mailcache.db";
}

MailStore::MailStore() :
    MailStore(MailStore::defaultPath())
{
}

MailStore::MailStore(std::string dbPath) :
    _db(dbPath, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
    _stmtBeginTransaction(_db, "BEGIN IMMEDIATE TRANSACTION"),
    _stmtRollbackTransaction(_db, "ROLLBACK"),
    _stmtCommitTransaction(_db, "COMMIT")
{
    _db.setBusyTimeout(10 * 1000);

    // Note: These are properties of the connection, so they must be set regardless
    // of whether the database setup queries are run.
    SQLite::Statement(_db, "PRAGMA journal_mode = WAL").executeStep();
    SQLite::Statement(_db, "PRAGMA main.synchronous = NORMAL").exec();
    SQLite::Statement(_db, "PRAGMA foreign_keys = ON").exec();
}

void MailStore::migrate() {
    SQLite::Statement uv(_db, "PRAGMA user_version");
    uv.executeStep();
    int version = uv.getColumn(0).getInt();

    if (version < 1) {
        for (std::string sql : SETUP_QUERIES) {
            SQLite::Statement(_db, sql).exec();
        }
    }
    if (version < 2) {
        for (std::string sql : V2_SETUP_QUERIES) {
            SQLite::Statement(_db, sql).exec();
        }
    }

    if (version != CURRENT_SCHEMA_VERSION) {
        spdlog::get("logger")->info("Migrated database from version {} to {}", version, CURRENT_SCHEMA_VERSION);
        SQLite::Statement(_db, "PRAGMA user_version = " + std::to_string(CURRENT_SCHEMA_VERSION)).exec();
    }
}

SQLite::Database & MailStore::db()
{
    return this->_db;
}

void MailStore::resetForAccount(std::string accountId) {
    std::vector<std::string> tables = {"Message", "MessageBody", "Attachment", "MailboxCheckpoint", "SyncLock", "PendingMutation", "MutationLog"};

    MailStoreTransaction transaction{this, "resetForAccount"};
    for (auto table : tables) {
        SQLite::Statement del(_db, "DELETE FROM " + table + " WHERE accountId = ?");
        del.bind(1, accountId);
        del.exec();
    }
    transaction.commit();
    spdlog::get("logger")->info("Reset all cached data for account {}", accountId);
}

void MailStore::beginTransaction() {
    _stmtBeginTransaction.exec();
    _stmtBeginTransaction.reset();
}

void MailStore::rollbackTransaction() {
    // cached statements may belong to the rolled back work
    _insertQueries = {};
    _updateQueries = {};
    _removeQueries = {};
    _stmtRollbackTransaction.exec();
    _stmtRollbackTransaction.reset();
}

void MailStore::commitTransaction() {
    _stmtCommitTransaction.exec();
    _stmtCommitTransaction.reset();
}

#pragma mark Generic

std::string MailStore::_keyWhereClause(MailModel * model) {
    std::string where{""};
    for (const auto col : model->keyColumns()) {
        where += (where == "" ? "" : " AND ") + col + " = :" + col;
    }
    return where;
}

void MailStore::insert(MailModel * model) {
    auto tableName = model->tableName();
    if (!_insertQueries.count(tableName)) {
        std::string cols{""};
        std::string values{""};
        for (const auto col : model->columnsForQuery()) {
            cols += col + ",";
            values += ":" + col + ",";
        }
        cols.pop_back();
        values.pop_back();
        _insertQueries[tableName] = std::make_shared<SQLite::Statement>(this->_db, "INSERT INTO " + tableName + " (" + cols + ") VALUES (" + values + ")");
    }

    auto query = _insertQueries[tableName];
    query->reset();
    model->bindToQuery(query.get());
    query->exec();
}

bool MailStore::insertOrIgnore(MailModel * model) {
    auto key = model->tableName() + "-ignore";
    if (!_insertQueries.count(key)) {
        std::string cols{""};
        std::string values{""};
        for (const auto col : model->columnsForQuery()) {
            cols += col + ",";
            values += ":" + col + ",";
        }
        cols.pop_back();
        values.pop_back();
        _insertQueries[key] = std::make_shared<SQLite::Statement>(this->_db, "INSERT OR IGNORE INTO " + model->tableName() + " (" + cols + ") VALUES (" + values + ")");
    }

    auto query = _insertQueries[key];
    query->reset();
    model->bindToQuery(query.get());
    return query->exec() > 0;
}

void MailStore::update(MailModel * model) {
    auto tableName = model->tableName();
    if (!_updateQueries.count(tableName)) {
        auto keys = model->keyColumns();
        std::string pairs{""};
        for (const auto col : model->columnsForQuery()) {
            if (std::find(keys.begin(), keys.end(), col) != keys.end()) {
                continue;
            }
            pairs += (col + " = :" + col + ",");
        }
        pairs.pop_back();
        _updateQueries[tableName] = std::make_shared<SQLite::Statement>(this->_db, "UPDATE " + tableName + " SET " + pairs + " WHERE " + _keyWhereClause(model));
    }

    auto query = _updateQueries[tableName];
    query->reset();
    model->bindToQuery(query.get());
    query->exec();
}

void MailStore::remove(MailModel * model) {
    auto tableName = model->tableName();
    if (!_removeQueries.count(tableName)) {
        _removeQueries[tableName] = std::make_shared<SQLite::Statement>(this->_db, "DELETE FROM " + tableName + " WHERE " + _keyWhereClause(model));
    }

    // bindToQuery binds every column, so the key names have to be bound
    // one by one here. Unused named parameters are an error in sqlite.
    auto query = _removeQueries[tableName];
    query->reset();
    SQLite::Statement * stmt = query.get();
    nlohmann::json & data = model->_data;
    for (const auto col : model->keyColumns()) {
        std::string param = ":" + col;
        if (col == "accountId") {
            stmt->bind(param, model->accountId());
        } else if (col == "remoteUID") {
            stmt->bind(param, data["uid"].get<uint32_t>());
        } else if (data[col].is_number_integer()) {
            stmt->bind(param, data[col].get<int64_t>());
        } else {
            stmt->bind(param, data[col].get<std::string>());
        }
    }
    query->exec();
}

#pragma mark Messages

bool MailStore::insertIfAbsent(Message * message) {
    bool inserted = insertOrIgnore(message);

    if (inserted) {
        for (auto & attachment : message->attachments()) {
            insertOrIgnore(&attachment);
        }
    }

    if (message->hasBody()) {
        SQLite::Statement body(_db, "INSERT OR IGNORE INTO MessageBody (accountId, mailbox, remoteUID, value, fetchedAt) VALUES (?, ?, ?, ?, ?)");
        body.bind(1, message->accountId());
        body.bind(2, message->mailbox());
        body.bind(3, message->remoteUID());
        body.bind(4, message->body());
        body.bind(5, (int64_t)time(0));
        body.exec();
    }

    return inserted;
}

std::set<uint32_t> MailStore::cachedUIDs(std::string accountId, std::string mailbox) {
    SQLite::Statement query(_db, "SELECT remoteUID FROM Message WHERE accountId = ? AND mailbox = ?");
    query.bind(1, accountId);
    query.bind(2, mailbox);

    std::set<uint32_t> results{};
    while (query.executeStep()) {
        results.insert((uint32_t)query.getColumn(0).getInt64());
    }
    return results;
}

UIDDiff MailStore::diffUIDs(std::string accountId, std::string mailbox, const std::vector<uint32_t> & remoteUIDs) {
    std::unordered_set<uint32_t> remote(remoteUIDs.begin(), remoteUIDs.end());
    std::unordered_set<uint32_t> local{};

    SQLite::Statement query(_db, "SELECT remoteUID FROM Message WHERE accountId = ? AND mailbox = ?");
    query.bind(1, accountId);
    query.bind(2, mailbox);

    UIDDiff diff{};
    while (query.executeStep()) {
        uint32_t uid = (uint32_t)query.getColumn(0).getInt64();
        local.insert(uid);
        if (!remote.count(uid)) {
            diff.stale.push_back(uid);
        }
    }
    for (uint32_t uid : remoteUIDs) {
        if (!local.count(uid)) {
            diff.missing.push_back(uid);
            local.insert(uid); // tolerate duplicates in the input
        }
    }
    return diff;
}

int MailStore::purgeMailbox(std::string accountId, std::string mailbox) {
    SQLite::Statement del(_db, "DELETE FROM Message WHERE accountId = ? AND mailbox = ?");
    del.bind(1, accountId);
    del.bind(2, mailbox);
    return del.exec();
}

int MailStore::_removeMessageUIDs(std::string accountId, std::string mailbox, std::vector<uint32_t> uids) {
    int removed = 0;
    for (auto chunk : MailUtils::chunksOfVector(uids, 900)) {
        SQLite::Statement del(_db, "DELETE FROM Message WHERE accountId = ? AND mailbox = ? AND remoteUID IN (" + MailUtils::qmarks(chunk.size()) + ")");
        del.bind(1, accountId);
        del.bind(2, mailbox);
        int ii = 3;
        for (uint32_t uid : chunk) {
            del.bind(ii++, uid);
        }
        removed += del.exec();
    }
    return removed;
}

int MailStore::removeMessages(std::string accountId, std::string mailbox, std::vector<uint32_t> uids) {
    return _removeMessageUIDs(accountId, mailbox, uids);
}

int MailStore::removeMessagesOlderThan(std::string accountId, std::string mailbox, time_t horizon, const std::set<uint32_t> & keep) {
    SQLite::Statement query(_db, "SELECT remoteUID FROM Message WHERE accountId = ? AND mailbox = ? AND receivedAt < ?");
    query.bind(1, accountId);
    query.bind(2, mailbox);
    query.bind(3, (int64_t)horizon);

    std::vector<uint32_t> expired{};
    while (query.executeStep()) {
        uint32_t uid = (uint32_t)query.getColumn(0).getInt64();
        if (!keep.count(uid)) {
            expired.push_back(uid);
        }
    }
    return _removeMessageUIDs(accountId, mailbox, expired);
}

bool MailStore::saveBody(std::string accountId, std::string mailbox, uint32_t uid, std::string body, std::string plainText) {
    auto message = find<Message>(Query().equal("accountId", accountId).equal("mailbox", mailbox).equal("remoteUID", uid));
    if (message == nullptr) {
        // removed while the body was in flight
        return false;
    }

    SQLite::Statement save(_db, "REPLACE INTO MessageBody (accountId, mailbox, remoteUID, value, fetchedAt) VALUES (?, ?, ?, ?, ?)");
    save.bind(1, accountId);
    save.bind(2, mailbox);
    save.bind(3, uid);
    save.bind(4, body);
    save.bind(5, (int64_t)time(0));
    save.exec();

    message->setSnippet(MailUtils::snippetFromText(plainText.empty() ? body : plainText));
    update(message.get());
    return true;
}

int MailStore::updateUnread(std::string accountId, std::string mailbox, const std::map<uint32_t, bool> & unreadByUID) {
    SQLite::Statement query(_db, "UPDATE Message SET unread = ? WHERE accountId = ? AND mailbox = ? AND remoteUID = ? AND unread != ?");
    int changed = 0;
    for (const auto & pair : unreadByUID) {
        query.reset();
        query.bind(1, pair.second ? 1 : 0);
        query.bind(2, accountId);
        query.bind(3, mailbox);
        query.bind(4, pair.first);
        query.bind(5, pair.second ? 1 : 0);
        changed += query.exec();
    }
    return changed;
}

std::vector<uint32_t> MailStore::uidsMissingBodies(std::string accountId, std::string mailbox, int limit) {
    SQLite::Statement query(_db, "SELECT Message.remoteUID FROM Message LEFT JOIN MessageBody USING (accountId, mailbox, remoteUID) "
                                 "WHERE Message.accountId = ? AND Message.mailbox = ? AND MessageBody.value IS NULL "
                                 "ORDER BY Message.receivedAt DESC, Message.remoteUID DESC LIMIT ?");
    query.bind(1, accountId);
    query.bind(2, mailbox);
    query.bind(3, limit);

    std::vector<uint32_t> uids{};
    while (query.executeStep()) {
        uids.push_back((uint32_t)query.getColumn(0).getInt64());
    }
    return uids;
}

std::shared_ptr<Message> MailStore::findMessage(std::string accountId, std::string mailbox, uint32_t uid) {
    SQLite::Statement query(_db, "SELECT Message.*, MessageBody.value AS body FROM Message LEFT JOIN MessageBody USING (accountId, mailbox, remoteUID) "
                                 "WHERE Message.accountId = ? AND Message.mailbox = ? AND Message.remoteUID = ? LIMIT 1");
    query.bind(1, accountId);
    query.bind(2, mailbox);
    query.bind(3, uid);
    if (query.executeStep()) {
        return std::make_shared<Message>(query);
    }
    return nullptr;
}

std::vector<std::shared_ptr<Message>> MailStore::findMessages(std::string accountId, std::string mailbox, int limit, int offset) {
    Query q = Query().equal("accountId", accountId).equal("mailbox", mailbox).orderBy("receivedAt DESC, remoteUID DESC").limit(limit > 0 ? limit : -1).offset(offset);
    return findAll<Message>(q);
}

int MailStore::messageCount(std::string accountId, std::string mailbox) {
    Query q = Query().equal("accountId", accountId);
    if (mailbox != "") {
        q.equal("mailbox", mailbox);
    }
    return count<Message>(q);
}

#pragma mark Checkpoints

std::shared_ptr<MailboxCheckpoint> MailStore::findCheckpoint(std::string accountId, std::string mailbox) {
    return find<MailboxCheckpoint>(Query().equal("accountId", accountId).equal("mailbox", mailbox));
}

void MailStore::saveCheckpoint(MailboxCheckpoint * checkpoint) {
    SQLite::Statement save(_db, "REPLACE INTO MailboxCheckpoint (accountId, mailbox, data, generationId, lastSyncTime) VALUES (:accountId, :mailbox, :data, :generationId, :lastSyncTime)");
    checkpoint->bindToQuery(&save);
    save.exec();
}

time_t MailStore::lastSyncTime(std::string accountId) {
    SQLite::Statement query(_db, "SELECT MAX(lastSyncTime) FROM MailboxCheckpoint WHERE accountId = ?");
    query.bind(1, accountId);
    if (query.executeStep() && !query.getColumn(0).isNull()) {
        return (time_t)query.getColumn(0).getInt64();
    }
    return 0;
}

bool MailStore::isFresh(std::string accountId, std::string mailbox, int maxAgeSeconds) {
    auto checkpoint = findCheckpoint(accountId, mailbox);
    if (checkpoint == nullptr) {
        return false;
    }
    return time(0) - checkpoint->lastSyncTime() < maxAgeSeconds;
}

#pragma mark Pending Mutations

int64_t MailStore::enqueueMutation(PendingMutation * mutation) {
    insert(mutation);
    mutation->setId(_db.getLastInsertRowid());
    return mutation->id();
}

std::vector<std::shared_ptr<PendingMutation>> MailStore::pendingMutations(std::string accountId) {
    Query q = Query().equal("accountId", accountId).orderBy("createdAt ASC, id ASC");
    return findAll<PendingMutation>(q);
}

void MailStore::removeMutation(int64_t id) {
    SQLite::Statement del(_db, "DELETE FROM PendingMutation WHERE id = ?");
    del.bind(1, id);
    del.exec();
}

int MailStore::pendingMutationCount(std::string accountId) {
    return count<PendingMutation>(Query().equal("accountId", accountId));
}

void MailStore::logMutation(PendingMutation * mutation, std::string status, std::string error) {
    SQLite::Statement log(_db, "INSERT INTO MutationLog (accountId, mailbox, remoteUID, kind, status, error, createdAt) VALUES (?, ?, ?, ?, ?, ?, ?)");
    log.bind(1, mutation->accountId());
    log.bind(2, mutation->mailbox());
    log.bind(3, mutation->remoteUID());
    log.bind(4, mutation->kind());
    log.bind(5, status);
    log.bind(6, error);
    log.bind(7, (int64_t)time(0));
    log.exec();
}

nlohmann::json MailStore::recentMutationLog(int limit) {
    SQLite::Statement query(_db, "SELECT accountId, mailbox, remoteUID, kind, status, error, createdAt FROM MutationLog ORDER BY id DESC LIMIT ?");
    query.bind(1, limit);

    nlohmann::json results = nlohmann::json::array();
    while (query.executeStep()) {
        results.push_back({
            {"account", query.getColumn(0).getString()},
            {"mailbox", query.getColumn(1).getString()},
            {"uid", (uint32_t)query.getColumn(2).getInt64()},
            {"kind", query.getColumn(3).getString()},
            {"status", query.getColumn(4).getString()},
            {"error", query.getColumn(5).getString()},
            {"created_at", query.getColumn(6).getInt64()},
        });
    }
    return results;
}
