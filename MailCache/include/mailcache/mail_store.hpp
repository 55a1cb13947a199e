/** MailStore [MailCache]
 *
 * SQLite-backed store for cached messages, checkpoints, lock records and
 * the mutation queue. It is the only copy of local state: every read goes
 * through it and nothing is cached in memory beside it.
 *
 * A MailStore wraps one connection and must stay on the thread that created it.
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef MailStore_hpp
#define MailStore_hpp

#include <stdint.h>
#include <stdio.h>
#include <string>
#include <map>
#include <memory>
#include <set>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"

#include "mailcache/models/message.hpp"
#include "mailcache/models/attachment.hpp"
#include "mailcache/models/mailbox_checkpoint.hpp"
#include "mailcache/models/pending_mutation.hpp"
#include "mailcache/query.hpp"
#include "mailcache/mail_utils.hpp"

struct UIDDiff {
    std::vector<uint32_t> missing; // remote, not cached
    std::vector<uint32_t> stale;   // cached, no longer remote
};

class MailStore {
    SQLite::Database _db;
    SQLite::Statement _stmtBeginTransaction;
    SQLite::Statement _stmtRollbackTransaction;
    SQLite::Statement _stmtCommitTransaction;

    std::map<std::string, std::shared_ptr<SQLite::Statement>> _insertQueries;
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _updateQueries;
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _removeQueries;

    std::string _keyWhereClause(MailModel * model);
    int _removeMessageUIDs(std::string accountId, std::string mailbox, std::vector<uint32_t> uids);

public:
    static std::string defaultPath();

    MailStore();
    explicit MailStore(std::string dbPath);

    void migrate();

    SQLite::Database & db();

    void resetForAccount(std::string accountId);

    void beginTransaction();

    void rollbackTransaction();

    void commitTransaction();

    // Generic persistence, driven by each model's columns and key

    void insert(MailModel * model);

    bool insertOrIgnore(MailModel * model);

    void update(MailModel * model);

    void remove(MailModel * model);

    // Messages

    /**
     Inserts the message and its attachment descriptors unless a row with the same
     (account, mailbox, uid) already exists. A body carried by the message is stored
     only when none is cached yet, so an existing body is never replaced or cleared.
     Returns true if the message row was created.
     */
    bool insertIfAbsent(Message * message);

    /**
     Compares the complete remote UID set against the cached UIDs using a single
     scan of the mailbox.
     */
    UIDDiff diffUIDs(std::string accountId, std::string mailbox, const std::vector<uint32_t> & remoteUIDs);

    std::set<uint32_t> cachedUIDs(std::string accountId, std::string mailbox);

    int purgeMailbox(std::string accountId, std::string mailbox);

    int removeMessages(std::string accountId, std::string mailbox, std::vector<uint32_t> uids);

    int removeMessagesOlderThan(std::string accountId, std::string mailbox, time_t horizon, const std::set<uint32_t> & keep);

    /**
     Stores the body of a cached message, replacing any previous one, and refreshes
     its snippet from `plainText` (or from the body when no plain text is given).
     Returns false if the message is no longer cached.
     */
    bool saveBody(std::string accountId, std::string mailbox, uint32_t uid, std::string body, std::string plainText = "");

    int updateUnread(std::string accountId, std::string mailbox, const std::map<uint32_t, bool> & unreadByUID);

    std::vector<uint32_t> uidsMissingBodies(std::string accountId, std::string mailbox, int limit);

    std::shared_ptr<Message> findMessage(std::string accountId, std::string mailbox, uint32_t uid);

    std::vector<std::shared_ptr<Message>> findMessages(std::string accountId, std::string mailbox, int limit, int offset);

    int messageCount(std::string accountId, std::string mailbox = "");

    // Checkpoints

    std::shared_ptr<MailboxCheckpoint> findCheckpoint(std::string accountId, std::string mailbox);

    void saveCheckpoint(MailboxCheckpoint * checkpoint);

    time_t lastSyncTime(std::string accountId);

    bool isFresh(std::string accountId, std::string mailbox, int maxAgeSeconds);

    // Pending mutations

    int64_t enqueueMutation(PendingMutation * mutation);

    std::vector<std::shared_ptr<PendingMutation>> pendingMutations(std::string accountId);

    void removeMutation(int64_t id);

    int pendingMutationCount(std::string accountId);

    void logMutation(PendingMutation * mutation, std::string status, std::string error);

    nlohmann::json recentMutationLog(int limit);

    // Find - Template methods which must be defined in header file

    template<typename ModelClass>
    std::shared_ptr<ModelClass> find(Query & query) {
        SQLite::Statement statement(this->_db, "SELECT * FROM " + ModelClass::TABLE_NAME + query.getSQL() + " LIMIT 1");
        query.bind(statement);
        if (statement.executeStep()) {
            return std::make_shared<ModelClass>(statement);
        }
        return nullptr;
    }

    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findAll(Query & query) {
        std::string sql = "SELECT * FROM " + ModelClass::TABLE_NAME + query.getSQL() + query.getSuffixSQL();
        SQLite::Statement statement(this->_db, sql);
        query.bind(statement);

        std::vector<std::shared_ptr<ModelClass>> results;
        while (statement.executeStep()) {
            results.push_back(std::make_shared<ModelClass>(statement));
        }

        return results;
    }

    template<typename ModelClass>
    int count(Query & query) {
        SQLite::Statement statement(this->_db, "SELECT COUNT(*) FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);
        statement.executeStep();
        return statement.getColumn(0).getInt();
    }

    template<typename ModelClass>
    int remove(Query & query) {
        SQLite::Statement statement(this->_db, "DELETE FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);
        return statement.exec();
    }
};


#endif /* MailStore_hpp */
